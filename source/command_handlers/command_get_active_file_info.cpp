#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"

#include <filesystem>

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_active_file_info".
// The active file is the first file opened in this window.

static json handle_get_active_file_info(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                        ClientContext &context) {
    (void)payload;
    if (workspace.open_files().empty()) {
        throw CommandError(local_workspace::NO_ACTIVE_FILE, "No file is active in this window.");
    }

    const std::string &active_path = workspace.open_files().front();
    std::optional<local_workspace::WorkspaceFolder> folder = workspace.folder_containing(active_path);

    json data;
    data["activeFilePath"] = active_path;
    data["activeFileLabel"] = std::filesystem::path(active_path).filename().string();
    data["workspaceFolderUri"] = folder ? json(folder->uri) : json(nullptr);
    data["workspaceFolderName"] = folder ? json(folder->name) : json(nullptr);
    data["windowId"] = context.local_window_id;
    return handler_support::success_payload(data);
}

namespace command_get_active_file_info {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_ACTIVE_FILE_INFO,
        "Path and workspace folder of the active file.",
        command_registry::Precondition::TrustedWorkspace,
        false,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_active_file_info(workspace, payload, context);
        }
    });
}

} // namespace command_get_active_file_info
