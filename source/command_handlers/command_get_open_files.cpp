#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"

#include <filesystem>

using json = nlohmann::json;
using command_registry::ClientContext;

// Command handler for "get_open_files".

static json handle_get_open_files(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                  ClientContext &context) {
    (void)payload;
    json open_files = json::array();
    for (const auto &open_path : workspace.open_files()) {
        std::optional<local_workspace::WorkspaceFolder> folder = workspace.folder_containing(open_path);
        json entry;
        entry["path"] = open_path;
        entry["name"] = std::filesystem::path(open_path).filename().string();
        entry["workspaceFolderUri"] = folder ? json(folder->uri) : json(nullptr);
        entry["workspaceFolderName"] = folder ? json(folder->name) : json(nullptr);
        entry["windowId"] = context.local_window_id;
        open_files.push_back(entry);
    }

    json data;
    data["openFiles"] = open_files;
    return handler_support::success_payload(data);
}

namespace command_get_open_files {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_OPEN_FILES,
        "Files open in the editor.",
        command_registry::Precondition::TrustedWorkspace,
        true,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_open_files(workspace, payload, context);
        }
    });
}

} // namespace command_get_open_files
