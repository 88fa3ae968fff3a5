#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"

#include <filesystem>

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_folder_content".
// Every readable text file below folderPath, binary and oversized files skipped.

static json handle_get_folder_content(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                      ClientContext &context) {
    std::string folder_path = local_workspace::uri_to_path(handler_support::require_string(payload, "folderPath"));
    std::optional<local_workspace::WorkspaceFolder> folder = handler_support::resolve_folder(workspace, payload);

    local_workspace::FileCollectionResult collection = workspace.collect_files(folder_path);
    if (!collection.success) {
        throw CommandError(collection.error_code, collection.error_detail);
    }
    if (!folder) {
        folder = workspace.folder_containing(folder_path);
    }

    json files_data = json::array();
    for (const auto &file_data : collection.files) {
        files_data.push_back(handler_support::file_data_to_json(file_data, context.local_window_id));
    }

    std::string label = std::filesystem::path(folder_path).filename().string();
    json data;
    data["filesData"] = files_data;
    data["metadata"] = handler_support::build_metadata(local_workspace::path_to_uri(folder_path), "folder_content",
                                                       label, folder, context.local_window_id);
    data["filterTypeApplied"] = "default";
    return handler_support::success_payload(data);
}

namespace command_get_folder_content {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_FOLDER_CONTENT,
        "Read every text file below a folder.",
        command_registry::Precondition::TrustedWorkspace,
        false,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_folder_content(workspace, payload, context);
        }
    });
}

} // namespace command_get_folder_content
