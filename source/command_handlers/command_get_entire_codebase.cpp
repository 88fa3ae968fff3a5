#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_entire_codebase".
// Collects the given folder, or every folder of this window when workspaceFolderUri is absent.

static json handle_get_entire_codebase(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                       ClientContext &context) {
    std::optional<local_workspace::WorkspaceFolder> scope = handler_support::resolve_folder(workspace, payload);
    std::vector<local_workspace::WorkspaceFolder> folders;
    if (scope) {
        folders.push_back(*scope);
    } else {
        folders = workspace.folders();
    }

    json files_data = json::array();
    for (const auto &folder : folders) {
        local_workspace::FileCollectionResult collection = workspace.collect_files(folder.path);
        if (!collection.success) {
            if (scope) {
                throw CommandError(collection.error_code, collection.error_detail);
            }
            debug_log::log_message("Warning: Skipped folder " + folder.path + ": " + collection.error_detail);
            continue;
        }
        for (const auto &file_data : collection.files) {
            files_data.push_back(handler_support::file_data_to_json(file_data, context.local_window_id));
        }
    }

    std::optional<local_workspace::WorkspaceFolder> metadata_folder = scope;
    if (!metadata_folder && folders.size() == 1) {
        metadata_folder = folders.front();
    }
    std::string source_id = metadata_folder ? metadata_folder->uri : "entire_codebase";
    std::string label = metadata_folder ? metadata_folder->name : workspace.workspace_name();

    json data;
    data["filesData"] = files_data;
    data["metadata"] = handler_support::build_metadata(source_id, "codebase_content", label, metadata_folder,
                                                       context.local_window_id);
    data["filterTypeApplied"] = "default";
    return handler_support::success_payload(data);
}

namespace command_get_entire_codebase {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_ENTIRE_CODEBASE,
        "Read every text file in the workspace.",
        command_registry::Precondition::TrustedWorkspace,
        true,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_entire_codebase(workspace, payload, context);
        }
    });
}

} // namespace command_get_entire_codebase
