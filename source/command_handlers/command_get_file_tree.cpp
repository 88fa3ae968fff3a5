#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_file_tree".
// Renders the folder's tree as text. Without workspaceFolderUri the first folder is used.

static json handle_get_file_tree(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                 ClientContext &context) {
    std::optional<local_workspace::WorkspaceFolder> folder = handler_support::resolve_folder(workspace, payload);
    if (!folder) {
        if (workspace.folders().empty()) {
            throw CommandError(wire_protocol::NO_WORKSPACE_OPEN, "No workspace folder is open.");
        }
        folder = workspace.folders().front();
    }

    json data;
    data["fileTreeString"] = workspace.file_tree(*folder);
    data["metadata"] = handler_support::build_metadata(folder->uri, "FileTree", folder->name, folder,
                                                       context.local_window_id);
    data["windowId"] = context.local_window_id;
    return handler_support::success_payload(data);
}

namespace command_get_file_tree {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_FILE_TREE,
        "Text rendering of a workspace folder's file tree.",
        command_registry::Precondition::TrustedWorkspace,
        false,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_file_tree(workspace, payload, context);
        }
    });
}

} // namespace command_get_file_tree
