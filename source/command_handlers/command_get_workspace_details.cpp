#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;

// Command handler for "get_workspace_details".

static json handle_get_workspace_details(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                         ClientContext &context) {
    (void)payload;
    json folders = json::array();
    for (const auto &folder : workspace.folders()) {
        json entry;
        entry["uri"] = folder.uri;
        entry["name"] = folder.name;
        entry["isTrusted"] = workspace.is_trusted();
        entry["windowId"] = context.local_window_id;
        folders.push_back(entry);
    }

    json data;
    data["isTrusted"] = workspace.is_trusted();
    data["workspaceName"] = workspace.workspace_name();
    data["workspaceFolders"] = folders;
    data["windowId"] = context.local_window_id;
    return handler_support::success_payload(data);
}

namespace command_get_workspace_details {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_WORKSPACE_DETAILS,
        "Workspace name, trust and folders.",
        command_registry::Precondition::TrustedWorkspace,
        true,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_workspace_details(workspace, payload, context);
        }
    });
}

} // namespace command_get_workspace_details
