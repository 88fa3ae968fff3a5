#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_filter_info".
// Describes which entries traversal skips in a folder. Without workspaceFolderUri the first
// folder is used. Ignore files are not read, so the filter is always "default".

static json handle_get_filter_info(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                   ClientContext &context) {
    std::optional<local_workspace::WorkspaceFolder> folder = handler_support::resolve_folder(workspace, payload);
    if (!folder) {
        if (workspace.folders().empty()) {
            throw CommandError(wire_protocol::NO_WORKSPACE_OPEN, "No workspace folder is open.");
        }
        folder = workspace.folders().front();
    }

    const local_workspace::Limits &limits = workspace.limits();
    json rules;
    rules["skipsHiddenEntries"] = true;
    rules["maxDepth"] = limits.max_depth;
    rules["maxFiles"] = limits.max_files;
    rules["maxFileBytes"] = limits.max_file_bytes;

    json data;
    data["filterType"] = "default";
    data["workspaceFolderUri"] = folder->uri;
    data["rules"] = rules;
    data["windowId"] = context.local_window_id;
    return handler_support::success_payload(data);
}

namespace command_get_filter_info {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_FILTER_INFO,
        "Filtering rules applied when reading a workspace folder.",
        command_registry::Precondition::TrustedWorkspace,
        false,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_filter_info(workspace, payload, context);
        }
    });
}

} // namespace command_get_filter_info
