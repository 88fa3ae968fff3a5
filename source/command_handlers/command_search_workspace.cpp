#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;

// Command handler for "search_workspace".
// Case-insensitive substring search on file and folder names, optionally limited to one folder.

static json handle_search_workspace(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                    ClientContext &context) {
    std::string query = handler_support::require_string(payload, "query");
    std::optional<local_workspace::WorkspaceFolder> scope = handler_support::resolve_folder(workspace, payload);

    json results = json::array();
    for (const auto &match : workspace.search(query, scope)) {
        json entry;
        entry["path"] = match.path;
        entry["name"] = match.name;
        entry["type"] = match.type;
        entry["uri"] = match.uri;
        entry["content_source_id"] = match.uri;
        entry["workspaceFolderUri"] = match.workspace_folder_uri;
        entry["workspaceFolderName"] = match.workspace_folder_name;
        entry["relativePath"] = match.relative_path;
        entry["filterTypeApplied"] = "default";
        entry["windowId"] = context.local_window_id;
        results.push_back(entry);
    }
    debug_log::log("search_workspace '" + query + "': " + std::to_string(results.size()) + " result(s).");

    json data;
    data["results"] = results;
    data["windowId"] = context.local_window_id;
    json result = handler_support::success_payload(data);
    result["query"] = query;
    return result;
}

namespace command_search_workspace {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::SEARCH_WORKSPACE,
        "Search file and folder names in every open workspace folder.",
        command_registry::Precondition::TrustedWorkspace,
        true,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_search_workspace(workspace, payload, context);
        }
    });
}

} // namespace command_search_workspace
