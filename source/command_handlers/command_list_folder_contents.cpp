#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "list_folder_contents".
// One level of entries (folders first), hidden entries skipped.

static json handle_list_folder_contents(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                        ClientContext &context) {
    std::string folder_uri = handler_support::require_string(payload, "folderUri");
    // Rejects an unknown workspaceFolderUri even though the listing is addressed by folderUri.
    handler_support::resolve_folder(workspace, payload);

    local_workspace::ListingResult listing = workspace.list_directory(folder_uri);
    if (!listing.success) {
        throw CommandError(listing.error_code, listing.error_detail);
    }

    json entries = json::array();
    for (const auto &directory_entry : listing.entries) {
        json entry;
        entry["name"] = directory_entry.name;
        entry["type"] = directory_entry.type;
        entry["uri"] = directory_entry.uri;
        entry["content_source_id"] = directory_entry.uri;
        entry["windowId"] = context.local_window_id;
        entries.push_back(entry);
    }

    json data;
    data["entries"] = entries;
    data["parentFolderUri"] = listing.parent_folder_uri;
    return handler_support::success_payload(data);
}

namespace command_list_folder_contents {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::LIST_FOLDER_CONTENTS,
        "Entries of one folder.",
        command_registry::Precondition::TrustedWorkspace,
        false,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_list_folder_contents(workspace, payload, context);
        }
    });
}

} // namespace command_list_folder_contents
