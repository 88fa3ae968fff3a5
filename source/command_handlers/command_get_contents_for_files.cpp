#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"

#include <filesystem>

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_contents_for_files".
// Reads each uri independently; a file this window cannot read becomes an entry in errors.

static json handle_get_contents_for_files(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                          ClientContext &context) {
    if (!payload.is_object() || !payload.contains("fileUris") || !payload["fileUris"].is_array()) {
        throw CommandError(wire_protocol::INVALID_PAYLOAD, "Missing required parameter 'fileUris' (array of strings).");
    }

    json data = json::array();
    json errors = json::array();
    for (const auto &uri_value : payload["fileUris"]) {
        if (!uri_value.is_string()) {
            throw CommandError(wire_protocol::INVALID_PAYLOAD, "Every entry of 'fileUris' must be a string.");
        }
        const std::string file_uri = uri_value.get<std::string>();
        local_workspace::FileReadResult read_result = workspace.read_file(file_uri);
        if (!read_result.success) {
            json error_entry;
            error_entry["uri"] = file_uri;
            error_entry["error"] = read_result.error_detail;
            error_entry["errorCode"] = read_result.error_code;
            error_entry["windowId"] = context.local_window_id;
            errors.push_back(error_entry);
            continue;
        }

        const std::string &full_path = read_result.file_data.full_path;
        json entry = handler_support::file_data_to_json(read_result.file_data, context.local_window_id);
        entry["metadata"] = handler_support::build_metadata(
            local_workspace::path_to_uri(full_path), "file_content",
            std::filesystem::path(full_path).filename().string(), workspace.folder_containing(full_path),
            context.local_window_id);
        data.push_back(entry);
    }

    json result;
    result["success"] = true;
    result["data"] = data;
    result["errors"] = errors;
    return result;
}

namespace command_get_contents_for_files {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_CONTENTS_FOR_FILES,
        "Read several files by uri.",
        command_registry::Precondition::TrustedWorkspace,
        true,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_contents_for_files(workspace, payload, context);
        }
    });
}

} // namespace command_get_contents_for_files
