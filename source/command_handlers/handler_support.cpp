#include "command_handlers/handler_support.hpp"
#include "protocol/wire_protocol.hpp"

namespace handler_support {

using command_registry::CommandError;

std::string require_string(const json &payload, const std::string &key) {
    if (!payload.is_object() || !payload.contains(key) || !payload[key].is_string() ||
        payload[key].get<std::string>().empty()) {
        throw CommandError(wire_protocol::INVALID_PAYLOAD, "Missing required parameter '" + key + "' (string).");
    }
    return payload[key].get<std::string>();
}

std::optional<std::string> optional_string(const json &payload, const std::string &key) {
    if (!payload.is_object() || !payload.contains(key) || !payload[key].is_string()) {
        return std::nullopt;
    }
    std::string value = payload[key].get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<local_workspace::WorkspaceFolder> resolve_folder(const local_workspace::LocalWorkspace &workspace,
                                                               const json &payload) {
    std::optional<std::string> folder_uri = optional_string(payload, "workspaceFolderUri");
    if (!folder_uri) {
        return std::nullopt;
    }
    std::optional<local_workspace::WorkspaceFolder> folder = workspace.find_folder_by_uri(*folder_uri);
    if (!folder) {
        throw CommandError(local_workspace::WORKSPACE_FOLDER_NOT_FOUND,
                           "Workspace folder not found in this window: " + *folder_uri);
    }
    return folder;
}

json build_metadata(const std::string &content_source_id, const std::string &type, const std::string &label,
                    const std::optional<local_workspace::WorkspaceFolder> &folder, const std::string &window_id) {
    json metadata;
    metadata["unique_block_id"] = wire_protocol::generate_message_id();
    metadata["content_source_id"] = content_source_id;
    metadata["type"] = type;
    metadata["label"] = label;
    metadata["workspaceFolderUri"] = folder ? json(folder->uri) : json(nullptr);
    metadata["workspaceFolderName"] = folder ? json(folder->name) : json(nullptr);
    metadata["windowId"] = window_id;
    return metadata;
}

json file_data_to_json(const local_workspace::FileData &file_data, const std::string &window_id) {
    json file_json;
    file_json["fullPath"] = file_data.full_path;
    file_json["content"] = file_data.content;
    file_json["languageId"] = file_data.language_id;
    file_json["windowId"] = window_id;
    return file_json;
}

json success_payload(const json &data) {
    json payload;
    payload["success"] = true;
    payload["data"] = data;
    return payload;
}

} // namespace handler_support
