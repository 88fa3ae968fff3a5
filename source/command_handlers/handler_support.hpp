#ifndef CTXBRIDGE_HANDLER_SUPPORT_HPP
#define CTXBRIDGE_HANDLER_SUPPORT_HPP

// Helpers shared by the command handlers: payload field extraction and JSON builders for
// workspace items. Every builder tags its item with the executing window's id.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "server/command_registry.hpp"
#include "workspace/local_workspace.hpp"

namespace handler_support {

using json = nlohmann::json;

// Required string field; throws CommandError(INVALID_PAYLOAD) when missing, empty or not a string.
std::string require_string(const json &payload, const std::string &key);

// Optional string field; null, missing and empty all count as absent.
std::optional<std::string> optional_string(const json &payload, const std::string &key);

// Resolve workspaceFolderUri. Absent means "no specific folder" (nullopt); an unknown uri throws
// CommandError(WORKSPACE_FOLDER_NOT_FOUND).
std::optional<local_workspace::WorkspaceFolder> resolve_folder(const local_workspace::LocalWorkspace &workspace,
                                                               const json &payload);

// Context block metadata: unique_block_id, content_source_id, type, label, workspaceFolderUri,
// workspaceFolderName, windowId.
json build_metadata(const std::string &content_source_id, const std::string &type, const std::string &label,
                    const std::optional<local_workspace::WorkspaceFolder> &folder, const std::string &window_id);

json file_data_to_json(const local_workspace::FileData &file_data, const std::string &window_id);

// {success:true, data}.
json success_payload(const json &data);

} // namespace handler_support

#endif // CTXBRIDGE_HANDLER_SUPPORT_HPP
