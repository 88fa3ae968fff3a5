#ifndef CTXBRIDGE_COMMAND_NAMES_HPP
#define CTXBRIDGE_COMMAND_NAMES_HPP

// Command and push names used on the wire.
// Shared by the client, the dispatcher and the multi-window coordinator so a name is spelled once.

namespace command_names {

// Browser-facing requests.
constexpr const char *REGISTER_ACTIVE_TARGET = "register_active_target";
constexpr const char *SEARCH_WORKSPACE = "search_workspace";
constexpr const char *GET_FILE_TREE = "get_file_tree";
constexpr const char *GET_FILE_CONTENT = "get_file_content";
constexpr const char *GET_FOLDER_CONTENT = "get_folder_content";
constexpr const char *GET_ENTIRE_CODEBASE = "get_entire_codebase";
constexpr const char *GET_ACTIVE_FILE_INFO = "get_active_file_info";
constexpr const char *GET_OPEN_FILES = "get_open_files";
constexpr const char *GET_CONTENTS_FOR_FILES = "get_contents_for_files";
constexpr const char *GET_WORKSPACE_DETAILS = "get_workspace_details";
constexpr const char *LIST_FOLDER_CONTENTS = "list_folder_contents";
constexpr const char *GET_FILTER_INFO = "get_filter_info";
constexpr const char *GET_WORKSPACE_PROBLEMS = "get_workspace_problems";

// Peer requests (Secondary to Primary).
constexpr const char *REGISTER_SECONDARY = "register_secondary";
constexpr const char *UNREGISTER_SECONDARY = "unregister_secondary";

// Pushes.
constexpr const char *FORWARD_REQUEST = "forward_request";
constexpr const char *FORWARD_RESPONSE_TO_PRIMARY = "forward_response_to_primary";
constexpr const char *FORWARD_PUSH_TO_PRIMARY = "forward_push_to_primary";
constexpr const char *PUSH_SNIPPET = "push_snippet";

// Responses.
constexpr const char *ERROR_RESPONSE = "error_response";
constexpr const char *RESPONSE_GENERIC_ACK = "response_generic_ack";
constexpr const char *RESPONSE_UNREGISTER_SECONDARY_ACK = "response_unregister_secondary_ack";

} // namespace command_names

#endif // CTXBRIDGE_COMMAND_NAMES_HPP
