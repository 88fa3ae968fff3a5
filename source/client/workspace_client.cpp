#include "client/workspace_client.hpp"
#include "protocol/command_names.hpp"

namespace workspace_client {

using json = nlohmann::json;

// Empty strings travel as null ("not specified").
static json optional_string(const std::string &value) {
    if (value.empty()) {
        return nullptr;
    }
    return value;
}

WorkspaceClient::WorkspaceClient(request_router::RequestRouter &router) : router_(router) {}

std::future<RequestResult> WorkspaceClient::register_active_target(int tab_id, const std::string &llm_host) {
    json payload;
    payload["tabId"] = tab_id;
    payload["llmHost"] = llm_host;
    return router_.send(command_names::REGISTER_ACTIVE_TARGET, payload);
}

std::future<RequestResult> WorkspaceClient::search_workspace(const std::string &query,
                                                             const std::string &workspace_folder_uri) {
    json payload;
    payload["query"] = query;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::SEARCH_WORKSPACE, payload);
}

std::future<RequestResult> WorkspaceClient::get_file_tree(const std::string &workspace_folder_uri) {
    json payload;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::GET_FILE_TREE, payload);
}

std::future<RequestResult> WorkspaceClient::get_file_content(const std::string &file_path) {
    json payload;
    payload["filePath"] = file_path;
    return router_.send(command_names::GET_FILE_CONTENT, payload);
}

std::future<RequestResult> WorkspaceClient::get_folder_content(const std::string &folder_path,
                                                               const std::string &workspace_folder_uri) {
    json payload;
    payload["folderPath"] = folder_path;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::GET_FOLDER_CONTENT, payload);
}

std::future<RequestResult> WorkspaceClient::get_entire_codebase(const std::string &workspace_folder_uri) {
    json payload;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::GET_ENTIRE_CODEBASE, payload);
}

std::future<RequestResult> WorkspaceClient::get_active_file_info() {
    return router_.send(command_names::GET_ACTIVE_FILE_INFO, json::object());
}

std::future<RequestResult> WorkspaceClient::get_open_files() {
    return router_.send(command_names::GET_OPEN_FILES, json::object());
}

std::future<RequestResult> WorkspaceClient::get_contents_for_files(const std::vector<std::string> &file_uris) {
    json payload;
    payload["fileUris"] = file_uris;
    return router_.send(command_names::GET_CONTENTS_FOR_FILES, payload);
}

std::future<RequestResult> WorkspaceClient::get_workspace_details() {
    return router_.send(command_names::GET_WORKSPACE_DETAILS, json::object());
}

std::future<RequestResult> WorkspaceClient::list_folder_contents(const std::string &folder_uri,
                                                                 const std::string &workspace_folder_uri) {
    json payload;
    payload["folderUri"] = folder_uri;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::LIST_FOLDER_CONTENTS, payload);
}

std::future<RequestResult> WorkspaceClient::get_workspace_problems(const std::string &workspace_folder_uri) {
    json payload;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::GET_WORKSPACE_PROBLEMS, payload);
}

std::future<RequestResult> WorkspaceClient::get_filter_info(const std::string &workspace_folder_uri) {
    json payload;
    payload["workspaceFolderUri"] = optional_string(workspace_folder_uri);
    return router_.send(command_names::GET_FILTER_INFO, payload);
}

} // namespace workspace_client
