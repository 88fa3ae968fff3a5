#ifndef CTXBRIDGE_WORKSPACE_CLIENT_HPP
#define CTXBRIDGE_WORKSPACE_CLIENT_HPP

// Typed call surface over the request router, one method per served command.
// Each method builds the command's payload and returns the router's future.

#include <future>
#include <string>
#include <vector>

#include "client/request_router.hpp"

namespace workspace_client {

using request_router::RequestResult;

class WorkspaceClient {
public:
    explicit WorkspaceClient(request_router::RequestRouter &router);

    // Mark this connection as the tab that receives snippet pushes.
    std::future<RequestResult> register_active_target(int tab_id, const std::string &llm_host);

    // An empty workspace_folder_uri means every folder.
    std::future<RequestResult> search_workspace(const std::string &query, const std::string &workspace_folder_uri = "");
    std::future<RequestResult> get_file_tree(const std::string &workspace_folder_uri = "");
    std::future<RequestResult> get_file_content(const std::string &file_path);
    std::future<RequestResult> get_folder_content(const std::string &folder_path,
                                                  const std::string &workspace_folder_uri = "");
    std::future<RequestResult> get_entire_codebase(const std::string &workspace_folder_uri = "");
    std::future<RequestResult> get_active_file_info();
    std::future<RequestResult> get_open_files();
    std::future<RequestResult> get_contents_for_files(const std::vector<std::string> &file_uris);
    std::future<RequestResult> get_workspace_details();
    std::future<RequestResult> list_folder_contents(const std::string &folder_uri,
                                                    const std::string &workspace_folder_uri = "");
    std::future<RequestResult> get_workspace_problems(const std::string &workspace_folder_uri = "");
    std::future<RequestResult> get_filter_info(const std::string &workspace_folder_uri = "");

private:
    request_router::RequestRouter &router_;
};

} // namespace workspace_client

#endif // CTXBRIDGE_WORKSPACE_CLIENT_HPP
