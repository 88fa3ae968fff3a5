// Tests for the served command set against a real directory tree.

#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "command_handlers/command_handlers.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"
#include "server/client_registry.hpp"
#include "server/command_dispatcher.hpp"
#include "server/command_registry.hpp"
#include "test_support.hpp"
#include "workspace/diagnostics_store.hpp"
#include "workspace/local_workspace.hpp"

using json = nlohmann::json;
using test_support::report;
using test_support::TemporaryDirectory;

namespace test_command_handlers {

// A workspace folder "project" with a source tree, a hidden directory and a binary file,
// plus one open file that lives outside the folder.
struct WorkspaceFixture {
    TemporaryDirectory directory;
    std::string project_path;
    std::string main_path;
    std::string outside_open_path;
    std::unique_ptr<local_workspace::LocalWorkspace> workspace;
    diagnostics_store::DiagnosticsStore diagnostics;
    command_registry::CommandRegistry registry;
    std::unique_ptr<command_dispatcher::CommandDispatcher> dispatcher;

    explicit WorkspaceFixture(bool trusted = true, bool with_open_files = true) {
        project_path = directory.make_directory("project");
        main_path = directory.write_file("project/src/main.cpp", "int main() { return 0; }\n");
        directory.write_file("project/src/util.hpp", "#pragma once\n");
        directory.write_file("project/README.md", "# Project\n");
        directory.write_file("project/.git/config", "[core]\n");
        directory.write_file("project/data.bin", std::string("BIN\0DATA", 8));
        outside_open_path = directory.write_file("scratch/notes.txt", "remember\n");
        directory.write_file("scratch/private.txt", "secret\n");

        std::vector<std::string> open_files;
        if (with_open_files) {
            open_files = {main_path, outside_open_path};
        }
        workspace = std::make_unique<local_workspace::LocalWorkspace>(std::vector<std::string>{project_path},
                                                                      open_files, trusted);
        command_handlers::register_all_commands(registry, *workspace, diagnostics);
        dispatcher = std::make_unique<command_dispatcher::CommandDispatcher>(registry, *workspace);
    }

    command_dispatcher::ExecutionResult run(const std::string &command, const json &payload,
                                            client_registry::ClientRegistry *clients = nullptr,
                                            message_sink::ConnectionId connection_id = 0) {
        command_registry::ClientContext context;
        context.connection_id = connection_id;
        context.is_authenticated = true;
        context.local_window_id = "window-a";
        context.clients = clients;
        return dispatcher->execute(command, payload, context);
    }

    std::string project_uri() const { return local_workspace::path_to_uri(project_path); }
};

// Test: every served command is registered with the expected workspace-wide flag.
static bool test_registered_command_set() {
    WorkspaceFixture fixture;
    std::vector<std::string> names = fixture.registry.command_names();
    bool success = names.size() == 13 && fixture.registry.is_workspace_wide(command_names::SEARCH_WORKSPACE) &&
                   fixture.registry.is_workspace_wide(command_names::GET_ENTIRE_CODEBASE) &&
                   fixture.registry.is_workspace_wide(command_names::GET_OPEN_FILES) &&
                   fixture.registry.is_workspace_wide(command_names::GET_CONTENTS_FOR_FILES) &&
                   fixture.registry.is_workspace_wide(command_names::GET_WORKSPACE_DETAILS) &&
                   fixture.registry.is_workspace_wide(command_names::GET_WORKSPACE_PROBLEMS) &&
                   !fixture.registry.is_workspace_wide(command_names::GET_FILTER_INFO) &&
                   !fixture.registry.is_workspace_wide(command_names::GET_FILE_CONTENT) &&
                   !fixture.registry.is_workspace_wide(command_names::REGISTER_ACTIVE_TARGET);
    return report(success, "Thirteen commands registered; aggregated ones flagged",
                  "registered: " + std::to_string(names.size()));
}

// Test: search matches names case-insensitively and skips hidden entries.
static bool test_search_workspace() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result =
        fixture.run(command_names::SEARCH_WORKSPACE, json{{"query", "MAIN"}});
    command_dispatcher::ExecutionResult hidden = fixture.run(command_names::SEARCH_WORKSPACE, json{{"query", "config"}});

    const json &results = result.payload["data"]["results"];
    bool success = result.success && result.payload["query"] == "MAIN" && results.size() == 1 &&
                   results[0]["name"] == "main.cpp" && results[0]["type"] == "file" &&
                   results[0]["relativePath"] == "src/main.cpp" &&
                   results[0]["uri"] == local_workspace::path_to_uri(fixture.main_path) &&
                   results[0]["workspaceFolderName"] == "project" && results[0]["windowId"] == "window-a" &&
                   hidden.success && hidden.payload["data"]["results"].empty();
    return report(success, "Case-insensitive name search; hidden entries skipped", result.payload.dump());
}

// Test: bad search payloads are rejected with typed codes.
static bool test_search_payload_errors() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult missing_query = fixture.run(command_names::SEARCH_WORKSPACE, json::object());
    command_dispatcher::ExecutionResult unknown_folder =
        fixture.run(command_names::SEARCH_WORKSPACE, json{{"query", "a"}, {"workspaceFolderUri", "file:///nowhere"}});
    bool success = missing_query.error_code == wire_protocol::INVALID_PAYLOAD &&
                   unknown_folder.error_code == local_workspace::WORKSPACE_FOLDER_NOT_FOUND;
    return report(success, "Missing query is INVALID_PAYLOAD; unknown folder is WORKSPACE_FOLDER_NOT_FOUND");
}

// Test: the file tree lists folders first with box-drawing connectors.
static bool test_file_tree() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result = fixture.run(command_names::GET_FILE_TREE, json::object());
    std::string expected = "project/\n"
                           "├── src/\n"
                           "│   ├── main.cpp\n"
                           "│   └── util.hpp\n"
                           "├── README.md\n"
                           "└── data.bin\n";
    bool success = result.success && result.payload["data"]["fileTreeString"] == expected &&
                   result.payload["data"]["metadata"]["type"] == "FileTree" &&
                   result.payload["data"]["metadata"]["content_source_id"] == fixture.project_uri();
    return report(success, "File tree rendered folders-first without hidden entries", result.payload.dump());
}

// Test: file content succeeds inside the workspace and fails with the right code otherwise.
static bool test_file_content() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult found =
        fixture.run(command_names::GET_FILE_CONTENT, json{{"filePath", fixture.main_path}});
    command_dispatcher::ExecutionResult missing = fixture.run(
        command_names::GET_FILE_CONTENT, json{{"filePath", fixture.project_path + "/src/missing.cpp"}});
    command_dispatcher::ExecutionResult outside = fixture.run(
        command_names::GET_FILE_CONTENT, json{{"filePath", fixture.directory.path() + "/scratch/private.txt"}});
    command_dispatcher::ExecutionResult binary =
        fixture.run(command_names::GET_FILE_CONTENT, json{{"filePath", fixture.project_path + "/data.bin"}});
    command_dispatcher::ExecutionResult open_outside =
        fixture.run(command_names::GET_FILE_CONTENT, json{{"filePath", fixture.outside_open_path}});

    const json &file_data = found.payload["data"]["fileData"];
    bool success = found.success && file_data["content"] == "int main() { return 0; }\n" &&
                   file_data["languageId"] == "cpp" && file_data["windowId"] == "window-a" &&
                   found.payload["data"]["metadata"]["label"] == "main.cpp" &&
                   missing.error_code == local_workspace::FILE_NOT_FOUND &&
                   outside.error_code == local_workspace::PATH_OUTSIDE_WORKSPACE &&
                   binary.error_code == local_workspace::BINARY_FILE && open_outside.success;
    return report(success, "Read inside workspace; missing, outside and binary files rejected",
                  found.payload.dump());
}

// Test: folder content returns every readable text file below the folder.
static bool test_folder_content() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result =
        fixture.run(command_names::GET_FOLDER_CONTENT, json{{"folderPath", fixture.project_path + "/src"}});
    command_dispatcher::ExecutionResult missing =
        fixture.run(command_names::GET_FOLDER_CONTENT, json{{"folderPath", fixture.project_path + "/nope"}});

    const json &files = result.payload["data"]["filesData"];
    bool success = result.success && files.size() == 2 && result.payload["data"]["metadata"]["label"] == "src" &&
                   result.payload["data"]["metadata"]["workspaceFolderName"] == "project" &&
                   missing.error_code == local_workspace::FOLDER_NOT_FOUND;
    return report(success, "Folder content collects src files; missing folder is FOLDER_NOT_FOUND");
}

// Test: the entire codebase skips hidden and binary files.
static bool test_entire_codebase() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result = fixture.run(command_names::GET_ENTIRE_CODEBASE, json::object());

    bool saw_hidden = false;
    bool saw_binary = false;
    for (const auto &file : result.payload["data"]["filesData"]) {
        std::string full_path = file["fullPath"].get<std::string>();
        saw_hidden = saw_hidden || full_path.find("/.git/") != std::string::npos;
        saw_binary = saw_binary || full_path.find("data.bin") != std::string::npos;
    }
    bool success = result.success && result.payload["data"]["filesData"].size() == 3 && !saw_hidden && !saw_binary &&
                   result.payload["data"]["metadata"]["content_source_id"] == fixture.project_uri();
    return report(success, "Codebase holds the three text files", result.payload.dump());
}

// Test: active file info reports the first open file, or NO_ACTIVE_FILE.
static bool test_active_file_info() {
    WorkspaceFixture fixture;
    WorkspaceFixture without_open_files(true, false);
    command_dispatcher::ExecutionResult active = fixture.run(command_names::GET_ACTIVE_FILE_INFO, json::object());
    command_dispatcher::ExecutionResult none =
        without_open_files.run(command_names::GET_ACTIVE_FILE_INFO, json::object());

    bool success = active.success && active.payload["data"]["activeFilePath"] == fixture.main_path &&
                   active.payload["data"]["activeFileLabel"] == "main.cpp" &&
                   active.payload["data"]["workspaceFolderUri"] == fixture.project_uri() &&
                   none.error_code == local_workspace::NO_ACTIVE_FILE;
    return report(success, "Active file is the first open file; none open is NO_ACTIVE_FILE");
}

// Test: open files include those outside the workspace, with a null folder.
static bool test_open_files() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result = fixture.run(command_names::GET_OPEN_FILES, json::object());
    const json &open_files = result.payload["data"]["openFiles"];
    bool success = result.success && open_files.size() == 2 && open_files[0]["name"] == "main.cpp" &&
                   open_files[0]["workspaceFolderName"] == "project" && open_files[1]["name"] == "notes.txt" &&
                   open_files[1]["workspaceFolderUri"].is_null() && open_files[1]["windowId"] == "window-a";
    return report(success, "Open files listed with their workspace folder or null", result.payload.dump());
}

// Test: contents for files splits readable files from per-file errors.
static bool test_contents_for_files() {
    WorkspaceFixture fixture;
    json payload;
    payload["fileUris"] = json::array({local_workspace::path_to_uri(fixture.main_path),
                                       local_workspace::path_to_uri(fixture.project_path + "/gone.txt"),
                                       local_workspace::path_to_uri(fixture.directory.path() + "/scratch/private.txt")});
    command_dispatcher::ExecutionResult result = fixture.run(command_names::GET_CONTENTS_FOR_FILES, payload);
    command_dispatcher::ExecutionResult malformed =
        fixture.run(command_names::GET_CONTENTS_FOR_FILES, json{{"fileUris", "not-an-array"}});

    const json &errors = result.payload["errors"];
    bool success = result.success && result.payload["data"].size() == 1 &&
                   result.payload["data"][0]["fullPath"] == fixture.main_path &&
                   result.payload["data"][0]["metadata"]["type"] == "file_content" && errors.size() == 2 &&
                   errors[0]["errorCode"] == local_workspace::FILE_NOT_FOUND &&
                   errors[1]["errorCode"] == local_workspace::PATH_OUTSIDE_WORKSPACE &&
                   malformed.error_code == wire_protocol::INVALID_PAYLOAD;
    return report(success, "Readable file in data; missing and outside files in errors", result.payload.dump());
}

// Test: workspace details report trust, name and folders.
static bool test_workspace_details() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result = fixture.run(command_names::GET_WORKSPACE_DETAILS, json::object());
    const json &data = result.payload["data"];
    bool success = result.success && data["isTrusted"] == true && data["workspaceName"] == "project" &&
                   data["workspaceFolders"].size() == 1 && data["workspaceFolders"][0]["uri"] == fixture.project_uri() &&
                   data["windowId"] == "window-a";
    return report(success, "Workspace details list the single trusted folder");
}

// Test: a folder listing shows visible children and the parent uri.
static bool test_list_folder_contents() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result =
        fixture.run(command_names::LIST_FOLDER_CONTENTS, json{{"folderUri", fixture.project_uri()}});
    command_dispatcher::ExecutionResult outside = fixture.run(
        command_names::LIST_FOLDER_CONTENTS,
        json{{"folderUri", local_workspace::path_to_uri(fixture.directory.path() + "/scratch")}});

    const json &entries = result.payload["data"]["entries"];
    bool success = result.success && entries.size() == 3 && entries[0]["name"] == "src" &&
                   entries[0]["type"] == "folder" && entries[1]["name"] == "README.md" &&
                   entries[2]["type"] == "file" &&
                   result.payload["data"]["parentFolderUri"] == local_workspace::path_to_uri(fixture.directory.path()) &&
                   outside.error_code == local_workspace::PATH_OUTSIDE_WORKSPACE;
    return report(success, "Listing shows src, README.md, data.bin; outside folder refused", result.payload.dump());
}

// Test: problems inside the folder are listed and formatted; problems elsewhere are dropped.
static bool test_workspace_problems() {
    WorkspaceFixture fixture;
    diagnostics_store::Diagnostic unused_variable;
    unused_variable.path = fixture.main_path;
    unused_variable.line = 3;
    unused_variable.character = 5;
    unused_variable.severity = diagnostics_store::Severity::Warning;
    unused_variable.message = "unused variable 'x'";
    unused_variable.source = "clang";
    unused_variable.code = "-Wunused-variable";
    diagnostics_store::Diagnostic outside = unused_variable;
    outside.path = fixture.outside_open_path;
    fixture.diagnostics.replace_all({unused_variable, outside});

    command_dispatcher::ExecutionResult all_folders =
        fixture.run(command_names::GET_WORKSPACE_PROBLEMS, json::object());
    command_dispatcher::ExecutionResult scoped = fixture.run(command_names::GET_WORKSPACE_PROBLEMS,
                                                             json{{"workspaceFolderUri", fixture.project_uri()}});

    const json &data = all_folders.payload["data"];
    bool success = all_folders.success && data["problemCount"] == 1 && data["problems"].size() == 1 &&
                   data["problems"][0]["relativePath"] == "src/main.cpp" &&
                   data["problems"][0]["severity"] == "Warning" && data["problems"][0]["windowId"] == "window-a" &&
                   data["problemsString"] ==
                       "[Warning] src/main.cpp:3:5 - unused variable 'x' (clang:-Wunused-variable)" &&
                   data["metadata"]["type"] == "WorkspaceProblems" && all_folders.payload["workspaceFolderUri"].is_null() &&
                   scoped.success && scoped.payload["workspaceFolderUri"] == fixture.project_uri() &&
                   scoped.payload["data"]["metadata"]["content_source_id"] == fixture.project_uri() + "::Problems";
    return report(success, "Folder problems listed with relative paths; outside problems dropped",
                  all_folders.payload.dump());
}

// Test: no diagnostics yields the empty-workspace text.
static bool test_workspace_problems_empty() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult result = fixture.run(command_names::GET_WORKSPACE_PROBLEMS, json::object());
    bool success = result.success && result.payload["data"]["problemCount"] == 0 &&
                   result.payload["data"]["problems"].empty() &&
                   result.payload["data"]["problemsString"] == "No problems found in this workspace.";
    return report(success, "No diagnostics reports no problems");
}

// Test: diagnostics from the editor are validated before they are stored.
static bool test_diagnostic_parsing() {
    diagnostics_store::Diagnostic parsed;
    std::string error_message;
    bool valid = diagnostics_store::diagnostic_from_json(
        json{{"path", "/src/a.cpp"}, {"line", 2}, {"severity", "ERROR"}, {"message", "boom"}, {"code", 42}}, parsed,
        error_message);
    std::string relative_error;
    diagnostics_store::Diagnostic ignored;
    bool relative = diagnostics_store::diagnostic_from_json(json{{"path", "a.cpp"}, {"message", "m"}}, ignored,
                                                            relative_error);
    std::string line_error;
    bool zero_line = diagnostics_store::diagnostic_from_json(
        json{{"path", "/a.cpp"}, {"line", 0}, {"message", "m"}}, ignored, line_error);
    std::string severity_error;
    bool bad_severity = diagnostics_store::diagnostic_from_json(
        json{{"path", "/a.cpp"}, {"severity", "fatal"}, {"message", "m"}}, ignored, severity_error);

    bool success = valid && parsed.line == 2 && parsed.character == 1 &&
                   parsed.severity == diagnostics_store::Severity::Error && parsed.code == "42" && !relative &&
                   !relative_error.empty() && !zero_line && !line_error.empty() && !bad_severity &&
                   !severity_error.empty();
    return report(success, "Diagnostics need an absolute path, positive positions and a known severity");
}

// Test: filter info describes the default traversal rules of a folder.
static bool test_filter_info() {
    WorkspaceFixture fixture;
    command_dispatcher::ExecutionResult first_folder = fixture.run(command_names::GET_FILTER_INFO, json::object());
    command_dispatcher::ExecutionResult unknown_folder =
        fixture.run(command_names::GET_FILTER_INFO, json{{"workspaceFolderUri", "file:///nowhere"}});

    const json &data = first_folder.payload["data"];
    bool success = first_folder.success && data["filterType"] == "default" &&
                   data["workspaceFolderUri"] == fixture.project_uri() && data["rules"]["skipsHiddenEntries"] == true &&
                   data["rules"]["maxFiles"] == fixture.workspace->limits().max_files && data["windowId"] == "window-a" &&
                   unknown_folder.error_code == local_workspace::WORKSPACE_FOLDER_NOT_FOUND;
    return report(success, "Filter info defaults to the first folder; unknown folder refused",
                  first_folder.payload.dump());
}

// Test: an untrusted window refuses workspace commands but still takes an active target.
static bool test_untrusted_workspace() {
    WorkspaceFixture fixture(false);
    command_dispatcher::ExecutionResult tree = fixture.run(command_names::GET_FILE_TREE, json::object());
    command_dispatcher::ExecutionResult search = fixture.run(command_names::SEARCH_WORKSPACE, json{{"query", "a"}});
    command_dispatcher::ExecutionResult details = fixture.run(command_names::GET_WORKSPACE_DETAILS, json::object());
    client_registry::ClientRegistry clients;
    clients.add(1, "127.0.0.1:41001", true);
    command_dispatcher::ExecutionResult target =
        fixture.run(command_names::REGISTER_ACTIVE_TARGET, json{{"tabId", 3}}, &clients, 1);
    bool success = tree.error_code == wire_protocol::WORKSPACE_NOT_TRUSTED &&
                   search.error_code == wire_protocol::WORKSPACE_NOT_TRUSTED &&
                   details.error_code == wire_protocol::WORKSPACE_NOT_TRUSTED && target.success;
    return report(success, "Untrusted workspace refuses file access");
}

// Test: registering an active target needs a tab id and the primary's client table.
static bool test_register_active_target() {
    WorkspaceFixture fixture;
    client_registry::ClientRegistry clients;
    clients.add(5, "127.0.0.1:41000", true);

    command_dispatcher::ExecutionResult registered = fixture.run(
        command_names::REGISTER_ACTIVE_TARGET, json{{"tabId", 12}, {"llmHost", "chat.example"}}, &clients, 5);
    command_dispatcher::ExecutionResult missing_tab =
        fixture.run(command_names::REGISTER_ACTIVE_TARGET, json{{"tabId", "12"}}, &clients, 5);
    command_dispatcher::ExecutionResult not_primary =
        fixture.run(command_names::REGISTER_ACTIVE_TARGET, json{{"tabId", 12}});

    auto target = clients.current_target();
    bool success = registered.success && registered.payload["message"] == "Active target registered." && target &&
                   target->connection_id == 5 && target->tab_id == 12 && target->llm_host == "chat.example" &&
                   missing_tab.error_code == wire_protocol::INVALID_PAYLOAD &&
                   not_primary.error_code == wire_protocol::NOT_PRIMARY;
    return report(success, "Active target recorded; bad tabId and non-primary refused");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_registered_command_set();
    all_passed &= test_search_workspace();
    all_passed &= test_search_payload_errors();
    all_passed &= test_file_tree();
    all_passed &= test_file_content();
    all_passed &= test_folder_content();
    all_passed &= test_entire_codebase();
    all_passed &= test_active_file_info();
    all_passed &= test_open_files();
    all_passed &= test_contents_for_files();
    all_passed &= test_workspace_details();
    all_passed &= test_list_folder_contents();
    all_passed &= test_workspace_problems();
    all_passed &= test_workspace_problems_empty();
    all_passed &= test_diagnostic_parsing();
    all_passed &= test_filter_info();
    all_passed &= test_untrusted_workspace();
    all_passed &= test_register_active_target();
    return all_passed;
}

} // namespace test_command_handlers
