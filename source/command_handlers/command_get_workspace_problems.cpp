#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "workspace/diagnostics_store.hpp"

#include <filesystem>
#include <sstream>

using json = nlohmann::json;
using command_registry::ClientContext;
using diagnostics_store::Diagnostic;
using local_workspace::WorkspaceFolder;

// Command handler for "get_workspace_problems".
// Reports the diagnostics that fall inside one workspace folder, or inside every folder of
// this window when workspaceFolderUri is absent.

static const char *NO_PROBLEMS_TEXT = "No problems found in this workspace.";

// [Error] src/main.cpp:3:5 - message (source:code)
static std::string format_problem(const Diagnostic &diagnostic, const std::string &relative_path) {
    std::ostringstream line;
    line << "[" << diagnostics_store::to_string(diagnostic.severity) << "] " << relative_path << ":"
         << diagnostic.line << ":" << diagnostic.character << " - " << diagnostic.message << " (";
    if (!diagnostic.source.empty()) {
        line << diagnostic.source << ":";
    }
    line << diagnostic.code << ")";
    return line.str();
}

static json handle_get_workspace_problems(const local_workspace::LocalWorkspace &workspace,
                                          const diagnostics_store::DiagnosticsStore &diagnostics,
                                          const json &payload, ClientContext &context) {
    std::optional<WorkspaceFolder> scope = handler_support::resolve_folder(workspace, payload);

    json problems = json::array();
    std::string problems_string;
    for (const Diagnostic &diagnostic : diagnostics.snapshot()) {
        std::optional<WorkspaceFolder> folder = workspace.folder_containing(diagnostic.path);
        if (!folder || (scope && folder->uri != scope->uri)) {
            continue;
        }
        std::string relative_path =
            std::filesystem::path(diagnostic.path).lexically_normal().lexically_relative(folder->path).string();
        std::string formatted = format_problem(diagnostic, relative_path);

        json problem;
        problem["path"] = diagnostic.path;
        problem["relativePath"] = relative_path;
        problem["line"] = diagnostic.line;
        problem["character"] = diagnostic.character;
        problem["severity"] = diagnostics_store::to_string(diagnostic.severity);
        problem["message"] = diagnostic.message;
        problem["source"] = diagnostic.source;
        problem["code"] = diagnostic.code;
        problem["workspaceFolderUri"] = folder->uri;
        problem["workspaceFolderName"] = folder->name;
        problem["windowId"] = context.local_window_id;
        problems.push_back(problem);

        if (!problems_string.empty()) {
            problems_string += "\n";
        }
        problems_string += formatted;
    }

    std::string source_id = scope ? scope->uri : "window:" + context.local_window_id;
    std::string label = scope ? scope->name : workspace.workspace_name();

    json data;
    data["problemsString"] = problems.empty() ? std::string(NO_PROBLEMS_TEXT) : problems_string;
    data["problemCount"] = problems.size();
    data["problems"] = problems;
    data["metadata"] = handler_support::build_metadata(source_id + "::Problems", "WorkspaceProblems", label, scope,
                                                       context.local_window_id);
    data["windowId"] = context.local_window_id;

    json response = handler_support::success_payload(data);
    response["workspaceFolderUri"] = scope ? json(scope->uri) : json(nullptr);
    return response;
}

namespace command_get_workspace_problems {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace,
                      const diagnostics_store::DiagnosticsStore &diagnostics) {
    registry.register_command({
        command_names::GET_WORKSPACE_PROBLEMS,
        "Errors and warnings reported for files in the workspace.",
        command_registry::Precondition::TrustedWorkspace,
        true,
        [&workspace, &diagnostics](const json &payload, ClientContext &context) {
            return handle_get_workspace_problems(workspace, diagnostics, payload, context);
        }
    });
}

} // namespace command_get_workspace_problems
