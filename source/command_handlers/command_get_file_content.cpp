#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"

#include <filesystem>

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "get_file_content".

static json handle_get_file_content(const local_workspace::LocalWorkspace &workspace, const json &payload,
                                    ClientContext &context) {
    std::string file_path = handler_support::require_string(payload, "filePath");

    local_workspace::FileReadResult read_result = workspace.read_file(file_path);
    if (!read_result.success) {
        throw CommandError(read_result.error_code, read_result.error_detail);
    }

    const std::string &full_path = read_result.file_data.full_path;
    std::string label = std::filesystem::path(full_path).filename().string();
    json data;
    data["fileData"] = handler_support::file_data_to_json(read_result.file_data, context.local_window_id);
    data["metadata"] = handler_support::build_metadata(local_workspace::path_to_uri(full_path), "file_content", label,
                                                       workspace.folder_containing(full_path),
                                                       context.local_window_id);
    return handler_support::success_payload(data);
}

namespace command_get_file_content {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    registry.register_command({
        command_names::GET_FILE_CONTENT,
        "Read one text file.",
        command_registry::Precondition::TrustedWorkspace,
        false,
        [&workspace](const json &payload, ClientContext &context) {
            return handle_get_file_content(workspace, payload, context);
        }
    });
}

} // namespace command_get_file_content
