#include "command_handlers/command_handlers.hpp"

// Forward declarations of individual command registration functions.
// Each command_*.cpp defines its own namespace with a register_command() function.

using command_registry::CommandRegistry;
using diagnostics_store::DiagnosticsStore;
using local_workspace::LocalWorkspace;

namespace command_register_active_target { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_search_workspace { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_file_tree { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_file_content { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_folder_content { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_entire_codebase { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_active_file_info { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_open_files { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_contents_for_files { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_workspace_details { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_list_folder_contents { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_filter_info { void register_command(CommandRegistry &, const LocalWorkspace &); }
namespace command_get_workspace_problems {
void register_command(CommandRegistry &, const LocalWorkspace &, const DiagnosticsStore &);
}

namespace command_handlers {

void register_all_commands(CommandRegistry &registry, const LocalWorkspace &workspace,
                           const DiagnosticsStore &diagnostics) {
    command_register_active_target::register_command(registry, workspace);
    command_search_workspace::register_command(registry, workspace);
    command_get_file_tree::register_command(registry, workspace);
    command_get_file_content::register_command(registry, workspace);
    command_get_folder_content::register_command(registry, workspace);
    command_get_entire_codebase::register_command(registry, workspace);
    command_get_active_file_info::register_command(registry, workspace);
    command_get_open_files::register_command(registry, workspace);
    command_get_contents_for_files::register_command(registry, workspace);
    command_get_workspace_details::register_command(registry, workspace);
    command_list_folder_contents::register_command(registry, workspace);
    command_get_filter_info::register_command(registry, workspace);
    command_get_workspace_problems::register_command(registry, workspace, diagnostics);
}

} // namespace command_handlers
