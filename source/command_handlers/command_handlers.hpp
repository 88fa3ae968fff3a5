#ifndef CTXBRIDGE_COMMAND_HANDLERS_HPP
#define CTXBRIDGE_COMMAND_HANDLERS_HPP

// Command handler registration.
// Each command_*.cpp file provides a register function that is called during startup.

#include "server/command_registry.hpp"
#include "workspace/diagnostics_store.hpp"
#include "workspace/local_workspace.hpp"

namespace command_handlers {

// Register every served command. Handlers read from workspace and diagnostics, which must
// outlive registry.
void register_all_commands(command_registry::CommandRegistry &registry,
                           const local_workspace::LocalWorkspace &workspace,
                           const diagnostics_store::DiagnosticsStore &diagnostics);

} // namespace command_handlers

#endif // CTXBRIDGE_COMMAND_HANDLERS_HPP
