#include "command_handlers/handler_support.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"
#include "server/client_registry.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;
using command_registry::ClientContext;
using command_registry::CommandError;

// Command handler for "register_active_target".
// Marks the sending connection as the browser tab that receives snippet pushes.

static json handle_register_active_target(const json &payload, ClientContext &context) {
    if (!payload.is_object() || !payload.contains("tabId") || !payload["tabId"].is_number_integer()) {
        throw CommandError(wire_protocol::INVALID_PAYLOAD, "Missing required parameter 'tabId' (integer).");
    }
    int tab_id = payload["tabId"].get<int>();
    std::string llm_host = handler_support::optional_string(payload, "llmHost").value_or("");

    if (context.clients == nullptr) {
        throw CommandError(wire_protocol::NOT_PRIMARY, "Active targets can only be registered with the primary.");
    }
    if (!context.clients->set_active_target(context.connection_id, tab_id, llm_host)) {
        throw CommandError(wire_protocol::INTERNAL_SERVER_ERROR, "Connection is no longer registered.");
    }

    debug_log::log("Active target is now tab " + std::to_string(tab_id) + " (" + llm_host + ").");
    json result;
    result["success"] = true;
    result["message"] = "Active target registered.";
    return result;
}

namespace command_register_active_target {

void register_command(command_registry::CommandRegistry &registry, const local_workspace::LocalWorkspace &workspace) {
    (void)workspace;
    registry.register_command({
        command_names::REGISTER_ACTIVE_TARGET,
        "Register the sending browser tab as the recipient of snippet pushes.",
        command_registry::Precondition::None,
        false,
        handle_register_active_target
    });
}

} // namespace command_register_active_target
