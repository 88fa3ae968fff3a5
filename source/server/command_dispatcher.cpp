#include "server/command_dispatcher.hpp"
#include "utils/debug_log.hpp"

namespace command_dispatcher {

using command_registry::CommandError;
using command_registry::Precondition;

static ExecutionResult make_failure(const std::string &command, const std::string &error_code,
                                    const std::string &error_message) {
    ExecutionResult result;
    result.success = false;
    result.error_code = error_code;
    result.error_message = error_message;
    result.payload = wire_protocol::build_error_payload(error_code, error_message, command);
    return result;
}

CommandDispatcher::CommandDispatcher(const command_registry::CommandRegistry &registry,
                                     const workspace::WorkspaceContext &workspace_context)
    : registry_(registry), workspace_context_(workspace_context) {}

bool CommandDispatcher::check_precondition(const std::string &command, std::string &error_code,
                                           std::string &error_message) const {
    auto definition = registry_.find(command);
    if (!definition) {
        error_code = wire_protocol::UNKNOWN_COMMAND;
        error_message = "Unknown command: " + command;
        return false;
    }
    if (definition->precondition == Precondition::TrustedWorkspace) {
        // Trust is checked first: an untrusted window must not reveal whether a folder is open.
        if (!workspace_context_.is_trusted()) {
            error_code = wire_protocol::WORKSPACE_NOT_TRUSTED;
            error_message = "Workspace is not trusted.";
            return false;
        }
        if (!workspace_context_.has_open_folder()) {
            error_code = wire_protocol::NO_WORKSPACE_OPEN;
            error_message = "No workspace folder is open.";
            return false;
        }
    }
    return true;
}

bool CommandDispatcher::is_workspace_wide(const std::string &command) const {
    return registry_.is_workspace_wide(command);
}

ExecutionResult CommandDispatcher::execute(const std::string &command, const json &payload,
                                           command_registry::ClientContext &context) const {
    std::string error_code;
    std::string error_message;
    if (!check_precondition(command, error_code, error_message)) {
        debug_log::log("Dispatcher: rejected " + command + " (" + error_code + ").");
        return make_failure(command, error_code, error_message);
    }

    auto definition = registry_.find(command);
    json handler_result;
    try {
        handler_result = definition->handler(payload, context);
    } catch (const CommandError &command_error) {
        debug_log::log("Dispatcher: " + command + " failed with " + command_error.error_code() + ": " +
                       command_error.what());
        return make_failure(command, command_error.error_code(), command_error.what());
    } catch (const std::exception &exception) {
        debug_log::log_message("Error: Handler for " + command + " threw: " + std::string(exception.what()));
        return make_failure(command, wire_protocol::COMMAND_EXECUTION_ERROR, exception.what());
    }

    if (!handler_result.is_object()) {
        json wrapped;
        wrapped["success"] = true;
        wrapped["data"] = handler_result;
        handler_result = wrapped;
    } else if (!handler_result.contains("success")) {
        handler_result["success"] = true;
    }

    ExecutionResult result;
    if (wire_protocol::payload_indicates_failure(handler_result)) {
        result.success = false;
        result.error_code = wire_protocol::get_string(handler_result, "errorCode", wire_protocol::COMMAND_EXECUTION_ERROR);
        result.error_message = wire_protocol::get_string(handler_result, "error", "Command failed.");
        result.payload = wire_protocol::build_error_payload(result.error_code, result.error_message, command);
        return result;
    }
    result.success = true;
    result.payload = handler_result;
    return result;
}

wire_protocol::Message CommandDispatcher::dispatch(const wire_protocol::Message &request,
                                                   command_registry::ClientContext &context) const {
    ExecutionResult result = execute(request.command, request.payload, context);
    if (!result.success) {
        return wire_protocol::make_error_response(request.message_id, result.error_code, result.error_message,
                                                  request.command);
    }
    return wire_protocol::make_response(request.message_id, wire_protocol::response_command_for(request.command),
                                        result.payload);
}

} // namespace command_dispatcher
