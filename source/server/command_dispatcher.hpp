#ifndef CTXBRIDGE_COMMAND_DISPATCHER_HPP
#define CTXBRIDGE_COMMAND_DISPATCHER_HPP

// Command dispatcher: the single catch boundary between requests and handlers.
// Checks the registered precondition centrally, maps unknown commands and handler failures to
// error kinds, and wraps results in response envelopes named by the response-name table.

#include <nlohmann/json.hpp>
#include <string>

#include "protocol/wire_protocol.hpp"
#include "server/command_registry.hpp"
#include "workspace/workspace_abi.hpp"

namespace command_dispatcher {

using json = nlohmann::json;

// Outcome of executing one command. On failure payload holds the error payload.
struct ExecutionResult {
    bool success = false;
    json payload;
    std::string error_code;
    std::string error_message;
};

class CommandDispatcher {
public:
    CommandDispatcher(const command_registry::CommandRegistry &registry,
                      const workspace::WorkspaceContext &workspace_context);

    // Run command against this window's workspace. Never throws.
    ExecutionResult execute(const std::string &command, const json &payload,
                            command_registry::ClientContext &context) const;

    // Execute request and build the envelope answering it (response or error_response).
    wire_protocol::Message dispatch(const wire_protocol::Message &request,
                                    command_registry::ClientContext &context) const;

    // False (with error_code and error_message) when command is unknown or its precondition is unmet.
    bool check_precondition(const std::string &command, std::string &error_code, std::string &error_message) const;

    bool is_workspace_wide(const std::string &command) const;

private:
    const command_registry::CommandRegistry &registry_;
    const workspace::WorkspaceContext &workspace_context_;
};

} // namespace command_dispatcher

#endif // CTXBRIDGE_COMMAND_DISPATCHER_HPP
