#ifndef CTXBRIDGE_COMMAND_REGISTRY_HPP
#define CTXBRIDGE_COMMAND_REGISTRY_HPP

// Command registry: name -> handler, plus the precondition the dispatcher checks before calling it
// and whether the primary aggregates the command across windows.

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "server/message_sink.hpp"

namespace client_registry {
class ClientRegistry;
}

namespace command_registry {

using json = nlohmann::json;

// What a handler knows about the connection that sent the request.
// connection_id is 0 for commands executed on behalf of the primary (forwarded requests).
struct ClientContext {
    message_sink::ConnectionId connection_id = 0;
    bool is_authenticated = false;
    std::string remote_address;
    // Window that executes the command.
    std::string local_window_id;
    // Non-null only on the primary.
    client_registry::ClientRegistry *clients = nullptr;
};

// Typed business failure raised by a handler; error_code travels to the caller as errorCode.
class CommandError : public std::runtime_error {
public:
    CommandError(const std::string &error_code, const std::string &message)
        : std::runtime_error(message), error_code_(error_code) {}

    const std::string &error_code() const { return error_code_; }

private:
    std::string error_code_;
};

// A handler receives the request payload and returns the success payload.
using CommandHandler = std::function<json(const json &payload, ClientContext &context)>;

enum class Precondition {
    None,
    // A workspace folder must be open and trusted.
    TrustedWorkspace
};

struct CommandDefinition {
    std::string name;
    std::string description;
    Precondition precondition = Precondition::None;
    // The primary fans the command out to every secondary and merges the answers.
    bool workspace_wide = false;
    CommandHandler handler;
};

class CommandRegistry {
public:
    // Register a command. A second registration under the same name replaces the first.
    void register_command(const CommandDefinition &definition);

    // Registered definition, or nullopt.
    std::optional<CommandDefinition> find(const std::string &command) const;

    std::vector<std::string> command_names() const;

    bool is_workspace_wide(const std::string &command) const;

private:
    std::map<std::string, CommandDefinition> definitions_;
};

} // namespace command_registry

#endif // CTXBRIDGE_COMMAND_REGISTRY_HPP
