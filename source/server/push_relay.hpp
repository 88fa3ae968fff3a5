#ifndef CTXBRIDGE_PUSH_RELAY_HPP
#define CTXBRIDGE_PUSH_RELAY_HPP

// Push relay: best-effort delivery of snippet pushes to the active browser tab.
// A failed delivery is logged and reported to the caller, never retried.

#include <nlohmann/json.hpp>
#include <string>

#include "server/client_registry.hpp"
#include "server/message_sink.hpp"

namespace push_relay {

using json = nlohmann::json;
using message_sink::ConnectionId;

class PushRelay {
public:
    PushRelay(const client_registry::ActiveTabRegistry &active_tabs, message_sink::MessageSink &sink);

    // Deliver a snippet to the active tab, filling targetTabId. With no active tab registered,
    // logs a warning and delivers nothing.
    bool push_snippet(const json &snippet_payload);

private:
    bool deliver(const std::string &command, const json &payload, ConnectionId target);

    const client_registry::ActiveTabRegistry &active_tabs_;
    message_sink::MessageSink &sink_;
};

} // namespace push_relay

#endif // CTXBRIDGE_PUSH_RELAY_HPP
