#include "server/push_relay.hpp"
#include "protocol/command_names.hpp"
#include "protocol/wire_protocol.hpp"
#include "utils/debug_log.hpp"

namespace push_relay {

PushRelay::PushRelay(const client_registry::ActiveTabRegistry &active_tabs, message_sink::MessageSink &sink)
    : active_tabs_(active_tabs), sink_(sink) {}

bool PushRelay::deliver(const std::string &command, const json &payload, ConnectionId target) {
    wire_protocol::Message push = wire_protocol::make_push(command, payload);
    if (!sink_.send_text(target, wire_protocol::encode(push))) {
        debug_log::log_message("Warning: Could not deliver " + command + " push to connection " +
                               std::to_string(target) + ".");
        return false;
    }
    debug_log::log("Push relay: " + command + " queued for connection " + std::to_string(target) + ".");
    return true;
}

bool PushRelay::push_snippet(const json &snippet_payload) {
    std::optional<client_registry::PushTarget> target = active_tabs_.current_target();
    if (!target) {
        debug_log::log_message("Warning: Snippet push dropped: no active target tab is registered.");
        return false;
    }
    json payload = snippet_payload.is_object() ? snippet_payload : json::object();
    payload["targetTabId"] = target->tab_id;
    return deliver(command_names::PUSH_SNIPPET, payload, target->connection_id);
}

} // namespace push_relay
