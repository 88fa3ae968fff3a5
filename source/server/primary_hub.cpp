#include "server/primary_hub.hpp"
#include "protocol/command_names.hpp"
#include "utils/debug_log.hpp"

#include <set>

namespace primary_hub {

using wire_protocol::Message;
using wire_protocol::MessageType;

PrimaryHub::PrimaryHub(message_sink::MessageSink &sink, const command_dispatcher::CommandDispatcher &dispatcher,
                       timer_queue::TimerQueue &timers, const HubOptions &options)
    : sink_(sink),
      dispatcher_(dispatcher),
      options_(options),
      secondaries_(options.max_secondaries),
      push_relay_(clients_, sink),
      aggregations_(timers, options.aggregation_timeout_milliseconds, options.window_id) {
    aggregations_.set_completion_handler([this](ConnectionId requester, const Message &response) {
        send_message(requester, response);
    });
}

PrimaryHub::~PrimaryHub() {
    aggregations_.set_completion_handler(nullptr);
}

void PrimaryHub::set_task_runner(TaskRunner runner) {
    task_runner_ = std::move(runner);
}

void PrimaryHub::send_message(ConnectionId connection_id, const Message &message) {
    if (!sink_.send_text(connection_id, wire_protocol::encode(message))) {
        debug_log::log("Hub: connection " + std::to_string(connection_id) + " is gone; " + message.command +
                       " not sent.");
    }
}

void PrimaryHub::send_error(ConnectionId connection_id, const std::string &message_id, const std::string &error_code,
                            const std::string &error_message, const std::string &original_command) {
    send_message(connection_id,
                 wire_protocol::make_error_response(message_id, error_code, error_message, original_command));
}

command_registry::ClientContext PrimaryHub::context_for(ConnectionId connection_id) {
    command_registry::ClientContext context;
    context.connection_id = connection_id;
    context.local_window_id = options_.window_id;
    context.clients = &clients_;
    std::optional<client_registry::ClientRecord> record = clients_.find(connection_id);
    if (record) {
        context.is_authenticated = record->is_authenticated;
        context.remote_address = record->remote_address;
    }
    return context;
}

void PrimaryHub::handle_connection_opened(ConnectionId connection_id, const std::string &remote_address) {
    // Only loopback peers can reach the listener, so every connection counts as authenticated.
    clients_.add(connection_id, remote_address, true);
}

void PrimaryHub::handle_connection_closed(ConnectionId connection_id) {
    clients_.remove(connection_id);
    for (const auto &window_id : secondaries_.remove_by_connection(connection_id)) {
        debug_log::log_message("Secondary window " + window_id + " disconnected.");
    }
}

void PrimaryHub::handle_frame(ConnectionId connection_id, const std::string &frame) {
    wire_protocol::DecodeResult decoded = wire_protocol::decode(frame);
    if (!decoded.success) {
        if (decoded.recovered_message_id.empty()) {
            debug_log::log_message("Warning: Dropped malformed frame from connection " + std::to_string(connection_id) +
                                   ": " + decoded.error_message);
            return;
        }
        send_error(connection_id, decoded.recovered_message_id, decoded.error_code, decoded.error_message,
                   decoded.recovered_command);
        return;
    }

    const Message &message = decoded.message;
    switch (message.type) {
    case MessageType::Request:
        if (!task_runner_ || message.command == command_names::REGISTER_SECONDARY ||
            message.command == command_names::UNREGISTER_SECONDARY) {
            handle_request(connection_id, message);
            break;
        }
        if (!task_runner_([this, connection_id, message]() { handle_request(connection_id, message); })) {
            debug_log::log_message("Warning: " + message.command + " from connection " + std::to_string(connection_id) +
                                   " dropped: no worker accepted it.");
        }
        break;
    case MessageType::Push:
        handle_push(connection_id, message);
        break;
    case MessageType::ErrorResponse:
        debug_log::log_message("Warning: Connection " + std::to_string(connection_id) + " sent an error: " +
                               wire_protocol::get_string(message.payload, "error"));
        break;
    case MessageType::Response:
        send_error(connection_id, message.message_id, wire_protocol::INVALID_MESSAGE_TYPE,
                   "Server does not accept response messages.", message.command);
        break;
    }
}

void PrimaryHub::handle_request(ConnectionId connection_id, const Message &request) {
    if (request.command == command_names::REGISTER_SECONDARY) {
        handle_register_secondary(connection_id, request);
        return;
    }
    if (request.command == command_names::UNREGISTER_SECONDARY) {
        handle_unregister_secondary(connection_id, request);
        return;
    }

    std::optional<client_registry::ClientRecord> record = clients_.find(connection_id);
    bool from_secondary = record && record->window_id;
    if (dispatcher_.is_workspace_wide(request.command) && !from_secondary) {
        std::vector<secondary_registry::SecondaryRegistration> targets = secondaries_.snapshot();
        if (!targets.empty()) {
            aggregate(connection_id, request, targets);
            return;
        }
    }

    command_registry::ClientContext context = context_for(connection_id);
    send_message(connection_id, dispatcher_.dispatch(request, context));
}

void PrimaryHub::aggregate(ConnectionId connection_id, const Message &request,
                           const std::vector<secondary_registry::SecondaryRegistration> &targets) {
    std::set<std::string> expected_windows;
    for (const auto &registration : targets) {
        expected_windows.insert(registration.window_id);
    }
    std::string aggregation_id = aggregations_.start(request.message_id, connection_id, request.command,
                                                     request.payload, expected_windows);

    json forward_payload;
    forward_payload["aggregationId"] = aggregation_id;
    forward_payload["originalCommand"] = request.command;
    forward_payload["originalPayload"] = request.payload;
    std::string forward_frame = wire_protocol::encode(wire_protocol::make_push(command_names::FORWARD_REQUEST,
                                                                               forward_payload));
    for (const auto &registration : targets) {
        if (!sink_.send_text(registration.connection_id, forward_frame)) {
            debug_log::log_message("Warning: Could not forward " + request.command + " to window " +
                                   registration.window_id + ".");
        }
    }

    command_registry::ClientContext context = context_for(connection_id);
    command_dispatcher::ExecutionResult local_result = dispatcher_.execute(request.command, request.payload, context);
    aggregations_.add_local_response(aggregation_id, local_result.payload);
}

void PrimaryHub::handle_register_secondary(ConnectionId connection_id, const Message &request) {
    std::string window_id = wire_protocol::get_string(request.payload, "windowId");
    if (window_id.empty()) {
        send_error(connection_id, request.message_id, wire_protocol::INVALID_PAYLOAD,
                   "register_secondary requires a windowId.", request.command);
        return;
    }

    secondary_registry::SecondaryRegistration registration;
    registration.window_id = window_id;
    registration.connection_id = connection_id;
    if (request.payload.contains("port") && request.payload["port"].is_number_integer()) {
        registration.listening_port = request.payload["port"].get<int>();
    }

    std::optional<secondary_registry::SecondaryRegistration> previous = secondaries_.find(window_id);
    secondary_registry::UpsertOutcome outcome = secondaries_.upsert(registration);
    if (outcome == secondary_registry::UpsertOutcome::LimitReached) {
        debug_log::log_message("Warning: Refused secondary window " + window_id + ": limit of " +
                               std::to_string(options_.max_secondaries) + " reached.");
        send_error(connection_id, request.message_id, wire_protocol::TOO_MANY_SECONDARIES,
                   "Too many secondary windows are registered.", request.command);
        return;
    }
    // A window that reconnected leaves its old connection behind as a plain client.
    if (previous && previous->connection_id != connection_id) {
        clients_.clear_window_id(previous->connection_id);
    }
    clients_.set_window_id(connection_id, window_id);
    debug_log::log_message("Secondary window " + window_id +
                           (outcome == secondary_registry::UpsertOutcome::Added ? " registered." : " re-registered."));

    json ack;
    ack["success"] = true;
    ack["message"] = "Secondary registered successfully.";
    send_message(connection_id, wire_protocol::make_response(
                                    request.message_id, wire_protocol::response_command_for(request.command), ack));
}

void PrimaryHub::handle_unregister_secondary(ConnectionId connection_id, const Message &request) {
    std::string window_id = wire_protocol::get_string(request.payload, "windowId");
    if (window_id.empty()) {
        send_error(connection_id, request.message_id, wire_protocol::INVALID_PAYLOAD,
                   "unregister_secondary requires a windowId.", request.command);
        return;
    }
    secondary_registry::RemoveOutcome outcome = secondaries_.remove_owned(window_id, connection_id);
    if (outcome == secondary_registry::RemoveOutcome::NotOwner) {
        debug_log::log_message("Warning: Connection " + std::to_string(connection_id) +
                               " tried to unregister window " + window_id + " it does not own.");
        send_error(connection_id, request.message_id, wire_protocol::REGISTRATION_NOT_OWNED,
                   "Window " + window_id + " is registered over another connection.", request.command);
        return;
    }
    bool removed = outcome == secondary_registry::RemoveOutcome::Removed;
    if (removed) {
        clients_.clear_window_id(connection_id);
    }
    debug_log::log_message("Secondary window " + window_id + (removed ? " unregistered." : " was not registered."));

    json ack;
    ack["success"] = true;
    ack["message"] = removed ? "Secondary unregistered." : "Secondary was not registered.";
    send_message(connection_id, wire_protocol::make_response(
                                    request.message_id, wire_protocol::response_command_for(request.command), ack));
}

void PrimaryHub::handle_push(ConnectionId connection_id, const Message &push) {
    if (push.command == command_names::FORWARD_RESPONSE_TO_PRIMARY) {
        std::string aggregation_id = wire_protocol::get_string(push.payload, "aggregationId");
        std::string window_id = wire_protocol::get_string(push.payload, "windowId");
        if (window_id.empty()) {
            std::optional<client_registry::ClientRecord> record = clients_.find(connection_id);
            window_id = record && record->window_id ? *record->window_id : "";
        }
        if (aggregation_id.empty() || window_id.empty() || !push.payload.contains("responsePayload")) {
            debug_log::log_message("Warning: Ignored incomplete forward_response_to_primary from connection " +
                                   std::to_string(connection_id) + ".");
            return;
        }
        aggregations_.add_secondary_response(aggregation_id, window_id, push.payload["responsePayload"]);
        return;
    }

    if (push.command == command_names::FORWARD_PUSH_TO_PRIMARY) {
        if (!push.payload.contains("originalPushPayload")) {
            debug_log::log_message("Warning: Ignored forward_push_to_primary without originalPushPayload.");
            return;
        }
        deliver_snippet(push.payload["originalPushPayload"]);
        return;
    }

    debug_log::log("Hub: ignoring push " + push.command + " from connection " + std::to_string(connection_id) + ".");
}

bool PrimaryHub::deliver_snippet(const json &snippet_payload) {
    return push_relay_.push_snippet(snippet_payload);
}

} // namespace primary_hub
