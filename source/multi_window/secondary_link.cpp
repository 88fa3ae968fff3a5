#include "multi_window/secondary_link.hpp"
#include "protocol/command_names.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <future>

namespace secondary_link {

using connection_supervisor::ConnectionStatus;

std::string to_string(RegistrationOutcome outcome) {
    switch (outcome) {
    case RegistrationOutcome::Registered:
        return "registered";
    case RegistrationOutcome::Refused:
        return "refused";
    case RegistrationOutcome::NoPrimary:
        return "no_primary";
    }
    return "no_primary";
}

static connection_supervisor::SupervisorOptions supervisor_options(const LinkOptions &options) {
    connection_supervisor::SupervisorOptions supervisor_options;
    supervisor_options.host = options.host;
    supervisor_options.ports = options.ports;
    // Election decides what happens after a failure, so the link makes exactly one attempt.
    supervisor_options.max_attempts = 1;
    supervisor_options.retry_delay_milliseconds = 0;
    supervisor_options.reconnect_on_unexpected_close = false;
    return supervisor_options;
}

SecondaryLink::SecondaryLink(const std::string &window_id, client_transport::ClientTransport &transport,
                             timer_queue::TimerQueue &timers, const LinkOptions &options,
                             const command_dispatcher::CommandDispatcher &dispatcher,
                             worker_pool::WorkerPool &workers)
    : window_id_(window_id),
      options_(options),
      dispatcher_(dispatcher),
      workers_(workers),
      supervisor_(transport, supervisor_options(options)),
      router_(supervisor_, timers, options.request_timeout_milliseconds) {
    router_.set_push_handler([this](const wire_protocol::Message &push) { handle_push(push); });
    supervisor_.set_status_observer(
        [this](ConnectionStatus status, const std::string &detail) { handle_status(status, detail); });
}

SecondaryLink::~SecondaryLink() {
    set_lost_handler(nullptr);
    supervisor_.set_status_observer(nullptr);
    router_.set_push_handler(nullptr);
    // Forwarded requests already queued still reference this link.
    workers_.wait_idle();
}

RegistrationOutcome SecondaryLink::connect_and_register() {
    if (!supervisor_.ensure_connected()) {
        return RegistrationOutcome::NoPrimary;
    }
    const int port = supervisor_.connected_port();

    json payload;
    payload["windowId"] = window_id_;
    // Secondaries accept no connections of their own.
    payload["port"] = 0;

    std::future<request_router::RequestResult> registration =
        router_.send(command_names::REGISTER_SECONDARY, payload);
    if (registration.wait_for(std::chrono::milliseconds(options_.registration_timeout_milliseconds)) !=
        std::future_status::ready) {
        debug_log::log_message("Warning: Primary on port " + std::to_string(port) +
                               " did not acknowledge registration in time.");
        supervisor_.disconnect();
        return RegistrationOutcome::Refused;
    }

    request_router::RequestResult result = registration.get();
    if (!result.success) {
        debug_log::log_message("Warning: Registration with primary on port " + std::to_string(port) + " failed (" +
                               result.error_code + "): " + result.error_message);
        supervisor_.disconnect();
        return RegistrationOutcome::Refused;
    }

    registered_ = true;
    debug_log::log_message("Window " + window_id_ + " registered as SECONDARY with primary on port " +
                           std::to_string(port) + ".");
    return RegistrationOutcome::Registered;
}

bool SecondaryLink::forward_snippet(const json &snippet_payload) {
    json payload;
    payload["originalPushPayload"] = snippet_payload;
    wire_protocol::Message push = wire_protocol::make_push(command_names::FORWARD_PUSH_TO_PRIMARY, payload);
    if (!supervisor_.send_text(wire_protocol::encode(push))) {
        debug_log::log_message("Warning: Could not relay snippet to the primary: link is down.");
        return false;
    }
    return true;
}

void SecondaryLink::unregister_and_disconnect() {
    if (registered_ && supervisor_.is_connected()) {
        json payload;
        payload["windowId"] = window_id_;
        std::future<request_router::RequestResult> unregistration =
            router_.send(command_names::UNREGISTER_SECONDARY, payload);
        if (unregistration.wait_for(std::chrono::milliseconds(options_.registration_timeout_milliseconds)) !=
            std::future_status::ready) {
            debug_log::log("Secondary link: unregister was not acknowledged in time.");
        }
    }
    registered_ = false;
    supervisor_.disconnect();
}

bool SecondaryLink::is_registered() const {
    return registered_;
}

int SecondaryLink::primary_port() const {
    return supervisor_.connected_port();
}

void SecondaryLink::set_lost_handler(LostHandler handler) {
    std::lock_guard<std::mutex> lock(lost_mutex_);
    lost_handler_ = std::move(handler);
}

void SecondaryLink::handle_status(ConnectionStatus status, const std::string &detail) {
    if (status != ConnectionStatus::DisconnectedUnexpectedly) {
        return;
    }
    bool was_registered = registered_.exchange(false);
    debug_log::log_message("Warning: Lost connection to the primary: " + detail);
    if (!was_registered) {
        return;
    }
    std::lock_guard<std::mutex> lock(lost_mutex_);
    if (lost_handler_) {
        lost_handler_();
    }
}

void SecondaryLink::handle_push(const wire_protocol::Message &push) {
    if (push.command != command_names::FORWARD_REQUEST) {
        debug_log::log("Secondary link: ignoring push " + push.command + ".");
        return;
    }
    json forward_payload = push.payload;
    if (!workers_.submit([this, forward_payload]() { run_forwarded_request(forward_payload); })) {
        debug_log::log_message("Warning: Forwarded request dropped: worker pool is stopped.");
    }
}

void SecondaryLink::run_forwarded_request(const json &forward_payload) {
    std::string aggregation_id = wire_protocol::get_string(forward_payload, "aggregationId");
    std::string original_command = wire_protocol::get_string(forward_payload, "originalCommand");
    json original_payload = forward_payload.contains("originalPayload") ? forward_payload["originalPayload"]
                                                                        : json::object();
    if (aggregation_id.empty() || original_command.empty()) {
        debug_log::log_message("Warning: Ignored forward_request without aggregationId or originalCommand.");
        return;
    }

    json response_payload;
    if (original_command == command_names::REGISTER_SECONDARY ||
        original_command == command_names::UNREGISTER_SECONDARY) {
        response_payload = wire_protocol::build_error_payload(
            wire_protocol::NOT_PRIMARY, "This window is not the primary.", original_command);
    } else {
        command_registry::ClientContext context;
        context.is_authenticated = true;
        context.local_window_id = window_id_;
        response_payload = dispatcher_.execute(original_command, original_payload, context).payload;
    }

    json reply;
    reply["aggregationId"] = aggregation_id;
    reply["windowId"] = window_id_;
    reply["responsePayload"] = response_payload;
    wire_protocol::Message push = wire_protocol::make_push(command_names::FORWARD_RESPONSE_TO_PRIMARY, reply);
    if (!supervisor_.send_text(wire_protocol::encode(push))) {
        debug_log::log_message("Warning: Answer to aggregation " + aggregation_id + " not sent: link is down.");
        return;
    }
    debug_log::log("Secondary link: answered " + original_command + " for aggregation " + aggregation_id + ".");
}

} // namespace secondary_link
