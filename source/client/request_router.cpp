#include "client/request_router.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <vector>

namespace request_router {

static std::future<RequestResult> failed_future(const std::string &error_message, const std::string &error_code) {
    std::promise<RequestResult> promise;
    RequestResult result;
    result.success = false;
    result.error_message = error_message;
    result.error_code = error_code;
    promise.set_value(result);
    return promise.get_future();
}

// Turn a response envelope into the caller-facing outcome.
static RequestResult result_from_response(const wire_protocol::Message &response) {
    RequestResult result;
    result.payload = response.payload;
    if (response.type == wire_protocol::MessageType::ErrorResponse ||
        wire_protocol::payload_indicates_failure(response.payload)) {
        result.success = false;
        result.error_message = wire_protocol::get_string(response.payload, "error", "Request failed.");
        result.error_code = wire_protocol::get_string(response.payload, "errorCode", "UNKNOWN_ERROR");
        return result;
    }
    result.success = true;
    return result;
}

RequestRouter::RequestRouter(connection_supervisor::ConnectionSupervisor &supervisor, timer_queue::TimerQueue &timers,
                             int request_timeout_milliseconds)
    : supervisor_(supervisor), timers_(timers), request_timeout_milliseconds_(request_timeout_milliseconds),
      pending_(std::make_shared<PendingTable>()) {
    supervisor_.set_message_handler([this](const std::string &frame) { handle_frame(frame); });
}

RequestRouter::~RequestRouter() {
    supervisor_.set_message_handler(nullptr);

    std::map<std::string, PendingRequest> abandoned;
    {
        std::lock_guard<std::mutex> lock(pending_->mutex);
        abandoned.swap(pending_->requests);
    }
    for (auto &entry : abandoned) {
        timers_.cancel(entry.second.deadline_timer);
        RequestResult result;
        result.error_message = "Request router shut down before a response arrived.";
        result.error_code = IPC_CLIENT_NOT_CONNECTED;
        entry.second.promise.set_value(result);
    }
}

std::future<RequestResult> RequestRouter::send(const std::string &command, const json &payload) {
    if (!supervisor_.ensure_connected()) {
        return failed_future("IPC client is not connected to the server.", IPC_CLIENT_NOT_CONNECTED);
    }

    wire_protocol::Message request = wire_protocol::make_request(command, payload);
    const std::string message_id = request.message_id;

    std::future<RequestResult> future;
    {
        std::lock_guard<std::mutex> lock(pending_->mutex);
        PendingRequest &pending = pending_->requests[message_id];
        pending.command = command;
        future = pending.promise.get_future();

        std::weak_ptr<PendingTable> weak_table = pending_;
        timer_queue::TimerQueue &timers = timers_;
        int timeout_milliseconds = request_timeout_milliseconds_;
        pending.deadline_timer = timers_.schedule(
            std::chrono::milliseconds(timeout_milliseconds),
            [weak_table, &timers, message_id, command, timeout_milliseconds]() {
                std::shared_ptr<PendingTable> table = weak_table.lock();
                if (!table) {
                    return;
                }
                RequestResult result;
                result.error_message = "Request '" + command + "' timed out after " +
                                       std::to_string(timeout_milliseconds) + " ms.";
                result.error_code = IPC_REQUEST_TIMEOUT;
                if (complete(table, timers, message_id, result)) {
                    debug_log::log_message("Warning: " + result.error_message);
                }
            });
    }

    debug_log::log("Router: sending " + command + " id=" + message_id);
    if (!supervisor_.send_text(wire_protocol::encode(request))) {
        RequestResult result;
        result.error_message = "Failed to send request '" + command + "': connection is not open.";
        result.error_code = IPC_CLIENT_NOT_CONNECTED;
        complete(pending_, timers_, message_id, result);
    }
    return future;
}

RequestResult RequestRouter::send_and_wait(const std::string &command, const json &payload) {
    return send(command, payload).get();
}

// Removes the pending entry and settles its promise. Returns false if the id was already settled.
bool RequestRouter::complete(const std::shared_ptr<PendingTable> &table, timer_queue::TimerQueue &timers,
                             const std::string &message_id, RequestResult result) {
    PendingRequest pending;
    {
        std::lock_guard<std::mutex> lock(table->mutex);
        auto request_iterator = table->requests.find(message_id);
        if (request_iterator == table->requests.end()) {
            return false;
        }
        pending = std::move(request_iterator->second);
        table->requests.erase(request_iterator);
    }
    timers.cancel(pending.deadline_timer);
    pending.promise.set_value(std::move(result));
    return true;
}

void RequestRouter::handle_frame(const std::string &frame) {
    wire_protocol::DecodeResult decoded = wire_protocol::decode(frame);
    if (!decoded.success) {
        debug_log::log_message("Warning: Malformed frame from server (" + decoded.error_code + "): " +
                               decoded.error_message);
        if (decoded.recovered_message_id.empty()) {
            return;
        }
        RequestResult result;
        result.error_message = "Malformed response from server: " + decoded.error_message;
        result.error_code = decoded.error_code;
        complete(pending_, timers_, decoded.recovered_message_id, result);

        wire_protocol::Message error_reply = wire_protocol::make_error_response(
            decoded.recovered_message_id, decoded.error_code, decoded.error_message, decoded.recovered_command);
        if (!supervisor_.send_text(wire_protocol::encode(error_reply))) {
            debug_log::log("Router: could not report malformed frame; connection is closed.");
        }
        return;
    }

    const wire_protocol::Message &message = decoded.message;
    switch (message.type) {
    case wire_protocol::MessageType::Push: {
        std::lock_guard<std::mutex> lock(push_mutex_);
        if (push_handler_) {
            push_handler_(message);
        } else {
            debug_log::log("Router: push '" + message.command + "' dropped (no push handler).");
        }
        return;
    }
    case wire_protocol::MessageType::Response:
    case wire_protocol::MessageType::ErrorResponse:
        if (!complete(pending_, timers_, message.message_id, result_from_response(message))) {
            debug_log::log_message("Warning: Response for unknown or expired request id " + message.message_id +
                                   " (" + message.command + ") dropped.");
        }
        return;
    case wire_protocol::MessageType::Request:
        debug_log::log_message("Warning: Unexpected request '" + message.command + "' from server ignored.");
        if (!supervisor_.send_text(wire_protocol::encode(wire_protocol::make_error_response(
                message.message_id, wire_protocol::INVALID_MESSAGE_TYPE, "Clients do not serve requests.",
                message.command)))) {
            debug_log::log("Router: could not answer unexpected request; connection is closed.");
        }
        return;
    }
}

void RequestRouter::set_push_handler(PushHandler handler) {
    std::lock_guard<std::mutex> lock(push_mutex_);
    push_handler_ = std::move(handler);
}

size_t RequestRouter::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_->mutex);
    return pending_->requests.size();
}

} // namespace request_router
