#include "transport/lws_client_transport.hpp"
#include "transport/lws_logging.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>

namespace lws_client_transport {

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;
    if (websocket_instance == nullptr) {
        return 0;
    }
    struct lws_context *context = lws_get_context(websocket_instance);
    auto *transport = static_cast<LwsClientTransport *>(lws_context_user(context));
    if (transport == nullptr) {
        return 0;
    }
    return transport->handle_callback(websocket_instance, static_cast<int>(reason), incoming_data, incoming_length);
}

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "ctxbridge-ipc",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

LwsClientTransport::LwsClientTransport(int probe_timeout_milliseconds, size_t max_message_bytes)
    : probe_timeout_milliseconds_(probe_timeout_milliseconds), max_message_bytes_(max_message_bytes) {}

LwsClientTransport::~LwsClientTransport() {
    set_handlers(nullptr, nullptr);

    struct lws_context *context = websocket_context_.load();
    if (context == nullptr) {
        return;
    }
    running_ = false;
    lws_cancel_service(context);
    if (service_thread_.joinable()) {
        service_thread_.join();
    }
    lws_context_destroy(context);
    websocket_context_ = nullptr;
}

bool LwsClientTransport::ensure_started() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (websocket_context_.load() != nullptr) {
        return true;
    }

    lws_logging::route_library_logs();

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    struct lws_context *context = lws_create_context(&context_info);
    if (context == nullptr) {
        debug_log::log_message("Error: Failed to create libwebsockets client context.");
        return false;
    }
    websocket_context_ = context;
    running_ = true;
    service_thread_ = std::thread(&LwsClientTransport::service_loop, this);
    return true;
}

void LwsClientTransport::service_loop() {
    struct lws_context *context = websocket_context_.load();
    while (running_) {
        if (lws_service(context, 0) < 0) {
            debug_log::log_message("Error: libwebsockets client service loop failed.");
            break;
        }
    }
}

int LwsClientTransport::discover(const std::string &host, const std::vector<int> &ports) {
    if (!ensure_started()) {
        return -1;
    }

    std::unique_lock<std::mutex> lock(state_mutex_);
    if (open_) {
        return adopted_port_;
    }
    probe_round_++;
    probe_host_ = host;
    probe_ports_ = ports;
    probe_start_requested_ = true;
    probe_round_finished_ = false;
    adopted_port_ = -1;
    lock.unlock();
    lws_cancel_service(websocket_context_.load());
    lock.lock();

    bool finished = probe_condition_.wait_for(lock, std::chrono::milliseconds(probe_timeout_milliseconds_),
                                              [this] { return probe_round_finished_; });
    if (!finished) {
        probe_round_finished_ = true;
        abort_probes_requested_ = true;
        lock.unlock();
        lws_cancel_service(websocket_context_.load());
        debug_log::log("Client transport: probe round timed out after " +
                       std::to_string(probe_timeout_milliseconds_) + " ms.");
        return -1;
    }
    return open_ ? adopted_port_ : -1;
}

bool LwsClientTransport::is_open() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return open_;
}

bool LwsClientTransport::send_text(const std::string &text) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!open_ || close_requested_) {
            return false;
        }
        outgoing_messages_.push_back(text);
    }
    lws_cancel_service(websocket_context_.load());
    return true;
}

void LwsClientTransport::close() {
    bool wake_service = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (open_) {
            close_requested_ = true;
            wake_service = true;
        }
        if (!probe_round_finished_) {
            probe_round_finished_ = true;
            abort_probes_requested_ = true;
            wake_service = true;
            probe_condition_.notify_all();
        }
    }
    struct lws_context *context = websocket_context_.load();
    if (wake_service && context != nullptr) {
        lws_cancel_service(context);
    }
}

void LwsClientTransport::set_handlers(MessageHandler on_message, CloseHandler on_close) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    message_handler_ = std::move(on_message);
    close_handler_ = std::move(on_close);
}

size_t LwsClientTransport::outstanding_probe_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return outstanding_probes_;
}

// --- Service thread ---

void LwsClientTransport::start_requested_probes() {
    std::string host;
    std::vector<int> ports;
    uint64_t round;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        host = probe_host_;
        ports = probe_ports_;
        round = probe_round_;
    }

    for (int port : ports) {
        struct lws_client_connect_info connect_info;
        memset(&connect_info, 0, sizeof(connect_info));
        connect_info.context = websocket_context_.load();
        connect_info.address = host.c_str();
        connect_info.port = port;
        connect_info.path = "/";
        connect_info.host = host.c_str();
        connect_info.origin = host.c_str();
        // Only a ctxbridge listener completes the handshake for this subprotocol.
        connect_info.protocol = "ctxbridge-ipc";

        struct lws *probe = lws_client_connect_via_info(&connect_info);
        if (probe == nullptr) {
            debug_log::log("Client transport: could not start probe on port " + std::to_string(port) + ".");
            continue;
        }
        probe_sockets_[probe] = ProbeSocket{port, round};
    }

    debug_log::log("Client transport: probing " + std::to_string(probes_in_round(round)) + " port(s) on " + host + ".");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        outstanding_probes_ = probe_sockets_.size();
    }
    finish_round_if_exhausted(round);
}

void LwsClientTransport::kill_all_probes() {
    for (const auto &entry : probe_sockets_) {
        lws_set_timeout(entry.first, PENDING_TIMEOUT_SHUTDOWN_FLUSH, LWS_TO_KILL_ASYNC);
    }
}

size_t LwsClientTransport::probes_in_round(uint64_t round) const {
    size_t count = 0;
    for (const auto &entry : probe_sockets_) {
        if (entry.second.round == round) {
            count++;
        }
    }
    return count;
}

// Marks the current round failed once its last probe is gone without an adoption.
void LwsClientTransport::finish_round_if_exhausted(uint64_t round) {
    size_t remaining = probes_in_round(round);
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (round == probe_round_ && remaining == 0 && !probe_round_finished_) {
        probe_round_finished_ = true;
        probe_condition_.notify_all();
    }
}

void LwsClientTransport::forget_probe(struct lws *websocket_instance) {
    auto probe_iterator = probe_sockets_.find(websocket_instance);
    if (probe_iterator == probe_sockets_.end()) {
        return;
    }
    uint64_t round = probe_iterator->second.round;
    probe_sockets_.erase(probe_iterator);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        outstanding_probes_ = probe_sockets_.size();
    }
    finish_round_if_exhausted(round);
}

void LwsClientTransport::handle_active_closed() {
    active_connection_ = nullptr;
    receive_buffer_.clear();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        open_ = false;
        adopted_port_ = -1;
        close_requested_ = false;
        outgoing_messages_.clear();
    }
    debug_log::log("Client transport: connection closed.");

    std::lock_guard<std::mutex> lock(handler_mutex_);
    if (close_handler_) {
        close_handler_();
    }
}

int LwsClientTransport::handle_callback(struct lws *websocket_instance, int reason_value, void *incoming_data,
                                        size_t incoming_length) {
    auto reason = static_cast<enum lws_callback_reasons>(reason_value);

    switch (reason) {
    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        bool start_probes;
        bool abort_probes;
        bool want_writable;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            start_probes = probe_start_requested_;
            probe_start_requested_ = false;
            abort_probes = abort_probes_requested_;
            abort_probes_requested_ = false;
            want_writable = active_connection_ != nullptr && (!outgoing_messages_.empty() || close_requested_);
        }
        if (abort_probes) {
            kill_all_probes();
        }
        if (start_probes) {
            start_requested_probes();
        }
        if (want_writable) {
            lws_callback_on_writable(active_connection_);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_ESTABLISHED: {
        auto probe_iterator = probe_sockets_.find(websocket_instance);
        if (probe_iterator == probe_sockets_.end()) {
            return -1;
        }
        ProbeSocket probe = probe_iterator->second;
        probe_sockets_.erase(probe_iterator);

        bool adopt = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            outstanding_probes_ = probe_sockets_.size();
            if (probe.round == probe_round_ && !probe_round_finished_ && !open_) {
                adopt = true;
                open_ = true;
                adopted_port_ = probe.port;
                close_requested_ = false;
                outgoing_messages_.clear();
                probe_round_finished_ = true;
                probe_condition_.notify_all();
            }
        }

        if (!adopt) {
            debug_log::log("Client transport: closing surplus probe on port " + std::to_string(probe.port) + ".");
            finish_round_if_exhausted(probe.round);
            return -1;
        }

        active_connection_ = websocket_instance;
        receive_buffer_.clear();
        kill_all_probes();
        debug_log::log("Client transport: adopted connection on port " + std::to_string(probe.port) + ".");
        break;
    }

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        if (websocket_instance != active_connection_) {
            break;
        }
        if (receive_buffer_.size() + incoming_length > max_message_bytes_) {
            std::string().swap(receive_buffer_);
            debug_log::log_message("Error: Message from the server exceeds " + std::to_string(max_message_bytes_) +
                                   " bytes; closing the connection.");
            lws_close_reason(websocket_instance, LWS_CLOSE_STATUS_MESSAGE_TOO_LARGE, nullptr, 0);
            return -1;
        }
        const char *data_pointer = static_cast<const char *>(incoming_data);
        receive_buffer_.append(data_pointer, incoming_length);

        if (lws_is_final_fragment(websocket_instance) && lws_remaining_packet_payload(websocket_instance) == 0) {
            std::string frame;
            frame.swap(receive_buffer_);
            std::lock_guard<std::mutex> lock(handler_mutex_);
            if (message_handler_) {
                message_handler_(frame);
            }
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_WRITEABLE: {
        if (websocket_instance != active_connection_) {
            break;
        }
        std::string next_message;
        bool close_now;
        bool more_pending;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            close_now = close_requested_;
            if (!close_now && !outgoing_messages_.empty()) {
                next_message = std::move(outgoing_messages_.front());
                outgoing_messages_.pop_front();
            }
            more_pending = !outgoing_messages_.empty();
        }

        if (close_now) {
            lws_close_reason(websocket_instance, LWS_CLOSE_STATUS_NORMAL, nullptr, 0);
            return -1;
        }

        if (!next_message.empty()) {
            // libwebsockets requires LWS_PRE bytes of padding before the data.
            std::vector<unsigned char> send_buffer(LWS_PRE + next_message.size());
            memcpy(send_buffer.data() + LWS_PRE, next_message.data(), next_message.size());
            int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE,
                                          next_message.size(), LWS_WRITE_TEXT);
            if (bytes_written < 0) {
                debug_log::log_message("Error: Failed to write frame to server; closing connection.");
                return -1;
            }
        }
        if (more_pending) {
            lws_callback_on_writable(websocket_instance);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        debug_log::log("Client transport: connection error: " + std::string(error_message));
        if (websocket_instance == active_connection_) {
            handle_active_closed();
        } else {
            forget_probe(websocket_instance);
        }
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
    case LWS_CALLBACK_WSI_DESTROY:
        if (websocket_instance == active_connection_) {
            handle_active_closed();
        } else {
            forget_probe(websocket_instance);
        }
        break;

    default:
        break;
    }

    return 0;
}

} // namespace lws_client_transport
