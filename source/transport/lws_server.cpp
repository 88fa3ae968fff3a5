#include "transport/lws_server.hpp"
#include "transport/lws_logging.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <cstring>

namespace lws_server {

// Per-session data allocated by libwebsockets for every accepted socket.
struct SessionData {
    ConnectionId connection_id;
};

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    if (websocket_instance == nullptr) {
        return 0;
    }
    struct lws_context *context = lws_get_context(websocket_instance);
    auto *server = static_cast<LwsServer *>(lws_context_user(context));
    if (server == nullptr) {
        return lws_callback_http_dummy(websocket_instance, reason, user_data, incoming_data, incoming_length);
    }
    return server->handle_callback(websocket_instance, static_cast<int>(reason), user_data, incoming_data,
                                   incoming_length);
}

// WebSocket protocol definition for libwebsockets.
// Clients that request no subprotocol are bound to the first entry.
static const struct lws_protocols websocket_protocols[] = {
    {
        "ctxbridge-ipc",
        websocket_callback,
        sizeof(SessionData), // per-session data size
        65536                // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

LwsServer::LwsServer(size_t max_message_bytes) : max_message_bytes_(max_message_bytes) {}

LwsServer::~LwsServer() {
    stop();
}

void LwsServer::set_handlers(ConnectionHandler on_open, MessageHandler on_message, CloseHandler on_close) {
    connection_handler_ = std::move(on_open);
    message_handler_ = std::move(on_message);
    close_handler_ = std::move(on_close);
}

int LwsServer::start(const std::string &host, const std::vector<int> &ports) {
    if (websocket_context_.load() != nullptr) {
        return bound_port_;
    }

    lws_logging::route_library_logs();

    for (int candidate_port : ports) {
        struct lws_context_creation_info context_info;
        memset(&context_info, 0, sizeof(context_info));
        context_info.port = candidate_port;
        context_info.iface = host.c_str();
        context_info.protocols = websocket_protocols;
        context_info.gid = -1;
        context_info.uid = -1;
        context_info.user = this;

        // A null context means the listen socket could not be bound.
        struct lws_context *context = lws_create_context(&context_info);
        if (context == nullptr) {
            debug_log::log("Server: port " + std::to_string(candidate_port) + " unavailable.");
            continue;
        }

        websocket_context_ = context;
        bound_port_ = candidate_port;
        running_ = true;
        service_thread_ = std::thread(&LwsServer::service_loop, this);
        debug_log::log("Server: listening on " + host + ":" + std::to_string(candidate_port) + ".");
        return candidate_port;
    }
    return -1;
}

void LwsServer::stop() {
    struct lws_context *context = websocket_context_.exchange(nullptr);
    if (context == nullptr) {
        return;
    }
    running_ = false;
    lws_cancel_service(context);
    if (service_thread_.joinable()) {
        service_thread_.join();
    }

    // Remaining sockets report LWS_CALLBACK_CLOSED on this thread while the context is destroyed.
    lws_context_destroy(context);

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.clear();
        writable_requested_.clear();
    }
    debug_log::log("Server: stopped listening on port " + std::to_string(bound_port_.load()) + ".");
    bound_port_ = -1;
}

bool LwsServer::is_running() const {
    return running_;
}

int LwsServer::port() const {
    return bound_port_;
}

void LwsServer::service_loop() {
    struct lws_context *context = websocket_context_.load();
    while (running_) {
        if (lws_service(context, 0) < 0) {
            debug_log::log_message("Error: libwebsockets server service loop failed.");
            break;
        }
    }
}

bool LwsServer::send_text(ConnectionId connection_id, const std::string &text) {
    struct lws_context *context = websocket_context_.load();
    if (context == nullptr || !running_) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto connection_iterator = connections_.find(connection_id);
        if (connection_iterator == connections_.end() || connection_iterator->second.close_requested) {
            return false;
        }
        connection_iterator->second.outgoing_messages.push_back(text);
        writable_requested_.insert(connection_id);
    }
    lws_cancel_service(context);
    return true;
}

void LwsServer::close_connection(ConnectionId connection_id) {
    struct lws_context *context = websocket_context_.load();
    if (context == nullptr) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto connection_iterator = connections_.find(connection_id);
        if (connection_iterator == connections_.end()) {
            return;
        }
        connection_iterator->second.close_requested = true;
        writable_requested_.insert(connection_id);
    }
    lws_cancel_service(context);
}

size_t LwsServer::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

int LwsServer::handle_callback(struct lws *websocket_instance, int reason_value, void *session_data,
                               void *incoming_data, size_t incoming_length) {
    auto reason = static_cast<enum lws_callback_reasons>(reason_value);
    auto *session = static_cast<SessionData *>(session_data);

    switch (reason) {
    case LWS_CALLBACK_ESTABLISHED: {
        ConnectionId connection_id;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connection_id = next_connection_id_++;
            connections_[connection_id].websocket_instance = websocket_instance;
        }
        session->connection_id = connection_id;

        char remote_address[128] = {0};
        lws_get_peer_simple(websocket_instance, remote_address, sizeof(remote_address));
        debug_log::log("Server: connection " + std::to_string(connection_id) + " opened from " +
                       std::string(remote_address) + ".");
        if (connection_handler_) {
            connection_handler_(connection_id, remote_address);
        }
        break;
    }

    case LWS_CALLBACK_RECEIVE: {
        if (session == nullptr || session->connection_id == 0) {
            break;
        }
        std::string frame;
        bool frame_complete = false;
        bool too_large = false;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto connection_iterator = connections_.find(session->connection_id);
            if (connection_iterator == connections_.end()) {
                break;
            }
            std::string &receive_buffer = connection_iterator->second.receive_buffer;
            if (receive_buffer.size() + incoming_length > max_message_bytes_) {
                std::string().swap(receive_buffer);
                too_large = true;
            } else {
                receive_buffer.append(static_cast<const char *>(incoming_data), incoming_length);
                if (lws_is_final_fragment(websocket_instance) &&
                    lws_remaining_packet_payload(websocket_instance) == 0) {
                    frame.swap(receive_buffer);
                    frame_complete = true;
                }
            }
        }
        if (too_large) {
            debug_log::log_message("Error: Message from connection " + std::to_string(session->connection_id) +
                                   " exceeds " + std::to_string(max_message_bytes_) + " bytes; closing it.");
            lws_close_reason(websocket_instance, LWS_CLOSE_STATUS_MESSAGE_TOO_LARGE, nullptr, 0);
            return -1;
        }
        if (frame_complete && message_handler_) {
            message_handler_(session->connection_id, frame);
        }
        break;
    }

    case LWS_CALLBACK_SERVER_WRITEABLE: {
        if (session == nullptr || session->connection_id == 0) {
            break;
        }
        std::string next_message;
        bool close_now = false;
        bool more_pending = false;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            auto connection_iterator = connections_.find(session->connection_id);
            if (connection_iterator == connections_.end()) {
                break;
            }
            Connection &connection = connection_iterator->second;
            if (!connection.outgoing_messages.empty()) {
                next_message = std::move(connection.outgoing_messages.front());
                connection.outgoing_messages.pop_front();
            }
            close_now = connection.close_requested && connection.outgoing_messages.empty() && next_message.empty();
            more_pending = !connection.outgoing_messages.empty() || connection.close_requested;
        }

        if (close_now) {
            lws_close_reason(websocket_instance, LWS_CLOSE_STATUS_NORMAL, nullptr, 0);
            return -1;
        }
        if (next_message.empty()) {
            break;
        }

        // libwebsockets requires LWS_PRE bytes of padding before the data.
        std::vector<unsigned char> send_buffer(LWS_PRE + next_message.size());
        memcpy(send_buffer.data() + LWS_PRE, next_message.data(), next_message.size());
        int bytes_written = lws_write(websocket_instance, send_buffer.data() + LWS_PRE, next_message.size(),
                                      LWS_WRITE_TEXT);
        if (bytes_written < 0) {
            debug_log::log_message("Error: Failed to write frame to connection " +
                                   std::to_string(session->connection_id) + "; closing it.");
            return -1;
        }
        if (more_pending) {
            lws_callback_on_writable(websocket_instance);
        }
        break;
    }

    case LWS_CALLBACK_CLOSED: {
        if (session == nullptr || session->connection_id == 0) {
            break;
        }
        ConnectionId connection_id = session->connection_id;
        session->connection_id = 0;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            connections_.erase(connection_id);
            writable_requested_.erase(connection_id);
        }
        debug_log::log("Server: connection " + std::to_string(connection_id) + " closed.");
        if (close_handler_) {
            close_handler_(connection_id);
        }
        break;
    }

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
        std::vector<struct lws *> wake_list;
        {
            std::lock_guard<std::mutex> lock(connections_mutex_);
            for (ConnectionId connection_id : writable_requested_) {
                auto connection_iterator = connections_.find(connection_id);
                if (connection_iterator != connections_.end()) {
                    wake_list.push_back(connection_iterator->second.websocket_instance);
                }
            }
            writable_requested_.clear();
        }
        for (struct lws *connection_instance : wake_list) {
            lws_callback_on_writable(connection_instance);
        }
        break;
    }

    default:
        return lws_callback_http_dummy(websocket_instance, reason, session_data, incoming_data, incoming_length);
    }

    return 0;
}

} // namespace lws_server
