#ifndef CTXBRIDGE_LWS_SERVER_HPP
#define CTXBRIDGE_LWS_SERVER_HPP

// libwebsockets listening server bound to the first free port of a range.
// One lws_context per started server, serviced on its own thread. Handlers run on the service
// thread and must not block; outgoing frames are queued per connection and written from
// LWS_CALLBACK_SERVER_WRITEABLE.

#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "server/listening_server.hpp"

struct lws_context;
struct lws;

namespace lws_server {

using message_sink::ConnectionId;

// Default cap on one assembled message.
constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 64 * 1024 * 1024;

class LwsServer : public listening_server::ListeningServer {
public:
    // A connection whose message grows past max_message_bytes is closed with an error log.
    explicit LwsServer(size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES);
    ~LwsServer() override;

    LwsServer(const LwsServer &) = delete;
    LwsServer &operator=(const LwsServer &) = delete;

    void set_handlers(ConnectionHandler on_open, MessageHandler on_message, CloseHandler on_close) override;

    int start(const std::string &host, const std::vector<int> &ports) override;

    // Close every connection, stop the service thread and release the port. Safe to call twice.
    void stop() override;

    bool is_running() const;
    int port() const override;

    bool send_text(ConnectionId connection_id, const std::string &text) override;

    // Close one connection from the server side.
    void close_connection(ConnectionId connection_id);

    size_t connection_count() const;

    // Called from the lws protocol callback on the service thread; reason is an lws_callback_reasons value.
    int handle_callback(struct lws *websocket_instance, int reason, void *session_data, void *incoming_data,
                        size_t incoming_length);

private:
    struct Connection {
        struct lws *websocket_instance = nullptr;
        std::deque<std::string> outgoing_messages;
        std::string receive_buffer;
        bool close_requested = false;
    };

    void service_loop();

    size_t max_message_bytes_;
    std::atomic<struct lws_context *> websocket_context_{nullptr};
    std::thread service_thread_;
    std::atomic<bool> running_{false};
    std::atomic<int> bound_port_{-1};

    mutable std::mutex connections_mutex_;
    std::map<ConnectionId, Connection> connections_;
    std::set<ConnectionId> writable_requested_;
    ConnectionId next_connection_id_ = 1;

    ConnectionHandler connection_handler_;
    MessageHandler message_handler_;
    CloseHandler close_handler_;
};

} // namespace lws_server

#endif // CTXBRIDGE_LWS_SERVER_HPP
