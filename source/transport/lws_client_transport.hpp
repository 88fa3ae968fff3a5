#ifndef CTXBRIDGE_LWS_CLIENT_TRANSPORT_HPP
#define CTXBRIDGE_LWS_CLIENT_TRANSPORT_HPP

// libwebsockets client transport.
// Owns one lws_context serviced on its own thread. Probing opens one client socket per
// candidate port at once; the first to complete the WebSocket handshake is adopted and the
// rest are closed. Other threads never touch lws objects: they queue work under state_mutex_
// and wake the service thread with lws_cancel_service().

#include <atomic>
#include <cstddef>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/client_transport.hpp"

struct lws_context;
struct lws;

namespace lws_client_transport {

// Default cap on one assembled message.
constexpr size_t DEFAULT_MAX_MESSAGE_BYTES = 64 * 1024 * 1024;

class LwsClientTransport : public client_transport::ClientTransport {
public:
    // The adopted socket is closed with an error log when a message grows past max_message_bytes.
    explicit LwsClientTransport(int probe_timeout_milliseconds,
                                size_t max_message_bytes = DEFAULT_MAX_MESSAGE_BYTES);
    ~LwsClientTransport() override;

    LwsClientTransport(const LwsClientTransport &) = delete;
    LwsClientTransport &operator=(const LwsClientTransport &) = delete;

    int discover(const std::string &host, const std::vector<int> &ports) override;
    bool is_open() const override;
    bool send_text(const std::string &text) override;
    void close() override;
    void set_handlers(MessageHandler on_message, CloseHandler on_close) override;

    // Probe sockets that are still connecting (losers included, until they are torn down).
    size_t outstanding_probe_count() const;

    // Called from the lws protocol callback on the service thread; reason is an lws_callback_reasons value.
    int handle_callback(struct lws *websocket_instance, int reason, void *incoming_data, size_t incoming_length);

private:
    struct ProbeSocket {
        int port = -1;
        uint64_t round = 0;
    };

    bool ensure_started();
    void service_loop();

    // Service thread only.
    void start_requested_probes();
    void kill_all_probes();
    size_t probes_in_round(uint64_t round) const;
    void finish_round_if_exhausted(uint64_t round);
    void forget_probe(struct lws *websocket_instance);
    void handle_active_closed();

    int probe_timeout_milliseconds_;
    size_t max_message_bytes_;
    std::atomic<struct lws_context *> websocket_context_{nullptr};
    std::thread service_thread_;
    std::atomic<bool> running_{false};
    std::mutex start_mutex_;

    // Shared between callers and the service thread.
    mutable std::mutex state_mutex_;
    std::condition_variable probe_condition_;
    uint64_t probe_round_ = 0;
    bool probe_start_requested_ = false;
    std::string probe_host_;
    std::vector<int> probe_ports_;
    bool probe_round_finished_ = true;
    bool abort_probes_requested_ = false;
    int adopted_port_ = -1;
    size_t outstanding_probes_ = 0;
    bool open_ = false;
    bool close_requested_ = false;
    std::deque<std::string> outgoing_messages_;

    // Service thread only.
    std::map<struct lws *, ProbeSocket> probe_sockets_;
    struct lws *active_connection_ = nullptr;
    std::string receive_buffer_;

    // Held while a handler runs so set_handlers() waits for an in-flight call.
    std::mutex handler_mutex_;
    MessageHandler message_handler_;
    CloseHandler close_handler_;
};

} // namespace lws_client_transport

#endif // CTXBRIDGE_LWS_CLIENT_TRANSPORT_HPP
