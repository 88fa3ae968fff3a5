#ifndef CTXBRIDGE_CONNECTION_SUPERVISOR_HPP
#define CTXBRIDGE_CONNECTION_SUPERVISOR_HPP

// Connection supervisor: one logical, always-reconnecting connection to a server whose port
// lies somewhere in a small loopback port range.
//
// ensure_connected() is single-flight: concurrent callers share one in-flight attempt.
// An attempt probes the whole range, retries a bounded number of times with a fixed delay,
// then reports failed_max_retries and stays idle until re-triggered.

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/client_transport.hpp"
#include "config/bridge_config.hpp"

namespace connection_supervisor {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected
};

// Side-channel notifications for status surfacing.
enum class ConnectionStatus {
    Connecting,
    Connected,
    DisconnectedUnexpectedly,
    ConnectionError,
    FailedMaxRetries
};

// "connecting", "connected", "disconnected_unexpectedly", "connection_error", "failed_max_retries".
std::string to_string(ConnectionStatus status);

struct SupervisorOptions {
    std::string host = "127.0.0.1";
    std::vector<int> ports;
    int max_attempts = 5;
    int retry_delay_milliseconds = 3000;
    // When false an unexpected close is reported but no new attempt is scheduled.
    bool reconnect_on_unexpected_close = true;
};

SupervisorOptions options_from_config(const config::BridgeConfig &config);

using StatusObserver = std::function<void(ConnectionStatus status, const std::string &detail)>;
using MessageHandler = std::function<void(const std::string &text)>;

class ConnectionSupervisor {
public:
    ConnectionSupervisor(client_transport::ClientTransport &transport, SupervisorOptions options);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor &) = delete;
    ConnectionSupervisor &operator=(const ConnectionSupervisor &) = delete;

    // Returns true once a socket is open. Starts an attempt if none is in flight, otherwise
    // waits on the one already running.
    bool ensure_connected();

    // Start a fresh attempt without waiting (no-op while connected or while one is in flight).
    void reconnect();

    // Intentional close: no unexpected-disconnect notification, no automatic retry.
    void disconnect();

    // Send one text frame on the current socket. Returns false when not connected.
    bool send_text(const std::string &text);

    bool is_connected() const;
    ConnectionState state() const;

    // Port of the adopted socket, or -1.
    int connected_port() const;

    void set_status_observer(StatusObserver observer);
    void set_message_handler(MessageHandler handler);

private:
    std::shared_future<bool> start_attempt_locked();
    void worker_loop();
    bool run_attempts();
    bool wait_retry_delay();
    void handle_transport_message(const std::string &text);
    void handle_transport_closed();
    void notify(ConnectionStatus status, const std::string &detail);

    client_transport::ClientTransport &transport_;
    SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable worker_condition_;
    ConnectionState state_ = ConnectionState::Disconnected;
    int connected_port_ = -1;
    bool attempt_in_flight_ = false;
    bool attempt_requested_ = false;
    std::shared_ptr<std::promise<bool>> attempt_promise_;
    std::shared_future<bool> attempt_future_;
    bool intentional_disconnect_ = false;
    bool closed_during_attempt_ = false;
    bool attempt_cancelled_ = false;
    bool stopping_ = false;

    // Held while a callback runs so clearing it waits for an in-flight call.
    std::mutex observer_mutex_;
    StatusObserver status_observer_;
    std::mutex message_mutex_;
    MessageHandler message_handler_;

    // Runs connection attempts; started last so every member above is initialized.
    std::thread worker_thread_;
};

} // namespace connection_supervisor

#endif // CTXBRIDGE_CONNECTION_SUPERVISOR_HPP
