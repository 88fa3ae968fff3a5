#include "client/connection_supervisor.hpp"
#include "utils/debug_log.hpp"

#include <chrono>

namespace connection_supervisor {

std::string to_string(ConnectionStatus status) {
    switch (status) {
    case ConnectionStatus::Connecting:
        return "connecting";
    case ConnectionStatus::Connected:
        return "connected";
    case ConnectionStatus::DisconnectedUnexpectedly:
        return "disconnected_unexpectedly";
    case ConnectionStatus::ConnectionError:
        return "connection_error";
    case ConnectionStatus::FailedMaxRetries:
        return "failed_max_retries";
    }
    return "connection_error";
}

SupervisorOptions options_from_config(const config::BridgeConfig &config) {
    SupervisorOptions options;
    options.host = config.host;
    options.ports = config::port_range(config);
    options.max_attempts = config.max_connection_attempts;
    options.retry_delay_milliseconds = config.retry_delay_milliseconds;
    return options;
}

ConnectionSupervisor::ConnectionSupervisor(client_transport::ClientTransport &transport, SupervisorOptions options)
    : transport_(transport), options_(std::move(options)) {
    transport_.set_handlers(
        [this](const std::string &text) { handle_transport_message(text); },
        [this]() { handle_transport_closed(); });
    worker_thread_ = std::thread(&ConnectionSupervisor::worker_loop, this);
}

ConnectionSupervisor::~ConnectionSupervisor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        intentional_disconnect_ = true;
    }
    worker_condition_.notify_all();

    // Aborts a discovery in progress so the worker can exit.
    transport_.close();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    transport_.set_handlers(nullptr, nullptr);
}

bool ConnectionSupervisor::ensure_connected() {
    std::shared_future<bool> attempt_future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (state_ == ConnectionState::Connected) {
            return true;
        }
        attempt_future = attempt_in_flight_ ? attempt_future_ : start_attempt_locked();
    }
    return attempt_future.get();
}

void ConnectionSupervisor::reconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || attempt_in_flight_ || state_ == ConnectionState::Connected) {
        return;
    }
    start_attempt_locked();
}

void ConnectionSupervisor::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ConnectionState::Connected) {
            intentional_disconnect_ = true;
        }
        if (attempt_in_flight_) {
            attempt_cancelled_ = true;
        }
    }
    worker_condition_.notify_all();
    debug_log::log("Supervisor: disconnect requested.");
    transport_.close();
}

bool ConnectionSupervisor::send_text(const std::string &text) {
    if (!is_connected()) {
        return false;
    }
    return transport_.send_text(text);
}

bool ConnectionSupervisor::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ConnectionState::Connected;
}

ConnectionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int ConnectionSupervisor::connected_port() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_port_;
}

void ConnectionSupervisor::set_status_observer(StatusObserver observer) {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    status_observer_ = std::move(observer);
}

void ConnectionSupervisor::set_message_handler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(message_mutex_);
    message_handler_ = std::move(handler);
}

// Caller holds mutex_.
std::shared_future<bool> ConnectionSupervisor::start_attempt_locked() {
    attempt_promise_ = std::make_shared<std::promise<bool>>();
    attempt_future_ = attempt_promise_->get_future().share();
    attempt_in_flight_ = true;
    attempt_requested_ = true;
    attempt_cancelled_ = false;
    state_ = ConnectionState::Connecting;
    worker_condition_.notify_all();
    return attempt_future_;
}

void ConnectionSupervisor::worker_loop() {
    while (true) {
        std::shared_ptr<std::promise<bool>> attempt_promise;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            worker_condition_.wait(lock, [this] { return attempt_requested_ || stopping_; });
            if (!attempt_requested_) {
                return;
            }
            attempt_requested_ = false;
            attempt_promise = attempt_promise_;
        }

        bool connected = run_attempts();
        attempt_promise->set_value(connected);
    }
}

bool ConnectionSupervisor::run_attempts() {
    const int max_attempts = options_.max_attempts;
    std::string port_description;
    if (!options_.ports.empty()) {
        port_description = std::to_string(options_.ports.front()) + "-" + std::to_string(options_.ports.back());
    }

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || attempt_cancelled_) {
                break;
            }
            state_ = ConnectionState::Connecting;
            closed_during_attempt_ = false;
        }
        notify(ConnectionStatus::Connecting,
               "Connecting to server (attempt " + std::to_string(attempt) + " of " + std::to_string(max_attempts) + ").");

        int port = transport_.discover(options_.host, options_.ports);
        if (port >= 0) {
            bool committed = false;
            bool cancelled = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_ || attempt_cancelled_) {
                    cancelled = true;
                    intentional_disconnect_ = true;
                } else if (!closed_during_attempt_) {
                    committed = true;
                    state_ = ConnectionState::Connected;
                    connected_port_ = port;
                    attempt_in_flight_ = false;
                }
                closed_during_attempt_ = false;
            }

            if (cancelled) {
                transport_.close();
                break;
            }
            if (committed) {
                debug_log::log("Supervisor: adopted server on port " + std::to_string(port) + ".");
                notify(ConnectionStatus::Connected, "Connected to server on port " + std::to_string(port) + ".");
                return true;
            }
            notify(ConnectionStatus::ConnectionError,
                   "Connection on port " + std::to_string(port) + " closed right after opening.");
        } else {
            notify(ConnectionStatus::ConnectionError,
                   "No server reachable on ports " + port_description + " (attempt " + std::to_string(attempt) +
                       " of " + std::to_string(max_attempts) + ").");
        }

        if (attempt < max_attempts && !wait_retry_delay()) {
            break;
        }
    }

    bool stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped = stopping_ || attempt_cancelled_;
        attempt_in_flight_ = false;
        attempt_cancelled_ = false;
        state_ = ConnectionState::Disconnected;
        connected_port_ = -1;
    }
    if (stopped) {
        debug_log::log("Supervisor: connection attempt cancelled.");
    } else {
        notify(ConnectionStatus::FailedMaxRetries,
               "Failed to connect after " + std::to_string(max_attempts) + " attempts.");
    }
    return false;
}

// Returns false when the wait was cut short by stop or disconnect.
bool ConnectionSupervisor::wait_retry_delay() {
    std::unique_lock<std::mutex> lock(mutex_);
    worker_condition_.wait_for(lock, std::chrono::milliseconds(options_.retry_delay_milliseconds),
                               [this] { return stopping_ || attempt_cancelled_; });
    return !(stopping_ || attempt_cancelled_);
}

void ConnectionSupervisor::handle_transport_message(const std::string &text) {
    std::lock_guard<std::mutex> lock(message_mutex_);
    if (message_handler_) {
        message_handler_(text);
    }
}

void ConnectionSupervisor::handle_transport_closed() {
    bool intentional;
    bool during_attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        intentional = intentional_disconnect_ || stopping_;
        intentional_disconnect_ = false;
        during_attempt = attempt_in_flight_;
        if (during_attempt) {
            closed_during_attempt_ = true;
        } else {
            state_ = ConnectionState::Disconnected;
        }
        connected_port_ = -1;
    }

    if (intentional) {
        debug_log::log("Supervisor: connection closed intentionally.");
        return;
    }

    bool will_reconnect = options_.reconnect_on_unexpected_close && !during_attempt;
    notify(ConnectionStatus::DisconnectedUnexpectedly,
           will_reconnect ? "Connection closed unexpectedly. Reconnecting." : "Connection closed unexpectedly.");

    if (will_reconnect) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_ && !attempt_in_flight_ && state_ != ConnectionState::Connected) {
            start_attempt_locked();
        }
    }
}

void ConnectionSupervisor::notify(ConnectionStatus status, const std::string &detail) {
    debug_log::log("Supervisor status " + to_string(status) + ": " + detail);
    std::lock_guard<std::mutex> lock(observer_mutex_);
    if (status_observer_) {
        status_observer_(status, detail);
    }
}

} // namespace connection_supervisor
