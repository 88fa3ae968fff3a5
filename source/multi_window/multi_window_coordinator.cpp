#include "multi_window/multi_window_coordinator.hpp"
#include "utils/debug_log.hpp"

namespace multi_window_coordinator {

std::string to_string(Role role) {
    switch (role) {
    case Role::Starting:
        return "starting";
    case Role::Primary:
        return "primary";
    case Role::Secondary:
        return "secondary";
    case Role::Standby:
        return "standby";
    case Role::Stopped:
        return "stopped";
    }
    return "stopped";
}

MultiWindowCoordinator::MultiWindowCoordinator(const config::BridgeConfig &config, const std::string &window_id,
                                               const command_dispatcher::CommandDispatcher &dispatcher,
                                               peer_transport_factory::PeerTransportFactory &transports)
    : config_(config),
      window_id_(window_id),
      dispatcher_(dispatcher),
      transports_(transports),
      workers_(config.worker_threads) {}

MultiWindowCoordinator::~MultiWindowCoordinator() {
    stop();
    workers_.stop();
}

void MultiWindowCoordinator::start() {
    std::lock_guard<std::mutex> lock(role_mutex_);
    if (election_thread_.joinable() || stopping_) {
        return;
    }
    election_requested_ = true;
    election_thread_ = std::thread(&MultiWindowCoordinator::election_loop, this);
}

void MultiWindowCoordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(role_mutex_);
        stopping_ = true;
    }
    role_condition_.notify_all();
    if (election_thread_.joinable()) {
        election_thread_.join();
    }
    // Covers a coordinator that was never started.
    teardown_role();
    set_role(Role::Stopped);
}

Role MultiWindowCoordinator::role() const {
    std::lock_guard<std::mutex> lock(role_mutex_);
    return role_;
}

bool MultiWindowCoordinator::wait_for_role(Role expected, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(role_mutex_);
    return role_condition_.wait_for(lock, timeout, [this, expected] { return role_ == expected; });
}

int MultiWindowCoordinator::port() const {
    std::lock_guard<std::mutex> lock(role_mutex_);
    if (server_) {
        return server_->port();
    }
    if (link_) {
        return link_->primary_port();
    }
    return -1;
}

bool MultiWindowCoordinator::send_snippet(const json &snippet_payload) {
    json payload = snippet_payload.is_object() ? snippet_payload : json::object();
    if (!payload.contains("windowId")) {
        payload["windowId"] = window_id_;
    }

    std::lock_guard<std::mutex> lock(role_mutex_);
    if (hub_) {
        return hub_->deliver_snippet(payload);
    }
    if (link_) {
        return link_->forward_snippet(payload);
    }
    debug_log::log_message("Warning: Snippet dropped: window " + window_id_ + " has no role yet.");
    return false;
}

size_t MultiWindowCoordinator::registered_secondary_count() const {
    std::lock_guard<std::mutex> lock(role_mutex_);
    return hub_ ? hub_->secondaries().size() : 0;
}

void MultiWindowCoordinator::set_role(Role role) {
    {
        std::lock_guard<std::mutex> lock(role_mutex_);
        role_ = role;
    }
    role_condition_.notify_all();
}

void MultiWindowCoordinator::request_election() {
    {
        std::lock_guard<std::mutex> lock(role_mutex_);
        election_requested_ = true;
    }
    role_condition_.notify_all();
}

void MultiWindowCoordinator::election_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(role_mutex_);
            role_condition_.wait(lock, [this] { return election_requested_ || stopping_; });
            if (stopping_) {
                break;
            }
            election_requested_ = false;
        }

        teardown_role();
        set_role(Role::Starting);

        RoundOutcome outcome;
        while ((outcome = run_election_round()) != RoundOutcome::Elected) {
            std::unique_lock<std::mutex> lock(role_mutex_);
            if (stopping_) {
                break;
            }
            if (outcome == RoundOutcome::PrimaryBusy) {
                role_ = Role::Standby;
                role_condition_.notify_all();
                debug_log::log_message("Window " + window_id_ + " is on STANDBY; retrying election in " +
                                       std::to_string(config_.retry_delay_milliseconds) + " ms.");
            } else {
                debug_log::log_message("Warning: No port in range is usable; retrying election in " +
                                       std::to_string(config_.retry_delay_milliseconds) + " ms.");
            }
            role_condition_.wait_for(lock, std::chrono::milliseconds(config_.retry_delay_milliseconds),
                                     [this] { return stopping_; });
            if (stopping_) {
                break;
            }
        }
    }

    teardown_role();
}

MultiWindowCoordinator::RoundOutcome MultiWindowCoordinator::run_election_round() {
    for (int candidate_port : config::port_range(config_)) {
        {
            std::lock_guard<std::mutex> lock(role_mutex_);
            if (stopping_) {
                return RoundOutcome::NoPortUsable;
            }
        }
        if (try_become_primary(candidate_port)) {
            return RoundOutcome::Elected;
        }
        switch (try_become_secondary(candidate_port)) {
        case secondary_link::RegistrationOutcome::Registered:
            return RoundOutcome::Elected;
        case secondary_link::RegistrationOutcome::Refused:
            // Binding a later port now would make a second primary.
            return RoundOutcome::PrimaryBusy;
        case secondary_link::RegistrationOutcome::NoPrimary:
            debug_log::log("Election: port " + std::to_string(candidate_port) +
                           " is taken but no primary answered there.");
            break;
        }
    }
    return RoundOutcome::NoPortUsable;
}

bool MultiWindowCoordinator::try_become_primary(int port) {
    std::unique_ptr<listening_server::ListeningServer> server = transports_.create_server();

    primary_hub::HubOptions hub_options;
    hub_options.window_id = window_id_;
    hub_options.aggregation_timeout_milliseconds = config_.aggregation_timeout_milliseconds;
    hub_options.max_secondaries = static_cast<size_t>(config_.max_secondaries);
    auto hub = std::make_unique<primary_hub::PrimaryHub>(*server, dispatcher_, timers_, hub_options);

    // Browser requests run on the worker pool so a slow command never stalls other connections;
    // everything else, registration included, is handled on the service thread.
    worker_pool::WorkerPool &workers = workers_;
    hub->set_task_runner([&workers](std::function<void()> task) { return workers.submit(std::move(task)); });

    primary_hub::PrimaryHub *hub_pointer = hub.get();
    server->set_handlers(
        [hub_pointer](listening_server::ConnectionId connection_id, const std::string &remote_address) {
            hub_pointer->handle_connection_opened(connection_id, remote_address);
        },
        [hub_pointer](listening_server::ConnectionId connection_id, const std::string &text) {
            hub_pointer->handle_frame(connection_id, text);
        },
        [hub_pointer](listening_server::ConnectionId connection_id) {
            hub_pointer->handle_connection_closed(connection_id);
        });

    if (server->start(config_.host, {port}) < 0) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(role_mutex_);
        server_ = std::move(server);
        hub_ = std::move(hub);
        role_ = Role::Primary;
    }
    role_condition_.notify_all();
    debug_log::log_message("Window " + window_id_ + " is PRIMARY on " + config_.host + ":" + std::to_string(port) + ".");
    return true;
}

secondary_link::RegistrationOutcome MultiWindowCoordinator::try_become_secondary(int port) {
    std::unique_ptr<client_transport::ClientTransport> transport = transports_.create_client();

    secondary_link::LinkOptions link_options;
    link_options.host = config_.host;
    link_options.ports = {port};
    link_options.request_timeout_milliseconds = config_.request_timeout_milliseconds;
    link_options.registration_timeout_milliseconds = config_.probe_timeout_milliseconds;
    auto link = std::make_unique<secondary_link::SecondaryLink>(window_id_, *transport, timers_, link_options,
                                                                dispatcher_, workers_);
    link->set_lost_handler([this]() { request_election(); });

    secondary_link::RegistrationOutcome outcome = link->connect_and_register();
    if (outcome != secondary_link::RegistrationOutcome::Registered) {
        link.reset();
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(role_mutex_);
        client_transport_ = std::move(transport);
        link_ = std::move(link);
        role_ = Role::Secondary;
    }
    role_condition_.notify_all();
    return outcome;
}

void MultiWindowCoordinator::teardown_role() {
    std::unique_ptr<listening_server::ListeningServer> server;
    std::unique_ptr<primary_hub::PrimaryHub> hub;
    std::unique_ptr<client_transport::ClientTransport> transport;
    std::unique_ptr<secondary_link::SecondaryLink> link;
    {
        std::lock_guard<std::mutex> lock(role_mutex_);
        server.swap(server_);
        hub.swap(hub_);
        transport.swap(client_transport_);
        link.swap(link_);
    }

    if (link) {
        link->unregister_and_disconnect();
        link.reset();
        transport.reset();
    }
    if (server) {
        // Stopping first guarantees no frame reaches the hub after the pool drains.
        server->stop();
        workers_.wait_idle();
        hub.reset();
        server.reset();
        debug_log::log_message("Window " + window_id_ + " stopped serving as primary.");
    }
}

} // namespace multi_window_coordinator
