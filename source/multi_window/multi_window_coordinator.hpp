#ifndef CTXBRIDGE_MULTI_WINDOW_COORDINATOR_HPP
#define CTXBRIDGE_MULTI_WINDOW_COORDINATOR_HPP

// Multi-window coordinator: leader election between window processes sharing one port range.
//
// Ports are tried in ascending order. For each port the window first tries to bind it; if the
// bind succeeds it is the primary. If the port is taken, the window connects and registers as a
// secondary; a port held by anything that does not speak the bridge protocol is skipped. Because
// every window walks the range in the same order, a live primary is always found before a later
// port could be bound, so at most one primary exists per range.
//
// A primary that answers but does not accept the window (limit reached, no ack in time) ends the
// round: the window stands by and starts over after the retry delay, and never binds a later port.
// A secondary that loses its primary runs the election again.

#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "client/client_transport.hpp"
#include "config/bridge_config.hpp"
#include "multi_window/peer_transport_factory.hpp"
#include "multi_window/secondary_link.hpp"
#include "server/command_dispatcher.hpp"
#include "server/listening_server.hpp"
#include "server/primary_hub.hpp"
#include "utils/timer_queue.hpp"
#include "utils/worker_pool.hpp"

namespace multi_window_coordinator {

using json = nlohmann::json;

enum class Role {
    Starting,
    Primary,
    Secondary,
    // A primary exists but did not take this window; the election is retried.
    Standby,
    Stopped
};

// "starting", "primary", "secondary", "standby", "stopped".
std::string to_string(Role role);

class MultiWindowCoordinator {
public:
    // transports must outlive the coordinator.
    MultiWindowCoordinator(const config::BridgeConfig &config, const std::string &window_id,
                           const command_dispatcher::CommandDispatcher &dispatcher,
                           peer_transport_factory::PeerTransportFactory &transports);
    ~MultiWindowCoordinator();

    MultiWindowCoordinator(const MultiWindowCoordinator &) = delete;
    MultiWindowCoordinator &operator=(const MultiWindowCoordinator &) = delete;

    // Start the election thread.
    void start();

    // Unregister or stop listening, then stop the election thread. Safe to call twice.
    void stop();

    Role role() const;

    // Wait until role() == expected. Returns false on timeout.
    bool wait_for_role(Role expected, std::chrono::milliseconds timeout) const;

    // Port this window listens on as primary, or the primary's port as secondary; -1 otherwise.
    int port() const;

    // Originate a snippet push from this window. A secondary relays it through the primary.
    bool send_snippet(const json &snippet_payload);

    size_t registered_secondary_count() const;

    const std::string &window_id() const { return window_id_; }

private:
    enum class RoundOutcome {
        Elected,
        PrimaryBusy,
        NoPortUsable
    };

    void election_loop();
    RoundOutcome run_election_round();
    bool try_become_primary(int port);
    secondary_link::RegistrationOutcome try_become_secondary(int port);
    void teardown_role();
    void request_election();
    void set_role(Role role);

    config::BridgeConfig config_;
    std::string window_id_;
    const command_dispatcher::CommandDispatcher &dispatcher_;
    peer_transport_factory::PeerTransportFactory &transports_;

    timer_queue::TimerQueue timers_;
    worker_pool::WorkerPool workers_;

    mutable std::mutex role_mutex_;
    mutable std::condition_variable role_condition_;
    Role role_ = Role::Starting;
    bool election_requested_ = false;
    bool stopping_ = false;

    // Swapped under role_mutex_, destroyed outside it.
    std::unique_ptr<listening_server::ListeningServer> server_;
    std::unique_ptr<primary_hub::PrimaryHub> hub_;
    std::unique_ptr<client_transport::ClientTransport> client_transport_;
    std::unique_ptr<secondary_link::SecondaryLink> link_;

    std::thread election_thread_;
};

} // namespace multi_window_coordinator

#endif // CTXBRIDGE_MULTI_WINDOW_COORDINATOR_HPP
