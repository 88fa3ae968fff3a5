#ifndef CTXBRIDGE_SECONDARY_LINK_HPP
#define CTXBRIDGE_SECONDARY_LINK_HPP

// A secondary window's connection to the primary.
// Registers this window, answers forwarded requests against the local workspace, and relays
// snippet pushes the primary must deliver. Loss of the connection is reported once through the
// lost handler; the link never reconnects on its own, because the coordinator re-runs election.

#include <nlohmann/json.hpp>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "client/client_transport.hpp"
#include "client/connection_supervisor.hpp"
#include "client/request_router.hpp"
#include "server/command_dispatcher.hpp"
#include "utils/timer_queue.hpp"
#include "utils/worker_pool.hpp"

namespace secondary_link {

using json = nlohmann::json;

struct LinkOptions {
    std::string host = "127.0.0.1";
    std::vector<int> ports;
    int request_timeout_milliseconds = 30000;
    // Bound on waiting for register/unregister acknowledgements.
    int registration_timeout_milliseconds = 2000;
};

using LostHandler = std::function<void()>;

enum class RegistrationOutcome {
    Registered,
    // A primary holds the port but did not accept this window: it refused, failed, went away
    // mid-handshake, or did not acknowledge in time.
    Refused,
    // Nothing speaking the bridge protocol accepted a connection on the port.
    NoPrimary
};

// "registered", "refused", "no_primary".
std::string to_string(RegistrationOutcome outcome);

class SecondaryLink {
public:
    SecondaryLink(const std::string &window_id, client_transport::ClientTransport &transport,
                  timer_queue::TimerQueue &timers, const LinkOptions &options,
                  const command_dispatcher::CommandDispatcher &dispatcher, worker_pool::WorkerPool &workers);
    ~SecondaryLink();

    SecondaryLink(const SecondaryLink &) = delete;
    SecondaryLink &operator=(const SecondaryLink &) = delete;

    // Connect to the primary and send register_secondary.
    RegistrationOutcome connect_and_register();

    // Wrap a snippet as forward_push_to_primary. False when the link is down.
    bool forward_snippet(const json &snippet_payload);

    // Send unregister_secondary (waiting briefly for the ack), then close without reporting a loss.
    void unregister_and_disconnect();

    bool is_registered() const;

    // Port of the primary, or -1.
    int primary_port() const;

    void set_lost_handler(LostHandler handler);

private:
    void handle_push(const wire_protocol::Message &push);
    void handle_status(connection_supervisor::ConnectionStatus status, const std::string &detail);
    void run_forwarded_request(const json &forward_payload);

    std::string window_id_;
    LinkOptions options_;
    const command_dispatcher::CommandDispatcher &dispatcher_;
    worker_pool::WorkerPool &workers_;

    connection_supervisor::ConnectionSupervisor supervisor_;
    request_router::RequestRouter router_;
    std::atomic<bool> registered_{false};

    // Held while the lost handler runs.
    std::mutex lost_mutex_;
    LostHandler lost_handler_;
};

} // namespace secondary_link

#endif // CTXBRIDGE_SECONDARY_LINK_HPP
