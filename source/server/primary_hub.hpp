#ifndef CTXBRIDGE_PRIMARY_HUB_HPP
#define CTXBRIDGE_PRIMARY_HUB_HPP

// Primary hub: everything the primary window does with frames arriving on its listening socket.
// Browser requests are dispatched locally or, for workspace-wide commands while secondaries are
// registered, fanned out and aggregated. Secondary peers register here and relay their answers
// and snippet pushes through it.
//
// Every method is safe to call from several threads at once. Frames are decoded on the calling
// thread; peer registration, peer pushes and control messages are handled there too, and only
// browser requests go to the task runner, so a slow command never delays a registration ack.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

#include "protocol/wire_protocol.hpp"
#include "server/aggregation_service.hpp"
#include "server/client_registry.hpp"
#include "server/command_dispatcher.hpp"
#include "server/message_sink.hpp"
#include "server/push_relay.hpp"
#include "server/secondary_registry.hpp"
#include "utils/timer_queue.hpp"

namespace primary_hub {

using json = nlohmann::json;
using message_sink::ConnectionId;

struct HubOptions {
    std::string window_id;
    int aggregation_timeout_milliseconds = 5000;
    size_t max_secondaries = 16;
};

// Runs one task off the calling thread. Returns false when the task was not accepted.
using TaskRunner = std::function<bool(std::function<void()> task)>;

class PrimaryHub {
public:
    PrimaryHub(message_sink::MessageSink &sink, const command_dispatcher::CommandDispatcher &dispatcher,
               timer_queue::TimerQueue &timers, const HubOptions &options);
    ~PrimaryHub();

    PrimaryHub(const PrimaryHub &) = delete;
    PrimaryHub &operator=(const PrimaryHub &) = delete;

    // Must be set before the first frame arrives. Without a runner requests run inline.
    void set_task_runner(TaskRunner runner);

    void handle_connection_opened(ConnectionId connection_id, const std::string &remote_address);
    void handle_frame(ConnectionId connection_id, const std::string &frame);
    void handle_connection_closed(ConnectionId connection_id);

    // Deliver a snippet originated by this window or unwrapped from a secondary.
    bool deliver_snippet(const json &snippet_payload);

    client_registry::ClientRegistry &clients() { return clients_; }
    secondary_registry::SecondaryRegistry &secondaries() { return secondaries_; }
    aggregation_service::AggregationService &aggregations() { return aggregations_; }
    const std::string &window_id() const { return options_.window_id; }

private:
    void send_message(ConnectionId connection_id, const wire_protocol::Message &message);
    void send_error(ConnectionId connection_id, const std::string &message_id, const std::string &error_code,
                    const std::string &error_message, const std::string &original_command);

    void handle_request(ConnectionId connection_id, const wire_protocol::Message &request);
    void handle_push(ConnectionId connection_id, const wire_protocol::Message &push);
    void handle_register_secondary(ConnectionId connection_id, const wire_protocol::Message &request);
    void handle_unregister_secondary(ConnectionId connection_id, const wire_protocol::Message &request);
    void aggregate(ConnectionId connection_id, const wire_protocol::Message &request,
                   const std::vector<secondary_registry::SecondaryRegistration> &targets);

    command_registry::ClientContext context_for(ConnectionId connection_id);

    message_sink::MessageSink &sink_;
    const command_dispatcher::CommandDispatcher &dispatcher_;
    HubOptions options_;
    TaskRunner task_runner_;

    client_registry::ClientRegistry clients_;
    secondary_registry::SecondaryRegistry secondaries_;
    push_relay::PushRelay push_relay_;
    // Declared last: its destructor clears the completion handler before the tables above go away.
    aggregation_service::AggregationService aggregations_;
};

} // namespace primary_hub

#endif // CTXBRIDGE_PRIMARY_HUB_HPP
