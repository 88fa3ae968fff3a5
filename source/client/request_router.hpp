#ifndef CTXBRIDGE_REQUEST_ROUTER_HPP
#define CTXBRIDGE_REQUEST_ROUTER_HPP

// Request router: correlates outgoing requests with incoming responses by message id.
// Each request gets its own deadline timer; a response arriving after the deadline, or for an
// id this router never issued, is logged and dropped. Pushes bypass the pending table and go
// to the push handler.

#include <nlohmann/json.hpp>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "client/connection_supervisor.hpp"
#include "protocol/wire_protocol.hpp"
#include "utils/timer_queue.hpp"

namespace request_router {

using json = nlohmann::json;

// Client-side error kinds.
constexpr const char *IPC_CLIENT_NOT_CONNECTED = "IPC_CLIENT_NOT_CONNECTED";
constexpr const char *IPC_REQUEST_TIMEOUT = "IPC_REQUEST_TIMEOUT";

// Outcome of one request: the response payload, or a human-readable error plus its code.
struct RequestResult {
    bool success = false;
    json payload;
    std::string error_message;
    std::string error_code;
};

using PushHandler = std::function<void(const wire_protocol::Message &push)>;

class RequestRouter {
public:
    RequestRouter(connection_supervisor::ConnectionSupervisor &supervisor, timer_queue::TimerQueue &timers,
                  int request_timeout_milliseconds);
    ~RequestRouter();

    RequestRouter(const RequestRouter &) = delete;
    RequestRouter &operator=(const RequestRouter &) = delete;

    // Ensure a connection, then send. The future is already failed when no connection could be made.
    std::future<RequestResult> send(const std::string &command, const json &payload);

    // send() and wait for the outcome.
    RequestResult send_and_wait(const std::string &command, const json &payload);

    // Handle one incoming frame (wired to the supervisor's message handler).
    void handle_frame(const std::string &frame);

    void set_push_handler(PushHandler handler);

    // Requests awaiting a response or their deadline.
    size_t pending_count() const;

private:
    struct PendingRequest {
        std::promise<RequestResult> promise;
        timer_queue::TimerId deadline_timer = timer_queue::INVALID_TIMER;
        std::string command;
    };

    // Shared with deadline timers so a timer firing during destruction finds an empty table.
    struct PendingTable {
        std::mutex mutex;
        std::map<std::string, PendingRequest> requests;
    };

    static bool complete(const std::shared_ptr<PendingTable> &table, timer_queue::TimerQueue &timers,
                         const std::string &message_id, RequestResult result);

    connection_supervisor::ConnectionSupervisor &supervisor_;
    timer_queue::TimerQueue &timers_;
    int request_timeout_milliseconds_;
    std::shared_ptr<PendingTable> pending_;

    std::mutex push_mutex_;
    PushHandler push_handler_;
};

} // namespace request_router

#endif // CTXBRIDGE_REQUEST_ROUTER_HPP
