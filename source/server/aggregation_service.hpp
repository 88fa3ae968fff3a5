#ifndef CTXBRIDGE_AGGREGATION_SERVICE_HPP
#define CTXBRIDGE_AGGREGATION_SERVICE_HPP

// In-flight aggregations on the primary.
// A context records the requester, the windows expected to answer and every answer received. It
// completes when the local answer and every expected window are in, or when its deadline fires;
// either way it leaves the table before the merged response is handed to the completion handler,
// so a late answer finds nothing and is dropped.

#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "protocol/wire_protocol.hpp"
#include "server/message_sink.hpp"
#include "utils/timer_queue.hpp"

namespace aggregation_service {

using json = nlohmann::json;
using message_sink::ConnectionId;

// Receives the merged response for the requester.
using CompletionHandler = std::function<void(ConnectionId requester, const wire_protocol::Message &response)>;

class AggregationService {
public:
    AggregationService(timer_queue::TimerQueue &timers, int timeout_milliseconds, const std::string &primary_window_id);
    ~AggregationService();

    AggregationService(const AggregationService &) = delete;
    AggregationService &operator=(const AggregationService &) = delete;

    void set_completion_handler(CompletionHandler handler);

    // Open a context and start its deadline. Returns the fresh aggregation id.
    std::string start(const std::string &original_message_id, ConnectionId requester, const std::string &command,
                      const json &original_payload, const std::set<std::string> &expected_windows);

    // The primary's own answer. False when the aggregation already completed.
    bool add_local_response(const std::string &aggregation_id, const json &payload);

    // A secondary's answer. False when the aggregation is gone, the window was not expected,
    // or the window already answered.
    bool add_secondary_response(const std::string &aggregation_id, const std::string &window_id, const json &payload);

    // Aggregations still waiting.
    size_t active_count() const;

    int timeout_milliseconds() const { return timeout_milliseconds_; }

private:
    struct Context {
        std::string original_message_id;
        ConnectionId requester = 0;
        std::string command;
        json original_payload;
        std::set<std::string> expected_windows;
        std::optional<json> local_payload;
        std::map<std::string, json> secondary_payloads;
        timer_queue::TimerId deadline_timer = timer_queue::INVALID_TIMER;
    };

    // Shared with deadline timers so a timer firing after destruction finds nothing.
    struct Core {
        Core(timer_queue::TimerQueue &timer_queue, const std::string &window_id)
            : timers(timer_queue), primary_window_id(window_id) {}

        timer_queue::TimerQueue &timers;
        std::string primary_window_id;
        std::mutex mutex;
        std::map<std::string, Context> contexts;
        // Held while the completion handler runs.
        std::mutex callback_mutex;
        CompletionHandler completion_handler;
    };

    static bool is_complete(const Context &context);
    static void complete(const std::shared_ptr<Core> &core, const std::string &aggregation_id, bool timed_out);

    int timeout_milliseconds_;
    std::shared_ptr<Core> core_;
};

} // namespace aggregation_service

#endif // CTXBRIDGE_AGGREGATION_SERVICE_HPP
