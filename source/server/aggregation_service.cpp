#include "server/aggregation_service.hpp"
#include "server/aggregation_strategies.hpp"
#include "utils/debug_log.hpp"

#include <vector>

namespace aggregation_service {

AggregationService::AggregationService(timer_queue::TimerQueue &timers, int timeout_milliseconds,
                                       const std::string &primary_window_id)
    : timeout_milliseconds_(timeout_milliseconds), core_(std::make_shared<Core>(timers, primary_window_id)) {}

AggregationService::~AggregationService() {
    {
        std::lock_guard<std::mutex> callback_lock(core_->callback_mutex);
        core_->completion_handler = nullptr;
    }
    std::lock_guard<std::mutex> lock(core_->mutex);
    for (const auto &entry : core_->contexts) {
        core_->timers.cancel(entry.second.deadline_timer);
    }
    if (!core_->contexts.empty()) {
        debug_log::log("Aggregation: discarding " + std::to_string(core_->contexts.size()) +
                       " unfinished aggregation(s).");
    }
    core_->contexts.clear();
}

void AggregationService::set_completion_handler(CompletionHandler handler) {
    std::lock_guard<std::mutex> callback_lock(core_->callback_mutex);
    core_->completion_handler = std::move(handler);
}

std::string AggregationService::start(const std::string &original_message_id, ConnectionId requester,
                                      const std::string &command, const json &original_payload,
                                      const std::set<std::string> &expected_windows) {
    std::string aggregation_id = wire_protocol::generate_message_id();

    Context context;
    context.original_message_id = original_message_id;
    context.requester = requester;
    context.command = command;
    context.original_payload = original_payload;
    context.expected_windows = expected_windows;

    std::weak_ptr<Core> weak_core = core_;
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        context.deadline_timer = core_->timers.schedule(
            std::chrono::milliseconds(timeout_milliseconds_), [weak_core, aggregation_id]() {
                std::shared_ptr<Core> core = weak_core.lock();
                if (core) {
                    complete(core, aggregation_id, true);
                }
            });
        core_->contexts[aggregation_id] = std::move(context);
    }

    debug_log::log("Aggregation " + aggregation_id + ": started " + command + ", waiting for " +
                   std::to_string(expected_windows.size()) + " secondary window(s).");
    return aggregation_id;
}

bool AggregationService::is_complete(const Context &context) {
    if (!context.local_payload) {
        return false;
    }
    for (const auto &window_id : context.expected_windows) {
        if (context.secondary_payloads.find(window_id) == context.secondary_payloads.end()) {
            return false;
        }
    }
    return true;
}

bool AggregationService::add_local_response(const std::string &aggregation_id, const json &payload) {
    bool ready;
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        auto context_iterator = core_->contexts.find(aggregation_id);
        if (context_iterator == core_->contexts.end()) {
            debug_log::log("Aggregation " + aggregation_id + ": local answer arrived after completion; dropped.");
            return false;
        }
        context_iterator->second.local_payload = payload;
        ready = is_complete(context_iterator->second);
    }
    if (ready) {
        complete(core_, aggregation_id, false);
    }
    return true;
}

bool AggregationService::add_secondary_response(const std::string &aggregation_id, const std::string &window_id,
                                                const json &payload) {
    bool ready;
    {
        std::lock_guard<std::mutex> lock(core_->mutex);
        auto context_iterator = core_->contexts.find(aggregation_id);
        if (context_iterator == core_->contexts.end()) {
            debug_log::log("Aggregation " + aggregation_id + ": late answer from window " + window_id + "; dropped.");
            return false;
        }
        Context &context = context_iterator->second;
        if (context.expected_windows.count(window_id) == 0) {
            debug_log::log_message("Warning: Aggregation " + aggregation_id + " got an answer from unexpected window " +
                                   window_id + ".");
            return false;
        }
        if (!context.secondary_payloads.emplace(window_id, payload).second) {
            debug_log::log("Aggregation " + aggregation_id + ": duplicate answer from window " + window_id + ".");
            return false;
        }
        ready = is_complete(context);
    }
    if (ready) {
        complete(core_, aggregation_id, false);
    }
    return true;
}

size_t AggregationService::active_count() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->contexts.size();
}

void AggregationService::complete(const std::shared_ptr<Core> &core, const std::string &aggregation_id,
                                  bool timed_out) {
    Context context;
    {
        std::lock_guard<std::mutex> lock(core->mutex);
        auto context_iterator = core->contexts.find(aggregation_id);
        if (context_iterator == core->contexts.end()) {
            return;
        }
        context = std::move(context_iterator->second);
        core->contexts.erase(context_iterator);
    }
    if (!timed_out) {
        core->timers.cancel(context.deadline_timer);
    }

    std::vector<aggregation_strategies::Contribution> contributions;
    if (context.local_payload) {
        contributions.push_back({core->primary_window_id, *context.local_payload, true});
    }
    for (const auto &entry : context.secondary_payloads) {
        contributions.push_back({entry.first, entry.second, false});
    }

    if (timed_out) {
        debug_log::log_message("Warning: Aggregation " + aggregation_id + " for " + context.command +
                               " timed out with " + std::to_string(context.secondary_payloads.size()) + " of " +
                               std::to_string(context.expected_windows.size()) + " secondary answer(s).");
    } else {
        debug_log::log("Aggregation " + aggregation_id + ": all windows answered.");
    }

    json merged = aggregation_strategies::merge(context.command, contributions, core->primary_window_id,
                                                context.original_payload);
    wire_protocol::Message response = wire_protocol::make_response(
        context.original_message_id, wire_protocol::response_command_for(context.command), merged);

    std::lock_guard<std::mutex> callback_lock(core->callback_mutex);
    if (core->completion_handler) {
        core->completion_handler(context.requester, response);
    }
}

} // namespace aggregation_service
