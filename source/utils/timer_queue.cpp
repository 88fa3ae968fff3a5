#include "utils/timer_queue.hpp"
#include "utils/debug_log.hpp"

#include <exception>
#include <vector>

namespace timer_queue {

TimerQueue::TimerQueue() : timer_thread_(&TimerQueue::run, this) {}

TimerQueue::~TimerQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        entries_.clear();
        deadlines_.clear();
    }
    condition_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
}

TimerId TimerQueue::schedule(std::chrono::milliseconds delay, Callback callback) {
    TimerId timer_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timer_id = next_timer_id_++;
        Clock::time_point deadline = Clock::now() + delay;
        entries_[timer_id] = Entry{deadline, std::move(callback)};
        deadlines_.emplace(deadline, timer_id);
    }
    condition_.notify_all();
    return timer_id;
}

bool TimerQueue::cancel(TimerId timer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry_iterator = entries_.find(timer_id);
    if (entry_iterator == entries_.end()) {
        return false;
    }

    auto range = deadlines_.equal_range(entry_iterator->second.deadline);
    for (auto deadline_iterator = range.first; deadline_iterator != range.second; ++deadline_iterator) {
        if (deadline_iterator->second == timer_id) {
            deadlines_.erase(deadline_iterator);
            break;
        }
    }
    entries_.erase(entry_iterator);
    return true;
}

size_t TimerQueue::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        if (deadlines_.empty()) {
            condition_.wait(lock);
            continue;
        }

        Clock::time_point next_deadline = deadlines_.begin()->first;
        if (Clock::now() < next_deadline) {
            condition_.wait_until(lock, next_deadline);
            continue;
        }

        // Collect everything due, then fire without holding the lock so callbacks may schedule or cancel.
        std::vector<Callback> due_callbacks;
        Clock::time_point now = Clock::now();
        while (!deadlines_.empty() && deadlines_.begin()->first <= now) {
            TimerId timer_id = deadlines_.begin()->second;
            deadlines_.erase(deadlines_.begin());
            auto entry_iterator = entries_.find(timer_id);
            if (entry_iterator != entries_.end()) {
                due_callbacks.push_back(std::move(entry_iterator->second.callback));
                entries_.erase(entry_iterator);
            }
        }

        lock.unlock();
        for (auto &callback : due_callbacks) {
            try {
                callback();
            } catch (const std::exception &error) {
                debug_log::log_message(std::string("Error: Timer callback failed: ") + error.what());
            }
        }
        lock.lock();
    }
}

} // namespace timer_queue
