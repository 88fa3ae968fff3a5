#ifndef CTXBRIDGE_TIMER_QUEUE_HPP
#define CTXBRIDGE_TIMER_QUEUE_HPP

// Cancellable one-shot timers serviced by a single background thread.
// Request deadlines, aggregation deadlines and retry delays are all scheduled here;
// each timer belongs to exactly one owner, which cancels it on early completion.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace timer_queue {

using TimerId = uint64_t;

// Never returned by schedule().
constexpr TimerId INVALID_TIMER = 0;

class TimerQueue {
public:
    using Callback = std::function<void()>;

    TimerQueue();
    ~TimerQueue();

    TimerQueue(const TimerQueue &) = delete;
    TimerQueue &operator=(const TimerQueue &) = delete;

    // Run callback once after delay on the timer thread.
    TimerId schedule(std::chrono::milliseconds delay, Callback callback);

    // Returns true if the timer was pending and will not fire.
    bool cancel(TimerId timer_id);

    // Timers scheduled and neither fired nor cancelled.
    size_t pending_count() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point deadline;
        Callback callback;
    };

    void run();

    std::map<TimerId, Entry> entries_;
    std::multimap<Clock::time_point, TimerId> deadlines_;
    TimerId next_timer_id_ = 1;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool running_ = true;
    std::thread timer_thread_;
};

} // namespace timer_queue

#endif // CTXBRIDGE_TIMER_QUEUE_HPP
