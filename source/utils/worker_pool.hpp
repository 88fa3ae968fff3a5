#ifndef CTXBRIDGE_WORKER_POOL_HPP
#define CTXBRIDGE_WORKER_POOL_HPP

// Fixed-size thread pool running queued tasks in FIFO order.
// Keeps command execution off the WebSocket service threads.

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace worker_pool {

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int thread_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Queue a task. Returns false once stop() has been called.
    bool submit(Task task);

    // Block until the queue is empty and no task is running. Must not be called from a task.
    void wait_idle();

    // Finish queued tasks and join all threads. Safe to call more than once.
    void stop();

private:
    void worker_thread_func();

    std::vector<std::thread> worker_threads_;
    std::queue<Task> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    int active_tasks_ = 0;
    bool pool_running_ = true;
};

} // namespace worker_pool

#endif // CTXBRIDGE_WORKER_POOL_HPP
