#include "utils/worker_pool.hpp"
#include "utils/debug_log.hpp"

#include <exception>

namespace worker_pool {

WorkerPool::WorkerPool(int thread_count) {
    if (thread_count < 1) {
        thread_count = 1;
    }
    for (int index = 0; index < thread_count; index++) {
        worker_threads_.emplace_back(&WorkerPool::worker_thread_func, this);
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!pool_running_) {
            return false;
        }
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return task_queue_.empty() && active_tasks_ == 0; });
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        pool_running_ = false;
    }
    queue_cv_.notify_all();
    for (auto &worker_thread : worker_threads_) {
        if (!worker_thread.joinable()) {
            continue;
        }
        if (worker_thread.get_id() == std::this_thread::get_id()) {
            worker_thread.detach();
        } else {
            worker_thread.join();
        }
    }
    worker_threads_.clear();
}

void WorkerPool::worker_thread_func() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_ && task_queue_.empty()) {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_tasks_++;
        }

        try {
            task();
        } catch (const std::exception &error) {
            debug_log::log_message(std::string("Error: Worker task failed: ") + error.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_tasks_--;
        }
        idle_cv_.notify_all();
    }
}

} // namespace worker_pool
