#include "task_pool.h"
#include "logger.h"

namespace polyglot {

TaskPool::TaskPool(const std::string& name, size_t workers)
    : name_(name), running_(true), active_tasks_(0) {
    if (workers == 0) {
        workers = 1;
    }
    for (size_t i = 0; i < workers; ++i) {
        worker_threads_.emplace_back(&TaskPool::worker_thread, this);
    }
}

TaskPool::~TaskPool() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool TaskPool::submit(Task task) {
    if (!task) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            Logger::warn("TaskPool " + name_ + " is shut down, dropping task");
            return false;
        }
        task_queue_.push(std::move(task));
    }

    queue_cv_.notify_one();
    return true;
}

bool TaskPool::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return task_queue_.empty() && active_tasks_ == 0; };

    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void TaskPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
}

void TaskPool::worker_thread() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            if (task_queue_.empty()) {
                // Shut down and drained
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_tasks_++;
        }

        run_task(task);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_tasks_--;
        }
        idle_cv_.notify_all();
    }
}

void TaskPool::run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        Logger::error("TaskPool " + name_ + " task threw: " + e.what());
    }
}

} // namespace polyglot
