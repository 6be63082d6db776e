#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <chrono>
#include <condition_variable>

namespace polyglot {

/**
 * @brief Unit of work queued on a TaskPool
 */
using Task = std::function<void()>;

/**
 * @brief Fixed-size worker pool
 *
 * Runs queued tasks off the caller's thread in FIFO order. With one worker
 * it serializes everything submitted to it, which is how an agent gets its
 * own thread of control for playback. Exceptions escaping a task are logged
 * with the pool name and do not stop the worker.
 */
class TaskPool {
public:
    /**
     * @brief Construct pool and start workers
     * @param name Name used in log lines
     * @param workers Number of worker threads (at least 1)
     */
    TaskPool(const std::string& name, size_t workers = 1);

    /**
     * @brief Destructor - drains the queue and joins workers
     */
    ~TaskPool();

    // Non-copyable
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * @brief Queue a task
     * @return false if the pool is shut down (task not queued)
     */
    bool submit(Task task);

    /**
     * @brief Wait for all pending tasks to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting tasks; queued tasks still run before workers exit
     */
    void shutdown();

private:
    void worker_thread();
    void run_task(const Task& task);

    std::string name_;
    std::atomic<bool> running_;
    size_t active_tasks_;

    std::queue<Task> task_queue_;
    mutable std::mutex queue_mutex_;  // mutable to allow locking in const methods
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace polyglot
