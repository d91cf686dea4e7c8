#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>

namespace webbridge {

/**
 * Single worker thread running tasks in submission order.
 * stop() discards tasks that have not started yet.
 */
class SerialExecutor {
public:
    using Task = std::function<void()>;

    SerialExecutor();
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /// Returns false once the executor has been stopped.
    bool post(Task task);

    /// Blocks until every task posted so far has finished. Not callable from a task.
    void flush();

    void stop();

    bool is_running() const;

private:
    void worker_loop();

    mutable std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::queue<Task> tasks_;
    bool running_ = true;
    bool busy_ = false;
    std::thread worker_;
};

} // namespace webbridge
