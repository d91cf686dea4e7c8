#include "serial_executor.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>
#include <utility>

namespace webbridge {

SerialExecutor::SerialExecutor() : worker_(&SerialExecutor::worker_loop, this) {}

SerialExecutor::~SerialExecutor() {
    stop();
}

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }
        tasks_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

void SerialExecutor::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return (tasks_.empty() && !busy_) || !running_; });
}

void SerialExecutor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && !worker_.joinable()) {
            return;
        }
        running_ = false;
        std::queue<Task> dropped;
        std::swap(tasks_, dropped);
    }
    queue_cv_.notify_all();
    idle_cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

bool SerialExecutor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void SerialExecutor::worker_loop() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return !tasks_.empty() || !running_; });
            if (!running_) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(bridge_logger(), "Effect failed: " << exc.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace webbridge
