#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace webbridge::ipc {

class IpcServer {
public:
    /// Request handler: one decoded frame in, one frame out
    using RequestHandler = std::function<std::string(const std::string& request_bytes)>;

    /**
     * Construct IpcServer with a request handler.
     *
     * @param socket_path Path to the Unix domain socket
     * @param handler Request handler, called from worker threads
     * @param thread_pool_size Number of worker threads (0 is treated as 4)
     */
    IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size = 4);
    ~IpcServer();

    IpcServer(const IpcServer&) = delete;
    IpcServer& operator=(const IpcServer&) = delete;

    /// Start the accept thread and the worker pool
    bool start();

    /// Stop the server
    void stop();

    /// Get the socket path
    const std::string& socket_path() const { return socket_path_; }

private:
    struct ClientTask {
        int client_fd;
        std::string request_data;
    };

    std::string socket_path_;
    RequestHandler handler_;
    size_t thread_pool_size_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    // Accept thread
    std::thread accept_thread_;

    // Thread pool members
    std::vector<std::thread> worker_threads_;
    std::queue<ClientTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};

    // Open client connections
    std::unordered_set<int> client_fds_;
    std::mutex client_fds_mutex_;

    // One writer per connection at a time
    std::unordered_map<int, std::unique_ptr<std::mutex>> write_mutexes_;

    bool setup_socket();
    void accept_loop();
    void worker_thread_func();
    void close_client(int client_fd);
    bool read_request(int client_fd, std::string& request_data);
    bool send_response(int client_fd, const std::string& response);
    void handle_client_request(int client_fd, const std::string& request_data);
};

} // namespace webbridge::ipc
