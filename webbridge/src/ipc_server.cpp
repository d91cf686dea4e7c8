#include "ipc_server.hpp"

#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <arpa/inet.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace webbridge::ipc {

namespace {

constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;

bool write_all(int fd, const char* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t chunk = ::send(fd, data + offset, len - offset, MSG_NOSIGNAL);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

bool read_all(int fd, char* data, size_t len) {
    size_t offset = 0;
    while (offset < len) {
        ssize_t chunk = ::read(fd, data + offset, len - offset);
        if (chunk < 0 && errno == EINTR) {
            continue;
        }
        if (chunk <= 0) {
            return false;
        }
        offset += static_cast<size_t>(chunk);
    }
    return true;
}

} // namespace

IpcServer::IpcServer(std::string socket_path, RequestHandler handler, size_t thread_pool_size)
    : socket_path_(std::move(socket_path)),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4) {}

IpcServer::~IpcServer() {
    stop();
}

bool IpcServer::setup_socket() {
    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        LOG4CPLUS_ERROR(ipc_logger(), "socket: " << std::strerror(errno));
        return false;
    }

    ::unlink(socket_path_.c_str());

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", socket_path_.c_str());

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LOG4CPLUS_ERROR(ipc_logger(), "bind " << socket_path_ << ": " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 8) < 0) {
        LOG4CPLUS_ERROR(ipc_logger(), "listen: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

bool IpcServer::start() {
    if (running_) {
        return true;
    }

    if (!setup_socket()) {
        return false;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        LOG4CPLUS_ERROR(ipc_logger(), "epoll_create1: " << std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        LOG4CPLUS_ERROR(ipc_logger(), "epoll_ctl ADD server_fd: " << std::strerror(errno));
        ::close(epoll_fd_);
        epoll_fd_ = -1;
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    running_ = true;

    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&IpcServer::worker_thread_func, this);
    }

    accept_thread_ = std::thread(&IpcServer::accept_loop, this);

    return true;
}

void IpcServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    // Accept thread wakes up within one epoll timeout
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (pool_running_) {
        pool_running_ = false;
        queue_cv_.notify_all();
        for (auto& t : worker_threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        worker_threads_.clear();
    }

    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
        ::close(server_fd_);
        server_fd_ = -1;
    }

    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        for (int fd : client_fds_) {
            ::close(fd);
        }
        client_fds_.clear();
        write_mutexes_.clear();
    }

    if (epoll_fd_ >= 0) {
        ::close(epoll_fd_);
        epoll_fd_ = -1;
    }

    ::unlink(socket_path_.c_str());
}

void IpcServer::close_client(int client_fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, client_fd, nullptr);

    std::lock_guard<std::mutex> lock(client_fds_mutex_);
    if (client_fds_.erase(client_fd) != 0) {
        ::close(client_fd);
    }
}

bool IpcServer::read_request(int client_fd, std::string& request_data) {
    // Length-prefixed frame, 4 bytes big endian
    uint32_t length_be = 0;
    if (!read_all(client_fd, reinterpret_cast<char*>(&length_be), sizeof(length_be))) {
        return false;
    }

    uint32_t length = ntohl(length_be);
    if (length > kMaxFrameSize) {
        LOG4CPLUS_WARN(ipc_logger(), "Frame too large (" << length << " bytes), closing connection");
        return false;
    }

    request_data.resize(length);
    return length == 0 || read_all(client_fd, &request_data[0], length);
}

bool IpcServer::send_response(int client_fd, const std::string& response) {
    std::mutex* write_mutex = nullptr;
    {
        std::lock_guard<std::mutex> lock(client_fds_mutex_);
        if (client_fds_.count(client_fd) == 0) {
            return false;
        }
        auto& slot = write_mutexes_[client_fd];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        write_mutex = slot.get();
    }

    std::lock_guard<std::mutex> lock(*write_mutex);
    uint32_t resp_len_be = htonl(static_cast<uint32_t>(response.size()));
    if (!write_all(client_fd, reinterpret_cast<const char*>(&resp_len_be), sizeof(resp_len_be))) {
        return false;
    }
    return response.empty() || write_all(client_fd, response.data(), response.size());
}

void IpcServer::handle_client_request(int client_fd, const std::string& request_data) {
    std::string response;

    try {
        response = handler_(request_data);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(ipc_logger(), "Request handler error: " << e.what());
        response = codec::encode_error_response(codec::peek_request_id(request_data), "Internal error");
    }

    if (!send_response(client_fd, response)) {
        LOG4CPLUS_WARN(ipc_logger(), "Failed to send response on fd " << client_fd);
    }
}

void IpcServer::worker_thread_func() {
    while (pool_running_) {
        ClientTask task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_ && task_queue_.empty()) {
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        handle_client_request(task.client_fd, task.request_data);
    }
}

void IpcServer::accept_loop() {
    const int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, 1000); // 1s timeout
        if (nfds < 0) {
            if (running_ && errno != EINTR) {
                LOG4CPLUS_ERROR(ipc_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
                if (client_fd < 0) {
                    LOG4CPLUS_WARN(ipc_logger(), "accept: " << std::strerror(errno));
                    continue;
                }

                epoll_event cli_ev{};
                cli_ev.events = EPOLLIN | EPOLLRDHUP;
                cli_ev.data.fd = client_fd;
                if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cli_ev) < 0) {
                    LOG4CPLUS_WARN(ipc_logger(), "epoll_ctl ADD client_fd: " << std::strerror(errno));
                    ::close(client_fd);
                    continue;
                }

                std::lock_guard<std::mutex> lock(client_fds_mutex_);
                client_fds_.insert(client_fd);
                continue;
            }

            if (events[i].events & EPOLLIN) {
                std::string request_data;
                if (read_request(fd, request_data)) {
                    {
                        std::lock_guard<std::mutex> lock(queue_mutex_);
                        task_queue_.push({fd, std::move(request_data)});
                    }
                    queue_cv_.notify_one();
                    continue;
                }
                close_client(fd);
                continue;
            }

            if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                close_client(fd);
            }
        }
    }
}

} // namespace webbridge::ipc
