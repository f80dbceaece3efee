#include "stream_server.hpp"

#include "codec.hpp"
#include "logger.hpp"
#include "socket.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace janus {

namespace {

bool write_all(int fd, const std::string& bytes) {
    size_t offset = 0;
    while (offset < bytes.size()) {
        ssize_t written = ::send(fd, bytes.data() + offset, bytes.size() - offset, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

} // namespace

StreamServer::StreamServer(std::string socket_path, std::shared_ptr<Dispatcher> dispatcher, ServerConfig config)
    : socket_path_(std::move(socket_path)),
      dispatcher_(std::move(dispatcher)),
      config_(config),
      thread_pool_size_(config.max_concurrent_handlers > 0 ? config.max_concurrent_handlers : 4),
      max_frame_size_(config.max_message_size > 0 ? config.max_message_size : framing::kDefaultMaxFrameSize) {}

StreamServer::~StreamServer() {
    stop();
}

void StreamServer::setup_socket() {
    sockaddr_un addr = make_unix_address(socket_path_);

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw JanusError(ErrorCode::socket_error, std::string("socket: ") + std::strerror(errno));
    }

    if (config_.cleanup_on_start) {
        unlink_socket_path(socket_path_);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close_socket(server_fd_);
        throw JanusError(ErrorCode::socket_error, "bind " + socket_path_ + ": " + std::strerror(err));
    }

    if (::listen(server_fd_, 8) < 0) {
        int err = errno;
        close_socket(server_fd_);
        throw JanusError(ErrorCode::socket_error, std::string("listen: ") + std::strerror(err));
    }
}

void StreamServer::start() {
    if (running_) {
        return;
    }

    setup_socket();

    // Create epoll instance for monitoring client connections
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (epoll_fd_ < 0 || ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        int err = errno;
        close_socket(epoll_fd_);
        close_socket(server_fd_);
        unlink_socket_path(socket_path_);
        throw JanusError(ErrorCode::socket_error, std::string("epoll setup: ") + std::strerror(err));
    }

    running_ = true;

    pool_running_ = true;
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back(&StreamServer::worker_thread_func, this);
    }

    accept_thread_ = std::thread(&StreamServer::accept_loop, this);
    LOG4CPLUS_INFO(server_logger(), "Stream transport listening on " << socket_path_);
}

void StreamServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

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

    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& entry : connections_) {
            std::lock_guard<std::mutex> conn_lock(entry.second->mutex);
            ::close(entry.second->fd);
            entry.second->closed = true;
        }
        connections_.clear();
    }

    close_socket(epoll_fd_);
    close_socket(server_fd_);
    if (config_.cleanup_on_shutdown) {
        unlink_socket_path(socket_path_);
    }
}

bool StreamServer::read_frames(const std::shared_ptr<Connection>& connection) {
    char buffer[8192];
    ssize_t received = ::read(connection->fd, buffer, sizeof(buffer));
    if (received <= 0) {
        return false;
    }
    connection->reader.append(buffer, static_cast<size_t>(received));

    try {
        while (auto frame = connection->reader.next()) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                task_queue_.push({connection, std::move(*frame)});
            }
            queue_cv_.notify_one();
        }
    } catch (const JanusError& exc) {
        LOG4CPLUS_WARN(server_logger(), "Closing stream connection: " << exc.what());
        return false;
    }
    return true;
}

int StreamServer::send_response(Connection& connection, const std::string& response) {
    std::string frame;
    try {
        frame = framing::encode_frame(response, max_frame_size_);
    } catch (const JanusError& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Cannot frame response: " << exc.what());
        return EMSGSIZE;
    }

    std::lock_guard<std::mutex> lock(connection.mutex);
    if (connection.closed) {
        return ENOTCONN;
    }
    return write_all(connection.fd, frame) ? 0 : errno;
}

void StreamServer::worker_thread_func() {
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

        // Replies always go back on the originating connection.
        std::shared_ptr<Connection> connection = task.connection;
        try {
            dispatcher_->dispatch(task.request_data, [this, connection](const std::string&, const std::string& bytes) {
                return send_response(*connection, bytes);
            });
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Stream dispatch failed: " << exc.what());
        }
    }
}

void StreamServer::close_connection(int fd) {
    ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);

    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(fd);
        if (it == connections_.end()) {
            return;
        }
        connection = it->second;
        connections_.erase(it);
    }

    std::lock_guard<std::mutex> lock(connection->mutex);
    if (!connection->closed) {
        ::close(connection->fd);
        connection->closed = true;
    }
}

void StreamServer::accept_loop() {
    // Use epoll to efficiently handle all connections and requests in a single thread
    const int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, MAX_EVENTS, 100);
        if (nfds < 0) {
            if (running_ && errno != EINTR) {
                LOG4CPLUS_ERROR(server_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;

            if (fd == server_fd_) {
                int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
                if (client_fd < 0) {
                    LOG4CPLUS_WARN(server_logger(), "accept: " << std::strerror(errno));
                    continue;
                }

                epoll_event cli_ev{};
                cli_ev.events = EPOLLIN | EPOLLRDHUP;
                cli_ev.data.fd = client_fd;
                if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cli_ev) < 0) {
                    LOG4CPLUS_WARN(server_logger(), "epoll_ctl ADD client: " << std::strerror(errno));
                    ::close(client_fd);
                    continue;
                }

                std::lock_guard<std::mutex> lock(connections_mutex_);
                connections_[client_fd] = std::make_shared<Connection>(client_fd, max_frame_size_);
                continue;
            }

            std::shared_ptr<Connection> connection;
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                auto it = connections_.find(fd);
                if (it != connections_.end()) {
                    connection = it->second;
                }
            }
            if (!connection) {
                continue;
            }

            // Consume any data before honouring a hang-up so the last request is served.
            if (events[i].events & EPOLLIN) {
                if (!read_frames(connection)) {
                    close_connection(fd);
                    continue;
                }
            }
            if (events[i].events & (EPOLLRDHUP | EPOLLERR | EPOLLHUP)) {
                close_connection(fd);
            }
        }
    }
}

Response stream_call(const std::string& socket_path,
                     const Request& request,
                     std::chrono::milliseconds timeout,
                     size_t max_frame_size) {
    sockaddr_un addr = make_unix_address(socket_path);
    // Encoding may throw; do it before there is a descriptor to leak.
    const std::string frame = framing::encode_frame(codec::encode_request(request), max_frame_size);

    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw JanusError(ErrorCode::socket_error, std::string("socket: ") + std::strerror(errno));
    }

    auto fail = [&fd](ErrorCode code, const std::string& details) {
        close_socket(fd);
        throw JanusError(code, details);
    };

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        fail(ErrorCode::socket_error, "connect " + socket_path + ": " + std::strerror(errno));
    }
    if (!write_all(fd, frame)) {
        fail(ErrorCode::socket_error, std::string("write: ") + std::strerror(errno));
    }

    framing::FrameReader reader(max_frame_size);
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char buffer[8192];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                               std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            fail(ErrorCode::handler_timeout, "no response within " + std::to_string(timeout.count()) + "ms");
        }

        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail(ErrorCode::socket_error, std::string("poll: ") + std::strerror(errno));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t received = ::read(fd, buffer, sizeof(buffer));
        if (received <= 0) {
            fail(ErrorCode::socket_error, "connection closed before a response arrived");
        }
        reader.append(buffer, static_cast<size_t>(received));

        std::optional<std::string> frame;
        try {
            frame = reader.next();
        } catch (const JanusError&) {
            close_socket(fd);
            throw;
        }
        if (frame) {
            close_socket(fd);
            return codec::decode_response(*frame);
        }
    }
}

} // namespace janus
