#include "server.hpp"

#include "logger.hpp"
#include "security.hpp"
#include "socket.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstring>

#include <sys/epoll.h>
#include <unistd.h>

namespace janus {

JanusServer::JanusServer(ServerConfig config, std::shared_ptr<const Manifest> manifest)
    : config_(config),
      manifest_(std::move(manifest)),
      registry_(std::make_shared<handler::CommandRegistry>()),
      events_(std::make_shared<ServerEvents>()),
      timeouts_(std::make_shared<TimeoutManager>()) {}

JanusServer::~JanusServer() {
    stop();
}

void JanusServer::register_handler(const std::string& command, handler::FunctionHandler::Function fn) {
    registry_->add(std::make_unique<handler::FunctionHandler>(command, std::move(fn)));
}

void JanusServer::register_handler(std::unique_ptr<handler::CommandHandler> command_handler) {
    registry_->add(std::move(command_handler));
}

bool JanusServer::unregister_handler(const std::string& command) {
    return registry_->remove(command);
}

void JanusServer::start(const std::string& socket_path) {
    if (running_) {
        return;
    }
    if (auto violation = security::check_socket_path(socket_path)) {
        throw JanusError(*violation);
    }

    socket_path_ = socket_path;
    server_fd_ = bind_datagram_socket(socket_path_, config_.cleanup_on_start);
    try {
        send_fd_ = open_datagram_socket();
    } catch (const JanusError&) {
        close_socket(server_fd_);
        throw;
    }

    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = server_fd_;
    if (epoll_fd_ < 0 || ::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, server_fd_, &ev) < 0) {
        int err = errno;
        close_socket(epoll_fd_);
        close_socket(send_fd_);
        close_socket(server_fd_);
        unlink_socket_path(socket_path_);
        throw JanusError(ErrorCode::socket_error, std::string("epoll setup: ") + std::strerror(err));
    }

    dispatcher_ = std::make_unique<Dispatcher>(registry_, manifest_, config_, timeouts_, events_);

    running_ = true;
    pool_running_ = true;
    size_t workers = config_.max_concurrent_handlers > 0 ? config_.max_concurrent_handlers : 1;
    for (size_t i = 0; i < workers; ++i) {
        worker_threads_.emplace_back(&JanusServer::worker_thread_func, this);
    }
    receive_thread_ = std::thread(&JanusServer::receive_loop, this);

    LOG4CPLUS_INFO(server_logger(), "Listening on " << socket_path_ << " with " << workers << " handler threads");
    if (events_->on_listening) {
        events_->on_listening(socket_path_);
    }
}

void JanusServer::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    if (receive_thread_.joinable()) {
        receive_thread_.join();
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

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped = task_queue_.size();
        std::queue<std::string>().swap(task_queue_);
    }
    if (dropped > 0) {
        LOG4CPLUS_WARN(server_logger(), "Dropped " << dropped << " queued datagrams on shutdown");
    }

    close_socket(epoll_fd_);
    close_socket(send_fd_);
    close_socket(server_fd_);
    if (config_.cleanup_on_shutdown) {
        unlink_socket_path(socket_path_);
    }
    LOG4CPLUS_INFO(server_logger(), "Stopped listening on " << socket_path_);
}

DispatchStats JanusServer::stats() const {
    return dispatcher_ ? dispatcher_->stats() : DispatchStats{};
}

size_t JanusServer::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size();
}

void JanusServer::receive_loop() {
    const int kMaxEvents = 8;
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, 100);
        if (nfds < 0) {
            if (errno != EINTR) {
                LOG4CPLUS_ERROR(server_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            if (!(events[i].events & EPOLLIN)) {
                continue;
            }
            // Drain everything that is ready; the socket is non-blocking.
            while (running_) {
                std::string bytes;
                bool truncated = false;
                try {
                    if (!receive_datagram(server_fd_, config_.max_message_size, bytes, truncated)) {
                        break;
                    }
                } catch (const JanusError& exc) {
                    LOG4CPLUS_ERROR(server_logger(), exc.what());
                    break;
                }

                if (truncated) {
                    LOG4CPLUS_WARN(server_logger(), "Datagram exceeds " << config_.max_message_size << " bytes");
                    dispatcher_->reject(bytes,
                                        StructuredError::make(ErrorCode::resource_limit_exceeded,
                                                              "Message exceeds " +
                                                                  std::to_string(config_.max_message_size) + " bytes"),
                                        [this](const std::string& reply_to, const std::string& reply) {
                                            return send_reply(reply_to, reply);
                                        });
                    continue;
                }
                enqueue(std::move(bytes));
            }
        }
    }
}

void JanusServer::enqueue(std::string bytes) {
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (task_queue_.size() < config_.max_queued_requests) {
            task_queue_.push(std::move(bytes));
            queued = true;
        }
    }
    if (queued) {
        queue_cv_.notify_one();
        return;
    }

    LOG4CPLUS_WARN(server_logger(), "Request queue full (" << config_.max_queued_requests << "), rejecting datagram");
    dispatcher_->reject(bytes,
                        StructuredError::make(ErrorCode::resource_limit_exceeded,
                                              "Server busy: " + std::to_string(config_.max_queued_requests) +
                                                  " requests already queued"),
                        [this](const std::string& reply_to, const std::string& reply) {
                            return send_reply(reply_to, reply);
                        });
}

void JanusServer::worker_thread_func() {
    const Dispatcher::ReplySink sink = [this](const std::string& reply_to, const std::string& bytes) {
        return send_reply(reply_to, bytes);
    };

    while (pool_running_) {
        std::string bytes;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || !pool_running_; });

            if (!pool_running_) {
                return;
            }

            bytes = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            dispatcher_->dispatch(bytes, sink);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Dispatch failed: " << exc.what());
        }
    }
}

int JanusServer::send_reply(const std::string& reply_to, const std::string& bytes) {
    return send_datagram(send_fd_, reply_to, bytes);
}

} // namespace janus
