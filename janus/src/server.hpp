#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "handler/command_registry.hpp"
#include "manifest.hpp"
#include "timeout_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace janus {

/**
 * Datagram server.
 *
 * One thread polls the bound socket and queues each datagram; a fixed pool
 * of max_concurrent_handlers workers dispatches them. When the queue already
 * holds max_queued_requests datagrams, new ones are answered with
 * resource_limit_exceeded instead of being queued.
 */
class JanusServer {
public:
    explicit JanusServer(ServerConfig config = {}, std::shared_ptr<const Manifest> manifest = nullptr);
    ~JanusServer();

    JanusServer(const JanusServer&) = delete;
    JanusServer& operator=(const JanusServer&) = delete;

    void register_handler(const std::string& command, handler::FunctionHandler::Function fn);
    void register_handler(std::unique_ptr<handler::CommandHandler> command_handler);
    bool unregister_handler(const std::string& command);
    handler::CommandRegistry& registry() { return *registry_; }

    /// Binds and starts serving. Throws JanusError (socket_error or
    /// security_violation) when the socket cannot be set up.
    void start(const std::string& socket_path);
    void stop();

    bool is_running() const { return running_.load(); }
    const std::string& socket_path() const { return socket_path_; }

    /// Hooks must be installed before start().
    ServerEvents& events() { return *events_; }

    DispatchStats stats() const;
    size_t queued() const;

private:
    void receive_loop();
    void worker_thread_func();
    void enqueue(std::string bytes);
    int send_reply(const std::string& reply_to, const std::string& bytes);

    ServerConfig config_;
    std::shared_ptr<const Manifest> manifest_;
    std::shared_ptr<handler::CommandRegistry> registry_;
    std::shared_ptr<ServerEvents> events_;
    std::shared_ptr<TimeoutManager> timeouts_;
    std::unique_ptr<Dispatcher> dispatcher_;

    std::string socket_path_;
    int server_fd_ = -1;
    int send_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    std::thread receive_thread_;

    std::vector<std::thread> worker_threads_;
    std::queue<std::string> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};
};

} // namespace janus
