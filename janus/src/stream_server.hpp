#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "framing.hpp"
#include "protocol.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace janus {

/**
 * SOCK_STREAM fallback transport.
 *
 * Requests arrive as length-prefixed frames; a request that carries
 * reply_to is answered with one frame on the same connection. Frames are
 * bounded by config.max_message_size and config.max_concurrent_handlers
 * sizes the worker pool.
 */
class StreamServer {
public:
    StreamServer(std::string socket_path, std::shared_ptr<Dispatcher> dispatcher, ServerConfig config = {});
    ~StreamServer();

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    /// Throws JanusError (socket_error) when the socket cannot be set up.
    void start();
    void stop();

    bool is_running() const { return running_.load(); }
    const std::string& socket_path() const { return socket_path_; }

private:
    struct Connection {
        int fd = -1;
        bool closed = false;
        std::mutex mutex;
        framing::FrameReader reader;

        explicit Connection(int client_fd, size_t max_frame_size) : fd(client_fd), reader(max_frame_size) {}
    };

    struct ClientTask {
        std::shared_ptr<Connection> connection;
        std::string request_data;
    };

    void setup_socket();
    void accept_loop();
    void worker_thread_func();
    bool read_frames(const std::shared_ptr<Connection>& connection);
    void close_connection(int fd);
    int send_response(Connection& connection, const std::string& response);

    std::string socket_path_;
    std::shared_ptr<Dispatcher> dispatcher_;
    ServerConfig config_;
    size_t thread_pool_size_;
    size_t max_frame_size_;
    int server_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};

    std::thread accept_thread_;

    std::unordered_map<int, std::shared_ptr<Connection>> connections_;
    std::mutex connections_mutex_;

    std::vector<std::thread> worker_threads_;
    std::queue<ClientTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::atomic<bool> pool_running_{false};
};

/// Sends one framed request over a fresh connection and reads one framed
/// response. Throws JanusError: socket_error on transport failure,
/// handler_timeout when no response arrives within `timeout`.
Response stream_call(const std::string& socket_path,
                     const Request& request,
                     std::chrono::milliseconds timeout,
                     size_t max_frame_size = framing::kDefaultMaxFrameSize);

} // namespace janus
