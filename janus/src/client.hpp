#pragma once

#include "config.hpp"
#include "error.hpp"
#include "manifest.hpp"
#include "one_shot.hpp"
#include "protocol.hpp"
#include "timeout_manager.hpp"
#include "validator.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

namespace janus {

enum class RequestState {
    created,
    sent,
    completed,
    timed_out,
    cancelled,
};

const char* request_state_name(RequestState state);

struct RequestOutcome {
    RequestState state = RequestState::created;
    std::optional<Response> response;   // set only for completed
    std::chrono::milliseconds timeout{0};
};

/**
 * Caller-side token for one outstanding request.
 *
 * The client keeps the authoritative pending entry; the handle can only be
 * queried, waited on or cancelled through the client that issued it.
 */
class RequestHandle {
public:
    const std::string& command() const { return command_; }
    std::chrono::system_clock::time_point created_at() const { return created_at_; }
    RequestState state() const { return state_.load(); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    friend class JanusClient;

    RequestHandle(std::string id, std::string command)
        : id_(std::move(id)), command_(std::move(command)), created_at_(std::chrono::system_clock::now()) {}

    std::string id_;
    std::string command_;
    std::chrono::system_clock::time_point created_at_;
    std::atomic<RequestState> state_{RequestState::created};
    std::atomic<bool> cancelled_{false};
    OneShot<RequestOutcome> outcome_;
};

struct ClientStatistics {
    size_t pending = 0;
    uint64_t completed = 0;
    uint64_t timed_out = 0;
    uint64_t cancelled = 0;
    double average_response_time = 0.0;   // seconds, completed requests only
};

/**
 * Datagram client.
 *
 * Each request that expects an answer binds its own reply socket. A single
 * receiver thread waits on all of them with epoll and a shared
 * TimeoutManager enforces the deadlines. Response, timeout and cancellation
 * all race to remove the pending entry; whoever removes it resolves the
 * request and the others become no-ops.
 */
class JanusClient {
public:
    using TimeoutCallback = std::function<void(const std::string& request_id, std::chrono::milliseconds timeout)>;

    /// Throws JanusError (security_violation, socket_error).
    explicit JanusClient(std::string socket_path,
                         ClientConfig config = {},
                         std::shared_ptr<const Manifest> manifest = nullptr);
    ~JanusClient();

    JanusClient(const JanusClient&) = delete;
    JanusClient& operator=(const JanusClient&) = delete;

    /// Blocks until the response arrives. A failed response is returned, not
    /// thrown; time-out, cancellation and transport failures throw JanusError.
    Response send_request(const std::string& command,
                          const nlohmann::json& args = nlohmann::json::object(),
                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::shared_ptr<RequestHandle> send_request_async(const std::string& command,
                                                      const nlohmann::json& args = nlohmann::json::object(),
                                                      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    RequestOutcome wait(const std::shared_ptr<RequestHandle>& handle);

    /// Fire-and-forget: no reply socket, no pending entry.
    void send_no_response(const std::string& command, const nlohmann::json& args = nlohmann::json::object());

    /// False when the request had already resolved. Never throws.
    bool cancel(const std::shared_ptr<RequestHandle>& handle);
    size_t cancel_all();

    RequestState status(const std::shared_ptr<RequestHandle>& handle) const;
    size_t pending_count() const;
    ClientStatistics statistics() const;

    /// Install before sending requests.
    void on_timeout(TimeoutCallback callback) { timeout_callback_ = std::move(callback); }

    /// Round-trips a ping; false on any failure.
    bool ping(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    const std::string& socket_path() const { return socket_path_; }

private:
    struct Pending {
        std::shared_ptr<RequestHandle> handle;
        std::string reply_path;
        int fd = -1;
        std::chrono::milliseconds timeout{0};
        std::chrono::steady_clock::time_point sent_at;
    };

    Request prepare(const std::string& command, const nlohmann::json& args,
                    std::optional<std::string> reply_to, std::optional<std::chrono::milliseconds> timeout);
    std::string encode(const Request& request) const;
    bool resolve(const std::string& id, RequestState state, std::optional<Response> response);
    void release(Pending& pending);
    void receive_loop();
    void shutdown();

    std::string socket_path_;
    ClientConfig config_;
    std::shared_ptr<const Manifest> manifest_;
    std::optional<Validator> validator_;

    int send_fd_ = -1;
    int epoll_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread receive_thread_;

    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, Pending> pending_;
    std::unordered_map<int, std::string> fd_to_id_;

    std::atomic<uint64_t> completed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> cancelled_{0};
    std::atomic<uint64_t> total_response_micros_{0};

    TimeoutCallback timeout_callback_;
    TimeoutManager timeouts_;
};

} // namespace janus
