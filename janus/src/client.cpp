#include "client.hpp"

#include "codec.hpp"
#include "logger.hpp"
#include "security.hpp"
#include "socket.hpp"

#include <log4cplus/loggingmacros.h>

#include <cerrno>
#include <cstring>
#include <vector>

#include <sys/epoll.h>

namespace janus {

const char* request_state_name(RequestState state) {
    switch (state) {
        case RequestState::created: return "created";
        case RequestState::sent: return "sent";
        case RequestState::completed: return "completed";
        case RequestState::timed_out: return "timed_out";
        case RequestState::cancelled: return "cancelled";
    }
    return "unknown";
}

JanusClient::JanusClient(std::string socket_path, ClientConfig config, std::shared_ptr<const Manifest> manifest)
    : socket_path_(std::move(socket_path)), config_(std::move(config)), manifest_(std::move(manifest)) {
    if (auto violation = security::check_socket_path(socket_path_)) {
        throw JanusError(*violation);
    }
    if (manifest_ && config_.enable_validation) {
        validator_.emplace(manifest_);
    }

    send_fd_ = open_datagram_socket();
    epoll_fd_ = ::epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        int err = errno;
        close_socket(send_fd_);
        throw JanusError(ErrorCode::socket_error, std::string("epoll_create1: ") + std::strerror(err));
    }

    running_ = true;
    receive_thread_ = std::thread(&JanusClient::receive_loop, this);
}

JanusClient::~JanusClient() {
    shutdown();
}

void JanusClient::shutdown() {
    timeouts_.clear();
    if (running_.exchange(false) && receive_thread_.joinable()) {
        receive_thread_.join();
    }
    size_t abandoned = cancel_all();
    if (abandoned > 0) {
        LOG4CPLUS_DEBUG(client_logger(), "Cancelled " << abandoned << " pending requests on shutdown");
    }
    close_socket(epoll_fd_);
    close_socket(send_fd_);
}

Request JanusClient::prepare(const std::string& command, const nlohmann::json& args,
                             std::optional<std::string> reply_to, std::optional<std::chrono::milliseconds> timeout) {
    if (auto violation = security::check_command_name(command)) {
        throw JanusError(*violation);
    }
    if (!args.is_null() && !args.is_object()) {
        throw JanusError(StructuredError::validation(ErrorCode::invalid_params, "args", args,
                                                     "arguments must be an object"));
    }

    std::optional<double> seconds;
    if (timeout) {
        seconds = static_cast<double>(timeout->count()) / 1000.0;
        if (auto violation = security::check_timeout(*seconds)) {
            throw JanusError(*violation);
        }
    }

    if (validator_) {
        if (auto error = validator_->validate_request(command, args)) {
            throw JanusError(*error);
        }
    }

    std::optional<nlohmann::json> payload;
    if (args.is_object()) {
        payload = args;
    }
    return make_request(command, std::move(payload), std::move(reply_to), seconds);
}

std::string JanusClient::encode(const Request& request) const {
    std::string bytes = codec::encode_request(request);
    if (bytes.size() > config_.max_message_size) {
        throw JanusError(ErrorCode::resource_limit_exceeded,
                         "Request of " + std::to_string(bytes.size()) + " bytes exceeds " +
                             std::to_string(config_.max_message_size) + " byte limit");
    }
    return bytes;
}

std::shared_ptr<RequestHandle> JanusClient::send_request_async(const std::string& command,
                                                               const nlohmann::json& args,
                                                               std::optional<std::chrono::milliseconds> timeout) {
    const std::chrono::milliseconds effective = timeout.value_or(config_.default_timeout);
    std::string reply_path = make_reply_path(config_.reply_directory);
    if (auto violation = security::check_socket_path(reply_path, "reply_to")) {
        throw JanusError(*violation);
    }

    // The deadline travels with the request so the handler observes it too.
    Request request = prepare(command, args, reply_path, effective);
    std::string bytes = encode(request);

    Pending pending;
    pending.handle = std::shared_ptr<RequestHandle>(new RequestHandle(request.id, command));
    pending.reply_path = reply_path;
    pending.timeout = effective;
    pending.fd = bind_datagram_socket(reply_path, true);

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        if (pending_.size() >= config_.max_pending_requests) {
            close_socket(pending.fd);
            unlink_socket_path(reply_path);
            throw JanusError(ErrorCode::resource_limit_exceeded,
                             "Maximum pending requests (" + std::to_string(config_.max_pending_requests) +
                                 ") exceeded");
        }

        epoll_event ev{};
        ev.events = EPOLLIN;
        ev.data.fd = pending.fd;
        if (::epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, pending.fd, &ev) < 0) {
            int err = errno;
            close_socket(pending.fd);
            unlink_socket_path(reply_path);
            throw JanusError(ErrorCode::socket_error, std::string("epoll_ctl: ") + std::strerror(err));
        }

        pending.handle->state_ = RequestState::sent;
        pending.sent_at = std::chrono::steady_clock::now();
        fd_to_id_[pending.fd] = request.id;
        pending_.emplace(request.id, pending);
    }

    const std::string id = request.id;
    timeouts_.register_timeout(id, effective, [this, id]() { resolve(id, RequestState::timed_out, std::nullopt); });

    int err = send_datagram(send_fd_, socket_path_, bytes);
    if (err != 0) {
        timeouts_.cancel(id);
        std::optional<Pending> failed;
        {
            std::lock_guard<std::mutex> lock(pending_mutex_);
            auto it = pending_.find(id);
            if (it != pending_.end()) {
                failed = std::move(it->second);
                fd_to_id_.erase(failed->fd);
                pending_.erase(it);
            }
        }
        if (failed) {
            release(*failed);
        }
        LOG4CPLUS_WARN(client_logger(), "Send to " << socket_path_ << " failed: " << std::strerror(err));
        throw JanusError(ErrorCode::socket_error, "send to " + socket_path_ + ": " + std::strerror(err));
    }

    LOG4CPLUS_DEBUG(client_logger(), "Sent " << command << " id=" << id << " timeout=" << effective.count() << "ms");
    return pending.handle;
}

Response JanusClient::send_request(const std::string& command,
                                   const nlohmann::json& args,
                                   std::optional<std::chrono::milliseconds> timeout) {
    std::shared_ptr<RequestHandle> handle = send_request_async(command, args, timeout);
    RequestOutcome outcome = wait(handle);

    switch (outcome.state) {
        case RequestState::completed:
            return *outcome.response;
        case RequestState::timed_out: {
            double seconds = static_cast<double>(outcome.timeout.count()) / 1000.0;
            StructuredError error = StructuredError::make(
                ErrorCode::handler_timeout,
                "Request '" + command + "' timed out after " + std::to_string(outcome.timeout.count()) + "ms");
            error.data->context = nlohmann::json{{"command", command}, {"timeout", seconds}};
            throw JanusError(error);
        }
        default:
            throw JanusError(ErrorCode::server_error, "Request cancelled");
    }
}

RequestOutcome JanusClient::wait(const std::shared_ptr<RequestHandle>& handle) {
    if (!handle) {
        throw JanusError(ErrorCode::invalid_request, "null request handle");
    }
    return handle->outcome_.wait();
}

void JanusClient::send_no_response(const std::string& command, const nlohmann::json& args) {
    Request request = prepare(command, args, std::nullopt, std::nullopt);
    std::string bytes = encode(request);
    int err = send_datagram(send_fd_, socket_path_, bytes);
    if (err != 0) {
        throw JanusError(ErrorCode::socket_error, "send to " + socket_path_ + ": " + std::strerror(err));
    }
    LOG4CPLUS_DEBUG(client_logger(), "Sent " << command << " id=" << request.id << " without reply");
}

bool JanusClient::cancel(const std::shared_ptr<RequestHandle>& handle) {
    if (!handle) {
        return false;
    }
    return resolve(handle->id_, RequestState::cancelled, std::nullopt);
}

size_t JanusClient::cancel_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        ids.reserve(pending_.size());
        for (const auto& entry : pending_) {
            ids.push_back(entry.first);
        }
    }
    size_t count = 0;
    for (const auto& id : ids) {
        if (resolve(id, RequestState::cancelled, std::nullopt)) {
            ++count;
        }
    }
    return count;
}

RequestState JanusClient::status(const std::shared_ptr<RequestHandle>& handle) const {
    return handle ? handle->state() : RequestState::created;
}

size_t JanusClient::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

ClientStatistics JanusClient::statistics() const {
    ClientStatistics stats;
    stats.pending = pending_count();
    stats.completed = completed_.load();
    stats.timed_out = timed_out_.load();
    stats.cancelled = cancelled_.load();
    if (stats.completed > 0) {
        stats.average_response_time =
            static_cast<double>(total_response_micros_.load()) / 1e6 / static_cast<double>(stats.completed);
    }
    return stats;
}

bool JanusClient::ping(std::chrono::milliseconds timeout) {
    try {
        return send_request("ping", nlohmann::json::object(), timeout).success;
    } catch (const JanusError& exc) {
        LOG4CPLUS_DEBUG(client_logger(), "ping failed: " << exc.what());
        return false;
    }
}

bool JanusClient::resolve(const std::string& id, RequestState state, std::optional<Response> response) {
    std::optional<Pending> entry;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        entry = std::move(it->second);
        fd_to_id_.erase(entry->fd);
        pending_.erase(it);
    }

    if (state != RequestState::timed_out) {
        timeouts_.cancel(id);
    }
    release(*entry);

    switch (state) {
        case RequestState::completed: {
            auto elapsed = std::chrono::steady_clock::now() - entry->sent_at;
            total_response_micros_ +=
                static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
            ++completed_;
            break;
        }
        case RequestState::timed_out:
            ++timed_out_;
            LOG4CPLUS_INFO(client_logger(), "Request " << id << " (" << entry->handle->command() << ") timed out after "
                                                       << entry->timeout.count() << "ms");
            break;
        case RequestState::cancelled:
            ++cancelled_;
            entry->handle->cancelled_ = true;
            break;
        default:
            break;
    }

    entry->handle->state_ = state;
    RequestOutcome outcome;
    outcome.state = state;
    outcome.response = std::move(response);
    outcome.timeout = entry->timeout;
    entry->handle->outcome_.try_resolve(std::move(outcome));

    if (state == RequestState::timed_out && timeout_callback_) {
        timeout_callback_(id, entry->timeout);
    }
    return true;
}

void JanusClient::release(Pending& pending) {
    if (pending.fd >= 0) {
        ::epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, pending.fd, nullptr);
    }
    close_socket(pending.fd);
    unlink_socket_path(pending.reply_path);
}

void JanusClient::receive_loop() {
    const int kMaxEvents = 16;
    epoll_event events[kMaxEvents];

    while (running_) {
        int nfds = ::epoll_wait(epoll_fd_, events, kMaxEvents, 100);
        if (nfds < 0) {
            if (errno != EINTR) {
                LOG4CPLUS_ERROR(client_logger(), "epoll_wait: " << std::strerror(errno));
            }
            continue;
        }

        for (int i = 0; i < nfds; ++i) {
            int fd = events[i].data.fd;
            std::string id;
            std::string bytes;
            bool truncated = false;
            {
                // Read under the table lock so the fd cannot be released and reused meanwhile.
                std::lock_guard<std::mutex> lock(pending_mutex_);
                auto it = fd_to_id_.find(fd);
                if (it == fd_to_id_.end()) {
                    continue;
                }
                id = it->second;
                try {
                    if (!receive_datagram(fd, config_.max_message_size, bytes, truncated)) {
                        continue;
                    }
                } catch (const JanusError& exc) {
                    LOG4CPLUS_WARN(client_logger(), "Reply socket for " << id << ": " << exc.what());
                    continue;
                }
            }

            if (truncated) {
                LOG4CPLUS_WARN(client_logger(), "Reply to " << id << " exceeds " << config_.max_message_size << " bytes");
                resolve(id, RequestState::completed,
                        Response::failure(id, StructuredError::make(ErrorCode::resource_limit_exceeded,
                                                                    "Response exceeds " +
                                                                        std::to_string(config_.max_message_size) +
                                                                        " bytes")));
                continue;
            }

            Response response;
            try {
                response = codec::decode_response(bytes);
            } catch (const JanusError& exc) {
                LOG4CPLUS_WARN(client_logger(), "Discarding undecodable reply for " << id << ": " << exc.what());
                continue;
            }

            if (response.request_id != id) {
                LOG4CPLUS_WARN(client_logger(), "Discarding reply for " << response.request_id << " received at "
                                                                        << id << "'s address");
                continue;
            }
            if (!resolve(id, RequestState::completed, std::move(response))) {
                LOG4CPLUS_DEBUG(client_logger(), "Late reply for " << id << " discarded");
            }
        }
    }
}

} // namespace janus
