#pragma once

#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "handler/command_registry.hpp"
#include "manifest.hpp"
#include "protocol.hpp"
#include "timeout_manager.hpp"
#include "validator.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace janus {

/// Observability hooks. Every callback is optional and may run on any
/// server thread, so implementations must be thread-safe.
struct ServerEvents {
    std::function<void(const std::string& socket_path)> on_listening;
    std::function<void(const Request&)> on_request;
    std::function<void(const Request&, const Response&)> on_response;
    std::function<void(const StructuredError&)> on_error;
    std::function<void(const std::string& command, const ValidationReport&)> on_response_validation_failed;
};

struct DispatchStats {
    uint64_t received = 0;
    uint64_t malformed = 0;
    uint64_t responses_sent = 0;
    uint64_t handler_timeouts = 0;
    uint64_t rejected = 0;
    uint64_t delivery_failures = 0;
};

/**
 * Turns one received payload into at most one reply.
 *
 * Decodes, checks, validates and runs the handler, racing it against the
 * request deadline. Independent of any socket: replies go through a
 * ReplySink, which may be called from the calling thread or from the
 * timer thread. The sink returns 0 on delivery or an errno value.
 */
class Dispatcher {
public:
    using ReplySink = std::function<int(const std::string& reply_to, const std::string& bytes)>;

    Dispatcher(std::shared_ptr<handler::CommandRegistry> registry,
               std::shared_ptr<const Manifest> manifest,
               ServerConfig config,
               std::shared_ptr<TimeoutManager> timeouts,
               std::shared_ptr<ServerEvents> events = nullptr);

    /// Blocks until the handler returns (or is abandoned by the deadline).
    void dispatch(const std::string& bytes, const ReplySink& sink);

    /// Answers `error` to the payload's reply address without running anything.
    void reject(const std::string& bytes, const StructuredError& error, const ReplySink& sink);

    DispatchStats stats() const;

private:
    struct Exchange;

    std::optional<Request> decode(const std::string& bytes, codec::WireFormat format, const ReplySink& sink);
    handler::HandlerResult invoke(handler::CommandHandler& command_handler, const handler::CommandContext& ctx);
    void check_response(const std::string& command, const nlohmann::json& result);
    bool finish(Exchange& exchange, const Response& response);
    void complete(Exchange& exchange, const Response& response);
    void deliver(const Request& request, codec::WireFormat format, const Response& response, const ReplySink& sink);
    void send_reply(const std::string& reply_to, codec::WireFormat format, const Response& response,
                    const ReplySink& sink);
    void report(const StructuredError& error);
    std::chrono::milliseconds timeout_for(const Request& request) const;

    std::shared_ptr<handler::CommandRegistry> registry_;
    std::shared_ptr<const Manifest> manifest_;
    std::optional<Validator> validator_;
    ServerConfig config_;
    std::shared_ptr<TimeoutManager> timeouts_;
    std::shared_ptr<ServerEvents> events_;

    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> responses_sent_{0};
    std::atomic<uint64_t> handler_timeouts_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> delivery_failures_{0};
    std::atomic<uint64_t> sequence_{0};
};

} // namespace janus
