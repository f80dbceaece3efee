#include "dispatcher.hpp"

#include "logger.hpp"
#include "one_shot.hpp"
#include "security.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>

namespace janus {

struct Dispatcher::Exchange {
    Request request;
    codec::WireFormat format = codec::WireFormat::json;
    ReplySink sink;
    OneShot<Response> outcome;
    OneShot<bool> delivered;
};

Dispatcher::Dispatcher(std::shared_ptr<handler::CommandRegistry> registry,
                       std::shared_ptr<const Manifest> manifest,
                       ServerConfig config,
                       std::shared_ptr<TimeoutManager> timeouts,
                       std::shared_ptr<ServerEvents> events)
    : registry_(std::move(registry)),
      manifest_(std::move(manifest)),
      config_(config),
      timeouts_(std::move(timeouts)),
      events_(std::move(events)) {
    if (!registry_) {
        registry_ = std::make_shared<handler::CommandRegistry>();
    }
    if (!timeouts_) {
        timeouts_ = std::make_shared<TimeoutManager>();
    }
    if (manifest_) {
        validator_.emplace(manifest_);
    }
}

void Dispatcher::dispatch(const std::string& bytes, const ReplySink& sink) {
    ++received_;
    codec::WireFormat format = codec::detect_format(bytes);

    std::optional<Request> decoded = decode(bytes, format, sink);
    if (!decoded) {
        return;
    }
    const Request& request = *decoded;

    LOG4CPLUS_DEBUG(server_logger(), "Request " << request.id << " command=" << request.command
                                                << (request.expects_reply() ? "" : " (no reply)"));
    if (events_ && events_->on_request) {
        events_->on_request(request);
    }

    std::shared_ptr<handler::CommandHandler> command_handler = registry_->find(request.command);
    if (!command_handler) {
        LOG4CPLUS_WARN(server_logger(), "Unknown command: " << request.command);
        StructuredError error =
            StructuredError::make(ErrorCode::method_not_found, "Command '" + request.command + "' is not registered");
        error.data->context = nlohmann::json{{"command", request.command}};
        report(error);
        deliver(request, format, Response::failure(request.id, error), sink);
        return;
    }

    nlohmann::json args = request.args_or_empty();
    if (validator_ && manifest_->find_command(request.command)) {
        nlohmann::json normalized;
        std::optional<StructuredError> error;
        try {
            error = validator_->validate_request(request.command, args, &normalized);
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(server_logger(), "Validation of " << request.id << " failed: " << exc.what());
            error = StructuredError::make(ErrorCode::internal_error, exc.what());
        }
        if (error) {
            LOG4CPLUS_INFO(server_logger(), "Request " << request.id << " rejected: " << error->describe());
            report(*error);
            deliver(request, format, Response::failure(request.id, *error), sink);
            return;
        }
        args = std::move(normalized);
    }

    auto exchange = std::make_shared<Exchange>();
    exchange->request = request;
    exchange->format = format;
    exchange->sink = sink;

    const auto timeout = timeout_for(request);
    const std::string timer_key = "dispatch-" + std::to_string(++sequence_);

    timeouts_->register_timeout(timer_key, timeout, [this, exchange, timeout]() {
        const Request& req = exchange->request;
        double seconds = static_cast<double>(timeout.count()) / 1000.0;
        StructuredError error = StructuredError::make(
            ErrorCode::handler_timeout,
            "Handler for '" + req.command + "' exceeded " + std::to_string(timeout.count()) + "ms");
        error.data->context = nlohmann::json{{"command", req.command}, {"timeout", seconds}};
        Response response = Response::failure(req.id, error);
        // A lost race means dispatch() may already have returned; `this` is
        // only valid while the exchange is undelivered.
        if (!exchange->outcome.try_resolve(response)) {
            return;
        }
        ++handler_timeouts_;
        LOG4CPLUS_WARN(server_logger(), "Request " << req.id << " timed out after " << seconds << "s");
        report(error);
        complete(*exchange, response);
    });

    handler::CommandContext ctx{exchange->request, args, std::chrono::steady_clock::now() + timeout};
    handler::HandlerResult result = invoke(*command_handler, ctx);
    timeouts_->cancel(timer_key);

    if (exchange->outcome.resolved()) {
        LOG4CPLUS_DEBUG(server_logger(), "Discarding late result of " << request.id);
    } else {
        Response response;
        if (result.ok()) {
            nlohmann::json value = result.value ? std::move(*result.value) : nlohmann::json(nullptr);
            try {
                check_response(request.command, value);
            } catch (const std::exception& exc) {
                LOG4CPLUS_ERROR(server_logger(), "Response check of " << request.id << " failed: " << exc.what());
            }
            response = Response::ok(request.id, std::move(value));
        } else {
            report(*result.error);
            response = Response::failure(request.id, *result.error);
        }
        finish(*exchange, response);
    }

    // The timer thread may own delivery; it must complete before the exchange
    // and this dispatcher can go away.
    exchange->delivered.wait();
}

void Dispatcher::reject(const std::string& bytes, const StructuredError& error, const ReplySink& sink) {
    ++rejected_;
    report(error);
    codec::WireFormat format = codec::detect_format(bytes);
    try {
        Request request = codec::decode_request(bytes);
        deliver(request, format, Response::failure(request.id, error), sink);
        return;
    } catch (const JanusError& exc) {
        LOG4CPLUS_DEBUG(server_logger(), "Rejected payload is not a request: " << exc.what());
    }
    if (auto reply_to = codec::salvage_reply_to(bytes)) {
        send_reply(*reply_to, format, Response::failure("", error), sink);
    }
}

DispatchStats Dispatcher::stats() const {
    DispatchStats stats;
    stats.received = received_.load();
    stats.malformed = malformed_.load();
    stats.responses_sent = responses_sent_.load();
    stats.handler_timeouts = handler_timeouts_.load();
    stats.rejected = rejected_.load();
    stats.delivery_failures = delivery_failures_.load();
    return stats;
}

std::optional<Request> Dispatcher::decode(const std::string& bytes, codec::WireFormat format, const ReplySink& sink) {
    Request request;
    try {
        request = codec::decode_request(bytes);
    } catch (const JanusError& exc) {
        ++malformed_;
        report(exc.error());
        std::optional<std::string> reply_to = codec::salvage_reply_to(bytes);
        if (!reply_to || security::check_socket_path(*reply_to, "reply_to")) {
            LOG4CPLUS_WARN(server_logger(), "Dropping malformed datagram: " << exc.what());
            return std::nullopt;
        }
        LOG4CPLUS_WARN(server_logger(), "Malformed datagram answered at " << *reply_to << ": " << exc.what());
        send_reply(*reply_to, format, Response::failure("", exc.error()), sink);
        return std::nullopt;
    }

    if (auto violation = security::check_request(request)) {
        report(*violation);
        if (violation->data && violation->data->field == std::string("reply_to")) {
            LOG4CPLUS_WARN(server_logger(), "Dropping request " << request.id << ": " << violation->describe());
            return std::nullopt;
        }
        LOG4CPLUS_WARN(server_logger(), "Request " << request.id << " refused: " << violation->describe());
        deliver(request, format, Response::failure(request.id, *violation), sink);
        return std::nullopt;
    }
    return request;
}

handler::HandlerResult Dispatcher::invoke(handler::CommandHandler& command_handler,
                                          const handler::CommandContext& ctx) {
    try {
        return command_handler.handle(ctx);
    } catch (const JanusError& exc) {
        LOG4CPLUS_INFO(server_logger(), "Handler " << ctx.request.command << " failed: " << exc.what());
        return handler::HandlerResult::failure(exc.error());
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Handler " << ctx.request.command << " threw: " << exc.what());
        return handler::HandlerResult::failure(ErrorCode::internal_error, exc.what());
    } catch (...) {
        LOG4CPLUS_ERROR(server_logger(), "Handler " << ctx.request.command << " threw a non-standard exception");
        return handler::HandlerResult::failure(ErrorCode::internal_error, "unknown exception");
    }
}

void Dispatcher::check_response(const std::string& command, const nlohmann::json& result) {
    if (!validator_) {
        return;
    }
    ValidationReport report = validator_->validate_response(command, result);
    if (report.valid) {
        return;
    }
    LOG4CPLUS_WARN(server_logger(), "Response of " << command << " failed validation with " << report.issues.size()
                                                   << " issue(s); first: " << report.issues.front().message);
    if (events_ && events_->on_response_validation_failed) {
        events_->on_response_validation_failed(command, report);
    }
}

bool Dispatcher::finish(Exchange& exchange, const Response& response) {
    if (!exchange.outcome.try_resolve(response)) {
        return false;
    }
    complete(exchange, response);
    return true;
}

void Dispatcher::complete(Exchange& exchange, const Response& response) {
    deliver(exchange.request, exchange.format, response, exchange.sink);
    // Releases dispatch(); nothing may touch this dispatcher afterwards.
    exchange.delivered.try_resolve(true);
}

void Dispatcher::deliver(const Request& request, codec::WireFormat format, const Response& response,
                         const ReplySink& sink) {
    if (!request.expects_reply()) {
        return;
    }
    send_reply(*request.reply_to, format, response, sink);
    if (events_ && events_->on_response) {
        events_->on_response(request, response);
    }
}

void Dispatcher::send_reply(const std::string& reply_to, codec::WireFormat format, const Response& response,
                            const ReplySink& sink) {
    std::string bytes;
    try {
        bytes = codec::encode_response(response, format);
    } catch (const nlohmann::json::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Cannot encode response to " << response.request_id << ": " << exc.what());
        bytes = codec::encode_response(
            Response::failure(response.request_id, StructuredError::make(ErrorCode::internal_error, exc.what())),
            format);
    }
    if (bytes.size() > config_.max_message_size) {
        LOG4CPLUS_WARN(server_logger(), "Response to " << response.request_id << " is " << bytes.size()
                                                       << " bytes, limit " << config_.max_message_size);
        StructuredError error = StructuredError::make(
            ErrorCode::resource_limit_exceeded,
            "Response size " + std::to_string(bytes.size()) + " exceeds " +
                std::to_string(config_.max_message_size) + " bytes");
        bytes = codec::encode_response(Response::failure(response.request_id, error), format);
    }

    int err = 0;
    try {
        err = sink(reply_to, bytes);
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(server_logger(), "Reply sink failed for " << reply_to << ": " << exc.what());
        err = EIO;
    }

    if (err == 0) {
        ++responses_sent_;
        return;
    }

    ++delivery_failures_;
    if (err == ENOENT || err == ECONNREFUSED) {
        LOG4CPLUS_DEBUG(server_logger(), "Reply address " << reply_to << " is gone: " << std::strerror(err));
    } else {
        LOG4CPLUS_WARN(server_logger(), "Failed to send reply to " << reply_to << ": " << std::strerror(err));
    }
    report(StructuredError::make(ErrorCode::socket_error, "send to " + reply_to + ": " + std::strerror(err)));
}

void Dispatcher::report(const StructuredError& error) {
    if (events_ && events_->on_error) {
        events_->on_error(error);
    }
}

std::chrono::milliseconds Dispatcher::timeout_for(const Request& request) const {
    if (!request.timeout) {
        return config_.default_timeout;
    }
    auto millis = static_cast<long long>(std::llround(*request.timeout * 1000.0));
    return std::chrono::milliseconds(std::max<long long>(millis, 1));
}

} // namespace janus
