#include "builtin_handlers.hpp"

#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <thread>

namespace janus::handler {

namespace {

constexpr const char* kServerName = "janus";
constexpr const char* kServerVersion = "1.0.0";

class PingHandler final : public CommandHandler {
public:
    const char* name() const override { return "ping"; }

    HandlerResult handle(const CommandContext&) override {
        return HandlerResult::success({{"message", "pong"}, {"timestamp", now_rfc3339()}});
    }
};

class EchoHandler final : public CommandHandler {
public:
    const char* name() const override { return "echo"; }

    HandlerResult handle(const CommandContext& ctx) override {
        const nlohmann::json* message = find_arg(ctx, "message");
        return HandlerResult::success({{"echo", message ? *message : nlohmann::json("No message provided")},
                                       {"timestamp", now_rfc3339()}});
    }
};

class GetInfoHandler final : public CommandHandler {
public:
    const char* name() const override { return "get_info"; }

    HandlerResult handle(const CommandContext&) override {
        return HandlerResult::success(
            {{"server", kServerName}, {"version", kServerVersion}, {"timestamp", now_rfc3339()}});
    }
};

/// Reports whether the "message" argument holds a parseable JSON document.
class ValidateHandler final : public CommandHandler {
public:
    const char* name() const override { return "validate"; }

    HandlerResult handle(const CommandContext& ctx) override {
        nlohmann::json result = {{"timestamp", now_rfc3339()}};
        const nlohmann::json* message = find_arg(ctx, "message");
        if (!message) {
            result["valid"] = false;
            result["error"] = "No message provided for validation";
            return HandlerResult::success(result);
        }
        if (!message->is_string()) {
            result["valid"] = false;
            result["error"] = "Invalid JSON: message must be a string";
            return HandlerResult::success(result);
        }

        try {
            nlohmann::json parsed = nlohmann::json::parse(message->get<std::string>());
            result["valid"] = true;
            result["message"] = "JSON is valid";
            result["type"] = parsed.type_name();
        } catch (const nlohmann::json::parse_error& exc) {
            result["valid"] = false;
            result["error"] = std::string("Invalid JSON: ") + exc.what();
        }
        return HandlerResult::success(result);
    }
};

class SlowProcessHandler final : public CommandHandler {
public:
    const char* name() const override { return "slow_process"; }

    HandlerResult handle(const CommandContext& ctx) override {
        const auto delay = std::chrono::milliseconds(2000);
        const auto started = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - started < delay) {
            if (ctx.expired()) {
                LOG4CPLUS_DEBUG(server_logger(), "slow_process " << ctx.request.id << " abandoned after deadline");
                return HandlerResult::failure(ErrorCode::handler_timeout, "slow_process abandoned");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }

        const nlohmann::json* message = find_arg(ctx, "message");
        return HandlerResult::success({{"processed", true},
                                       {"delay", "2000ms"},
                                       {"message", message ? *message : nlohmann::json("No message")},
                                       {"timestamp", now_rfc3339()}});
    }
};

class ManifestHandler final : public CommandHandler {
public:
    explicit ManifestHandler(std::shared_ptr<const Manifest> manifest) : manifest_(std::move(manifest)) {}

    const char* name() const override { return "manifest"; }

    HandlerResult handle(const CommandContext&) override {
        if (manifest_) {
            return HandlerResult::success(to_json(*manifest_));
        }
        Manifest empty;
        empty.version = kServerVersion;
        empty.name = kServerName;
        return HandlerResult::success(to_json(empty));
    }

private:
    std::shared_ptr<const Manifest> manifest_;
};

} // namespace

void register_builtin_handlers(CommandRegistry& registry, std::shared_ptr<const Manifest> manifest) {
    registry.add(std::make_unique<PingHandler>());
    registry.add(std::make_unique<EchoHandler>());
    registry.add(std::make_unique<GetInfoHandler>());
    registry.add(std::make_unique<ValidateHandler>());
    registry.add(std::make_unique<SlowProcessHandler>());
    registry.add(std::make_unique<ManifestHandler>(std::move(manifest)));
}

} // namespace janus::handler
