#pragma once

#include "../error.hpp"
#include "../protocol.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace janus::handler {

struct CommandContext {
    const Request& request;
    const nlohmann::json& args;   // validated, defaults applied
    std::chrono::steady_clock::time_point deadline;

    /// Long-running handlers may poll this and give up early.
    bool expired() const { return std::chrono::steady_clock::now() >= deadline; }
};

/// Outcome of a handler: either a result value or a StructuredError.
struct HandlerResult {
    std::optional<nlohmann::json> value;
    std::optional<StructuredError> error;

    static HandlerResult success(nlohmann::json value);
    static HandlerResult failure(StructuredError error);
    static HandlerResult failure(ErrorCode code, const std::string& details);

    bool ok() const { return !error.has_value(); }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual const char* name() const = 0;

    /// May throw; a JanusError keeps its code, anything else maps to internal_error.
    virtual HandlerResult handle(const CommandContext& ctx) = 0;

protected:
    /// Argument lookup; returns nullptr when absent or null.
    static const nlohmann::json* find_arg(const CommandContext& ctx, const std::string& key);
    static std::string string_arg(const CommandContext& ctx, const std::string& key, const std::string& fallback = "");
};

/// Adapts a plain callable to the CommandHandler interface.
class FunctionHandler final : public CommandHandler {
public:
    using Function = std::function<HandlerResult(const CommandContext&)>;

    FunctionHandler(std::string name, Function fn) : name_(std::move(name)), fn_(std::move(fn)) {}

    const char* name() const override { return name_.c_str(); }
    HandlerResult handle(const CommandContext& ctx) override { return fn_(ctx); }

private:
    std::string name_;
    Function fn_;
};

} // namespace janus::handler
