#include "command_handler.hpp"

namespace janus::handler {

HandlerResult HandlerResult::success(nlohmann::json value) {
    HandlerResult result;
    result.value = std::move(value);
    return result;
}

HandlerResult HandlerResult::failure(StructuredError error) {
    HandlerResult result;
    result.error = std::move(error);
    return result;
}

HandlerResult HandlerResult::failure(ErrorCode code, const std::string& details) {
    return failure(StructuredError::make(code, details));
}

const nlohmann::json* CommandHandler::find_arg(const CommandContext& ctx, const std::string& key) {
    if (!ctx.args.is_object()) {
        return nullptr;
    }
    auto it = ctx.args.find(key);
    if (it == ctx.args.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string CommandHandler::string_arg(const CommandContext& ctx, const std::string& key, const std::string& fallback) {
    const nlohmann::json* value = find_arg(ctx, key);
    if (!value || !value->is_string()) {
        return fallback;
    }
    return value->get<std::string>();
}

} // namespace janus::handler
