#include "command_registry.hpp"

#include <algorithm>
#include <mutex>

namespace janus::handler {

void CommandRegistry::add(std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    std::string name = handler->name();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    handlers_[name] = std::shared_ptr<CommandHandler>(std::move(handler));
}

bool CommandRegistry::remove(const std::string& command) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return handlers_.erase(command) > 0;
}

std::shared_ptr<CommandHandler> CommandRegistry::find(const std::string& command) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second;
}

bool CommandRegistry::contains(const std::string& command) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handlers_.count(command) > 0;
}

std::vector<std::string> CommandRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        result.reserve(handlers_.size());
        for (const auto& entry : handlers_) {
            result.push_back(entry.first);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t CommandRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace janus::handler
