#pragma once

#include "command_handler.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace janus::handler {

/**
 * Command name to handler table.
 *
 * Lookups take a shared lock and hand out shared ownership, so a handler
 * that is unregistered mid-dispatch stays alive until its invocation ends.
 */
class CommandRegistry {
public:
    /// Registers or replaces the handler under handler->name().
    void add(std::unique_ptr<CommandHandler> handler);
    bool remove(const std::string& command);
    std::shared_ptr<CommandHandler> find(const std::string& command) const;

    bool contains(const std::string& command) const;
    std::vector<std::string> names() const;
    size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CommandHandler>> handlers_;
};

} // namespace janus::handler
