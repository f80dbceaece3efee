#pragma once

#include "command_registry.hpp"

#include "../manifest.hpp"

#include <memory>

namespace janus::handler {

/// ping, echo, get_info, validate, slow_process and manifest.
/// `manifest` may be null; the manifest command then reports an empty one.
void register_builtin_handlers(CommandRegistry& registry, std::shared_ptr<const Manifest> manifest);

} // namespace janus::handler
