#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace janus {

struct ServerConfig {
    size_t max_message_size = 65536;
    std::chrono::milliseconds default_timeout{30000};
    size_t max_concurrent_handlers = 16;
    size_t max_queued_requests = 256;
    bool cleanup_on_start = true;
    bool cleanup_on_shutdown = true;
};

struct ClientConfig {
    size_t max_message_size = 65536;
    std::chrono::milliseconds default_timeout{30000};
    size_t max_pending_requests = 1000;
    std::string reply_directory = "/tmp";
    bool enable_validation = true;
};

/**
 * Loaders read the keys below from a JSON object; absent keys keep their
 * defaults and unknown keys are ignored.
 *
 *   maxMessageSize, defaultTimeout (seconds), maxConcurrentHandlers,
 *   maxQueuedRequests, cleanupOnStart, cleanupOnShutdown,
 *   maxPendingRequests, replyDirectory, enableValidation
 *
 * Wrong-typed or non-positive values throw JanusError (configuration_error).
 */
ServerConfig load_server_config(const nlohmann::json& document);
ClientConfig load_client_config(const nlohmann::json& document);

/// Reads and parses a JSON file; throws JanusError (configuration_error).
nlohmann::json read_json_file(const std::string& path);

} // namespace janus
