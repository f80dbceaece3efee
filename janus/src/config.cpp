#include "config.hpp"

#include "error.hpp"

#include <cmath>
#include <fstream>

namespace janus {

namespace {

void require_object(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw JanusError(ErrorCode::configuration_error, "configuration must be a JSON object");
    }
}

void read_size(const nlohmann::json& document, const char* key, size_t& out) {
    auto it = document.find(key);
    if (it == document.end()) {
        return;
    }
    if (!it->is_number_integer() || it->get<long long>() <= 0) {
        throw JanusError(ErrorCode::configuration_error, std::string(key) + " must be a positive integer");
    }
    out = it->get<size_t>();
}

void read_seconds(const nlohmann::json& document, const char* key, std::chrono::milliseconds& out) {
    auto it = document.find(key);
    if (it == document.end()) {
        return;
    }
    if (!it->is_number() || !std::isfinite(it->get<double>()) || it->get<double>() <= 0.0) {
        throw JanusError(ErrorCode::configuration_error, std::string(key) + " must be a positive number of seconds");
    }
    out = std::chrono::milliseconds(static_cast<long long>(std::llround(it->get<double>() * 1000.0)));
}

void read_bool(const nlohmann::json& document, const char* key, bool& out) {
    auto it = document.find(key);
    if (it == document.end()) {
        return;
    }
    if (!it->is_boolean()) {
        throw JanusError(ErrorCode::configuration_error, std::string(key) + " must be a boolean");
    }
    out = it->get<bool>();
}

} // namespace

ServerConfig load_server_config(const nlohmann::json& document) {
    require_object(document);
    ServerConfig config;
    read_size(document, "maxMessageSize", config.max_message_size);
    read_seconds(document, "defaultTimeout", config.default_timeout);
    read_size(document, "maxConcurrentHandlers", config.max_concurrent_handlers);
    read_size(document, "maxQueuedRequests", config.max_queued_requests);
    read_bool(document, "cleanupOnStart", config.cleanup_on_start);
    read_bool(document, "cleanupOnShutdown", config.cleanup_on_shutdown);
    return config;
}

ClientConfig load_client_config(const nlohmann::json& document) {
    require_object(document);
    ClientConfig config;
    read_size(document, "maxMessageSize", config.max_message_size);
    read_seconds(document, "defaultTimeout", config.default_timeout);
    read_size(document, "maxPendingRequests", config.max_pending_requests);
    read_bool(document, "enableValidation", config.enable_validation);

    if (auto it = document.find("replyDirectory"); it != document.end()) {
        if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
            throw JanusError(ErrorCode::configuration_error, "replyDirectory must be a non-empty string");
        }
        config.reply_directory = it->get<std::string>();
    }
    return config;
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw JanusError(ErrorCode::configuration_error, "cannot open " + path);
    }
    try {
        return nlohmann::json::parse(input);
    } catch (const nlohmann::json::parse_error& exc) {
        throw JanusError(ErrorCode::configuration_error, path + ": " + exc.what());
    }
}

} // namespace janus
