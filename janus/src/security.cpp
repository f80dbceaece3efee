#include "security.hpp"

#include <cmath>
#include <sstream>

namespace janus::security {

namespace {

StructuredError violation(const std::string& field, const nlohmann::json& value, const std::string& details) {
    return StructuredError::validation(ErrorCode::security_violation, field, value, details);
}

bool has_parent_component(const std::string& path) {
    std::istringstream parts(path);
    std::string part;
    while (std::getline(parts, part, '/')) {
        if (part == "..") {
            return true;
        }
    }
    return false;
}

bool is_command_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-' ||
           c == '.';
}

} // namespace

std::optional<StructuredError> check_socket_path(const std::string& path, const std::string& field) {
    if (path.empty()) {
        return violation(field, path, "socket path is empty");
    }
    if (path.find('\0') != std::string::npos) {
        return violation(field, nullptr, "socket path contains a NUL byte");
    }
    if (path.front() != '/') {
        return violation(field, path, "socket path must be absolute");
    }
    if (path.size() > kMaxSocketPathLength) {
        return violation(field, path,
                         "socket path is " + std::to_string(path.size()) + " bytes, limit is " +
                             std::to_string(kMaxSocketPathLength));
    }
    if (has_parent_component(path)) {
        return violation(field, path, "socket path contains a '..' component");
    }
    return std::nullopt;
}

std::optional<StructuredError> check_command_name(const std::string& command) {
    if (command.empty()) {
        return violation("command", command, "command name is empty");
    }
    if (command.size() > kMaxCommandNameLength) {
        return violation("command", nullptr, "command name exceeds " + std::to_string(kMaxCommandNameLength) + " bytes");
    }
    for (char c : command) {
        if (!is_command_char(c)) {
            return violation("command", command, "command name contains invalid characters");
        }
    }
    return std::nullopt;
}

std::optional<StructuredError> check_request_id(const std::string& id) {
    if (id.empty()) {
        return violation("id", id, "request id is empty");
    }
    if (id.size() > kMaxRequestIdLength) {
        return violation("id", nullptr, "request id exceeds " + std::to_string(kMaxRequestIdLength) + " bytes");
    }
    for (unsigned char c : id) {
        if (c < 0x20 || c == 0x7f) {
            return violation("id", nullptr, "request id contains control characters");
        }
    }
    return std::nullopt;
}

std::optional<StructuredError> check_timeout(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > kMaxTimeoutSeconds) {
        nlohmann::json value = std::isfinite(seconds) ? nlohmann::json(seconds) : nlohmann::json(nullptr);
        return violation("timeout", value, "timeout must be within (0, 3600] seconds");
    }
    return std::nullopt;
}

std::optional<StructuredError> check_request(const Request& request) {
    if (auto error = check_request_id(request.id)) {
        return error;
    }
    if (auto error = check_command_name(request.command)) {
        return error;
    }
    if (request.reply_to) {
        if (auto error = check_socket_path(*request.reply_to, "reply_to")) {
            return error;
        }
    }
    if (request.timeout) {
        if (auto error = check_timeout(*request.timeout)) {
            return error;
        }
    }
    return std::nullopt;
}

} // namespace janus::security
