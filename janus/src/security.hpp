#pragma once

#include "error.hpp"
#include "protocol.hpp"

#include <optional>
#include <string>

namespace janus::security {

constexpr size_t kMaxSocketPathLength = 107;
constexpr size_t kMaxCommandNameLength = 256;
constexpr size_t kMaxRequestIdLength = 256;
constexpr double kMaxTimeoutSeconds = 3600.0;

// Each check returns a security_violation error naming the offending field,
// or std::nullopt when the input is acceptable.
std::optional<StructuredError> check_socket_path(const std::string& path, const std::string& field = "socket_path");
std::optional<StructuredError> check_command_name(const std::string& command);
std::optional<StructuredError> check_request_id(const std::string& id);
std::optional<StructuredError> check_timeout(double seconds);

/// Runs every check that applies to an incoming or outgoing request.
std::optional<StructuredError> check_request(const Request& request);

} // namespace janus::security
