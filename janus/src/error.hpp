#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace janus {

/// JSON-RPC 2.0 error codes plus the implementation-defined server range.
enum class ErrorCode : int {
    parse_error = -32700,
    invalid_request = -32600,
    method_not_found = -32601,
    invalid_params = -32602,
    internal_error = -32603,

    server_error = -32000,
    service_unavailable = -32001,
    authentication_failed = -32002,
    rate_limit_exceeded = -32003,
    resource_not_found = -32004,
    validation_failed = -32005,
    handler_timeout = -32006,
    socket_error = -32007,
    configuration_error = -32008,
    security_violation = -32009,
    resource_limit_exceeded = -32010,
};

const char* error_message(ErrorCode code);
const char* error_name(ErrorCode code);
std::optional<ErrorCode> error_code_from_int(int code);

/// Optional context attached to a StructuredError ("data" on the wire).
struct ErrorData {
    std::optional<std::string> details;
    std::optional<std::string> field;
    std::optional<nlohmann::json> value;
    std::optional<nlohmann::json> constraints;
    std::optional<nlohmann::json> context;

    bool empty() const {
        return !details && !field && !value && !constraints && !context;
    }
};

struct StructuredError {
    int code = static_cast<int>(ErrorCode::internal_error);
    std::string message;
    std::optional<ErrorData> data;

    static StructuredError make(ErrorCode code);
    static StructuredError make(ErrorCode code, const std::string& details);
    static StructuredError validation(ErrorCode code,
                                      const std::string& field,
                                      const nlohmann::json& value,
                                      const std::string& details,
                                      const nlohmann::json& constraints = nullptr);

    std::optional<ErrorCode> known_code() const { return error_code_from_int(code); }
    bool is(ErrorCode c) const { return code == static_cast<int>(c); }

    /// "JSON-RPC Error <code>: <message>" with " - <details>" when present.
    std::string describe() const;
};

nlohmann::json to_json(const StructuredError& error);
StructuredError structured_error_from_json(const nlohmann::json& j);

/// Exception form of a StructuredError, thrown across API boundaries.
class JanusError : public std::runtime_error {
public:
    explicit JanusError(StructuredError error);
    JanusError(ErrorCode code, const std::string& details);

    const StructuredError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }

private:
    StructuredError error_;
};

} // namespace janus
