#include "error.hpp"

#include <utility>

namespace janus {

const char* error_message(ErrorCode code) {
    switch (code) {
        case ErrorCode::parse_error: return "Parse error";
        case ErrorCode::invalid_request: return "Invalid Request";
        case ErrorCode::method_not_found: return "Method not found";
        case ErrorCode::invalid_params: return "Invalid params";
        case ErrorCode::internal_error: return "Internal error";
        case ErrorCode::server_error: return "Server error";
        case ErrorCode::service_unavailable: return "Service unavailable";
        case ErrorCode::authentication_failed: return "Authentication failed";
        case ErrorCode::rate_limit_exceeded: return "Rate limit exceeded";
        case ErrorCode::resource_not_found: return "Resource not found";
        case ErrorCode::validation_failed: return "Validation failed";
        case ErrorCode::handler_timeout: return "Handler timeout";
        case ErrorCode::socket_error: return "Socket error";
        case ErrorCode::configuration_error: return "Configuration error";
        case ErrorCode::security_violation: return "Security violation";
        case ErrorCode::resource_limit_exceeded: return "Resource limit exceeded";
    }
    return "Unknown error";
}

const char* error_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::parse_error: return "PARSE_ERROR";
        case ErrorCode::invalid_request: return "INVALID_REQUEST";
        case ErrorCode::method_not_found: return "METHOD_NOT_FOUND";
        case ErrorCode::invalid_params: return "INVALID_PARAMS";
        case ErrorCode::internal_error: return "INTERNAL_ERROR";
        case ErrorCode::server_error: return "SERVER_ERROR";
        case ErrorCode::service_unavailable: return "SERVICE_UNAVAILABLE";
        case ErrorCode::authentication_failed: return "AUTHENTICATION_FAILED";
        case ErrorCode::rate_limit_exceeded: return "RATE_LIMIT_EXCEEDED";
        case ErrorCode::resource_not_found: return "RESOURCE_NOT_FOUND";
        case ErrorCode::validation_failed: return "VALIDATION_FAILED";
        case ErrorCode::handler_timeout: return "HANDLER_TIMEOUT";
        case ErrorCode::socket_error: return "SOCKET_ERROR";
        case ErrorCode::configuration_error: return "CONFIGURATION_ERROR";
        case ErrorCode::security_violation: return "SECURITY_VIOLATION";
        case ErrorCode::resource_limit_exceeded: return "RESOURCE_LIMIT_EXCEEDED";
    }
    return "UNKNOWN_ERROR";
}

std::optional<ErrorCode> error_code_from_int(int code) {
    switch (code) {
        case -32700:
        case -32600:
        case -32601:
        case -32602:
        case -32603:
            return static_cast<ErrorCode>(code);
        default:
            break;
    }
    if (code <= -32000 && code >= -32010) {
        return static_cast<ErrorCode>(code);
    }
    return std::nullopt;
}

StructuredError StructuredError::make(ErrorCode code) {
    StructuredError error;
    error.code = static_cast<int>(code);
    error.message = error_message(code);
    return error;
}

StructuredError StructuredError::make(ErrorCode code, const std::string& details) {
    StructuredError error = make(code);
    ErrorData data;
    data.details = details;
    error.data = std::move(data);
    return error;
}

StructuredError StructuredError::validation(ErrorCode code,
                                            const std::string& field,
                                            const nlohmann::json& value,
                                            const std::string& details,
                                            const nlohmann::json& constraints) {
    StructuredError error = make(code);
    ErrorData data;
    data.details = details;
    data.field = field;
    data.value = value;
    if (!constraints.is_null()) {
        data.constraints = constraints;
    }
    error.data = std::move(data);
    return error;
}

std::string StructuredError::describe() const {
    std::string text = "JSON-RPC Error " + std::to_string(code) + ": " + message;
    if (data && data->details && !data->details->empty()) {
        text += " - " + *data->details;
    }
    return text;
}

nlohmann::json to_json(const StructuredError& error) {
    nlohmann::json j = {{"code", error.code}, {"message", error.message}};
    if (error.data && !error.data->empty()) {
        nlohmann::json data = nlohmann::json::object();
        if (error.data->details) data["details"] = *error.data->details;
        if (error.data->field) data["field"] = *error.data->field;
        if (error.data->value) data["value"] = *error.data->value;
        if (error.data->constraints) data["constraints"] = *error.data->constraints;
        if (error.data->context) data["context"] = *error.data->context;
        j["data"] = std::move(data);
    }
    return j;
}

StructuredError structured_error_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw JanusError(ErrorCode::parse_error, "error must be an object");
    }
    StructuredError error;
    auto code_it = j.find("code");
    if (code_it == j.end() || !code_it->is_number_integer()) {
        throw JanusError(ErrorCode::parse_error, "error.code must be an integer");
    }
    error.code = code_it->get<int>();

    auto message_it = j.find("message");
    if (message_it != j.end() && message_it->is_string()) {
        error.message = message_it->get<std::string>();
    } else if (auto known = error_code_from_int(error.code)) {
        error.message = error_message(*known);
    }

    auto data_it = j.find("data");
    if (data_it != j.end() && data_it->is_object()) {
        ErrorData data;
        const auto& d = *data_it;
        if (auto it = d.find("details"); it != d.end() && it->is_string()) data.details = it->get<std::string>();
        if (auto it = d.find("field"); it != d.end() && it->is_string()) data.field = it->get<std::string>();
        if (auto it = d.find("value"); it != d.end()) data.value = *it;
        if (auto it = d.find("constraints"); it != d.end()) data.constraints = *it;
        if (auto it = d.find("context"); it != d.end()) data.context = *it;
        error.data = std::move(data);
    }
    return error;
}

JanusError::JanusError(StructuredError error)
    : std::runtime_error(error.describe()), error_(std::move(error)) {}

JanusError::JanusError(ErrorCode code, const std::string& details)
    : JanusError(StructuredError::make(code, details)) {}

} // namespace janus
