#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace janus {

/// A single command invocation. Immutable once sent.
struct Request {
    std::string id;
    std::string command;
    std::optional<nlohmann::json> args;     // object when present
    std::optional<std::string> reply_to;    // absent => fire-and-forget
    std::optional<double> timeout;          // seconds
    std::string timestamp;                  // RFC3339, millisecond precision

    bool expects_reply() const { return reply_to.has_value() && !reply_to->empty(); }

    /// Args as an object; an absent mapping reads as empty.
    const nlohmann::json& args_or_empty() const;
};

/// Correlated answer to a Request. Exactly one of result/error is set.
struct Response {
    std::string request_id;
    bool success = false;
    std::optional<nlohmann::json> result;
    std::optional<StructuredError> error;
    std::string id;
    std::string timestamp;

    static Response ok(const std::string& request_id, nlohmann::json result);
    static Response failure(const std::string& request_id, StructuredError error);
};

Request make_request(const std::string& command,
                     std::optional<nlohmann::json> args,
                     std::optional<std::string> reply_to,
                     std::optional<double> timeout);

/// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string now_rfc3339();
bool is_rfc3339_timestamp(const std::string& text);

/// Random (version 4) UUID in canonical textual form.
std::string generate_uuid();

/// Reply socket path unique to this process and call:
/// <directory>/janus_client_<pid>_<sequence>_<random>.sock
std::string make_reply_path(const std::string& directory);

} // namespace janus
