#pragma once

#include "protocol.hpp"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace janus::codec {

/// JSON is the cross-runtime default; MessagePack carries the same fields.
enum class WireFormat {
    json,
    msgpack,
};

WireFormat detect_format(const std::string& bytes);

std::string encode_request(const Request& request, WireFormat format = WireFormat::json);
std::string encode_response(const Response& response, WireFormat format = WireFormat::json);

/// Throws JanusError: parse_error for undecodable bytes,
/// invalid_request for a well-formed document with a bad envelope.
Request decode_request(const std::string& bytes);
Response decode_response(const std::string& bytes);

nlohmann::json request_to_json(const Request& request);
nlohmann::json response_to_json(const Response& response);
Request request_from_json(const nlohmann::json& j);
Response response_from_json(const nlohmann::json& j);

/// Decodes either wire format into a JSON document. Throws on garbage.
nlohmann::json parse_document(const std::string& bytes);

/// Best effort recovery of "reply_to" from a payload that failed to decode.
std::optional<std::string> salvage_reply_to(const std::string& bytes);

nlohmann::json from_msgpack_object(const msgpack::object& obj);
void pack_json(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value);

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key);
std::string as_string(const msgpack::object& obj, const std::string& fallback = "");

} // namespace janus::codec
