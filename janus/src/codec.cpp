#include "codec.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <regex>

namespace janus::codec {

namespace {

std::string epoch_to_rfc3339(double seconds) {
    auto whole = static_cast<std::time_t>(std::floor(seconds));
    int millis = static_cast<int>(std::lround((seconds - std::floor(seconds)) * 1000.0));
    if (millis >= 1000) {
        whole += 1;
        millis -= 1000;
    }
    std::tm tm{};
    gmtime_r(&whole, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char result[40] = {0};
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, millis);
    return result;
}

std::string read_timestamp(const nlohmann::json& j) {
    auto it = j.find("timestamp");
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        // Older peers send seconds since the epoch.
        return epoch_to_rfc3339(it->get<double>());
    }
    throw JanusError(ErrorCode::invalid_request, "timestamp must be a string");
}

std::optional<std::string> read_optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw JanusError(ErrorCode::invalid_request, std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

std::string encode_document(const nlohmann::json& document, WireFormat format) {
    if (format == WireFormat::json) {
        return document.dump();
    }
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_json(pk, document);
    return std::string(buffer.data(), buffer.size());
}

} // namespace

WireFormat detect_format(const std::string& bytes) {
    for (unsigned char c : bytes) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            continue;
        }
        if ((c >= 0x80 && c <= 0x8f) || c == 0xde || c == 0xdf) {
            return WireFormat::msgpack;
        }
        break;
    }
    return WireFormat::json;
}

nlohmann::json parse_document(const std::string& bytes) {
    if (bytes.empty()) {
        throw JanusError(ErrorCode::parse_error, "empty payload");
    }

    if (detect_format(bytes) == WireFormat::msgpack) {
        try {
            msgpack::object_handle handle = msgpack::unpack(bytes.data(), bytes.size());
            return from_msgpack_object(handle.get());
        } catch (const msgpack::unpack_error& exc) {
            throw JanusError(ErrorCode::parse_error, std::string("invalid MessagePack: ") + exc.what());
        } catch (const msgpack::type_error& exc) {
            throw JanusError(ErrorCode::parse_error, std::string("invalid MessagePack: ") + exc.what());
        }
    }

    try {
        return nlohmann::json::parse(bytes);
    } catch (const nlohmann::json::parse_error& exc) {
        throw JanusError(ErrorCode::parse_error, std::string("invalid JSON: ") + exc.what());
    }
}

nlohmann::json request_to_json(const Request& request) {
    nlohmann::json j = {
        {"id", request.id},
        {"command", request.command},
        {"method", request.command},
        {"timestamp", request.timestamp},
    };
    if (request.args) {
        j["args"] = *request.args;
    }
    if (request.reply_to) {
        j["reply_to"] = *request.reply_to;
    }
    if (request.timeout) {
        j["timeout"] = *request.timeout;
    }
    return j;
}

nlohmann::json response_to_json(const Response& response) {
    nlohmann::json j = {
        {"request_id", response.request_id},
        {"command_id", response.request_id},
        {"success", response.success},
        {"id", response.id},
        {"timestamp", response.timestamp},
    };
    if (response.success) {
        j["result"] = response.result ? *response.result : nlohmann::json(nullptr);
    } else {
        j["error"] = to_json(response.error ? *response.error : StructuredError::make(ErrorCode::internal_error));
    }
    return j;
}

Request request_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw JanusError(ErrorCode::invalid_request, "request must be an object");
    }

    Request request;
    auto id = read_optional_string(j, "id");
    if (!id || id->empty()) {
        throw JanusError(ErrorCode::invalid_request, "request id is required");
    }
    request.id = std::move(*id);

    auto command = read_optional_string(j, "command");
    if (!command) {
        command = read_optional_string(j, "method");
    }
    if (!command || command->empty()) {
        throw JanusError(ErrorCode::invalid_request, "request command is required");
    }
    request.command = std::move(*command);

    if (auto it = j.find("args"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw JanusError(ErrorCode::invalid_request, "args must be an object");
        }
        request.args = *it;
    }

    request.reply_to = read_optional_string(j, "reply_to");

    if (auto it = j.find("timeout"); it != j.end() && !it->is_null()) {
        if (!it->is_number()) {
            throw JanusError(ErrorCode::invalid_request, "timeout must be a number of seconds");
        }
        request.timeout = it->get<double>();
    }

    request.timestamp = read_timestamp(j);
    return request;
}

Response response_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw JanusError(ErrorCode::invalid_request, "response must be an object");
    }

    Response response;
    auto request_id = read_optional_string(j, "request_id");
    if (!request_id) {
        request_id = read_optional_string(j, "command_id");
    }
    if (!request_id) {
        throw JanusError(ErrorCode::invalid_request, "response request_id is required");
    }
    response.request_id = std::move(*request_id);

    auto success_it = j.find("success");
    if (success_it == j.end() || !success_it->is_boolean()) {
        throw JanusError(ErrorCode::invalid_request, "response success flag is required");
    }
    response.success = success_it->get<bool>();

    if (response.success) {
        auto result_it = j.find("result");
        response.result = result_it != j.end() ? *result_it : nlohmann::json(nullptr);
    } else {
        auto error_it = j.find("error");
        if (error_it == j.end() || error_it->is_null()) {
            throw JanusError(ErrorCode::invalid_request, "failed response carries no error");
        }
        response.error = structured_error_from_json(*error_it);
    }

    response.id = read_optional_string(j, "id").value_or("");
    response.timestamp = read_timestamp(j);
    return response;
}

std::string encode_request(const Request& request, WireFormat format) {
    return encode_document(request_to_json(request), format);
}

std::string encode_response(const Response& response, WireFormat format) {
    return encode_document(response_to_json(response), format);
}

Request decode_request(const std::string& bytes) {
    return request_from_json(parse_document(bytes));
}

Response decode_response(const std::string& bytes) {
    return response_from_json(parse_document(bytes));
}

std::optional<std::string> salvage_reply_to(const std::string& bytes) {
    if (detect_format(bytes) == WireFormat::msgpack) {
        try {
            msgpack::object_handle handle = msgpack::unpack(bytes.data(), bytes.size());
            if (auto reply_obj = find_key(handle.get(), "reply_to")) {
                std::string path = as_string(*reply_obj);
                if (!path.empty()) {
                    return path;
                }
            }
        } catch (const msgpack::unpack_error&) {
            return std::nullopt;
        }
        return std::nullopt;
    }

    static const std::regex reply_pattern(R"("reply_to"\s*:\s*"([^"\\]+)")");
    std::smatch match;
    if (std::regex_search(bytes, match, reply_pattern)) {
        return match[1].str();
    }
    return std::nullopt;
}

nlohmann::json from_msgpack_object(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return nullptr;
        case msgpack::type::BOOLEAN:
            return obj.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return obj.via.u64;
        case msgpack::type::NEGATIVE_INTEGER:
            return obj.via.i64;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return obj.via.f64;
        case msgpack::type::STR:
            return std::string(obj.via.str.ptr, obj.via.str.size);
        case msgpack::type::BIN:
            return std::string(obj.via.bin.ptr, obj.via.bin.size);
        case msgpack::type::ARRAY: {
            nlohmann::json array = nlohmann::json::array();
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                array.push_back(from_msgpack_object(obj.via.array.ptr[i]));
            }
            return array;
        }
        case msgpack::type::MAP: {
            nlohmann::json map = nlohmann::json::object();
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                if (kv.key.type != msgpack::type::STR) {
                    throw JanusError(ErrorCode::parse_error, "MessagePack map keys must be strings");
                }
                map[as_string(kv.key)] = from_msgpack_object(kv.val);
            }
            return map;
        }
        default:
            return nullptr;
    }
}

void pack_json(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            pk.pack_nil();
            break;
        case nlohmann::json::value_t::boolean:
            pk.pack(value.get<bool>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            pk.pack(value.get<uint64_t>());
            break;
        case nlohmann::json::value_t::number_integer:
            pk.pack(value.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_float:
            pk.pack(value.get<double>());
            break;
        case nlohmann::json::value_t::string:
            pk.pack(value.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::binary: {
            const auto& bin = value.get_binary();
            pk.pack_bin(static_cast<uint32_t>(bin.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(bin.data()), static_cast<uint32_t>(bin.size()));
            break;
        }
        case nlohmann::json::value_t::array:
            pk.pack_array(static_cast<uint32_t>(value.size()));
            for (const auto& item : value) {
                pack_json(pk, item);
            }
            break;
        case nlohmann::json::value_t::object:
            pk.pack_map(static_cast<uint32_t>(value.size()));
            for (auto it = value.begin(); it != value.end(); ++it) {
                pk.pack(it.key());
                pack_json(pk, it.value());
            }
            break;
    }
}

const msgpack::object* find_key(const msgpack::object& map_obj, const std::string& key) {
    if (map_obj.type != msgpack::type::MAP) {
        return nullptr;
    }

    auto map = map_obj.via.map;
    for (uint32_t i = 0; i < map.size; ++i) {
        if (map.ptr[i].key.type == msgpack::type::STR) {
            std::string k(map.ptr[i].key.via.str.ptr, map.ptr[i].key.via.str.size);
            if (k == key) {
                return &map.ptr[i].val;
            }
        }
    }
    return nullptr;
}

std::string as_string(const msgpack::object& obj, const std::string& fallback) {
    if (obj.type == msgpack::type::STR) {
        return std::string(obj.via.str.ptr, obj.via.str.size);
    }
    return fallback;
}

} // namespace janus::codec
