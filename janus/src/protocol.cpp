#include "protocol.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>
#include <regex>

#include <unistd.h>

namespace janus {

namespace {

std::mt19937_64& rng() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // namespace

const nlohmann::json& Request::args_or_empty() const {
    static const nlohmann::json empty = nlohmann::json::object();
    if (args && args->is_object()) {
        return *args;
    }
    return empty;
}

Response Response::ok(const std::string& request_id, nlohmann::json result) {
    Response response;
    response.request_id = request_id;
    response.success = true;
    response.result = std::move(result);
    response.id = generate_uuid();
    response.timestamp = now_rfc3339();
    return response;
}

Response Response::failure(const std::string& request_id, StructuredError error) {
    Response response;
    response.request_id = request_id;
    response.success = false;
    response.error = std::move(error);
    response.id = generate_uuid();
    response.timestamp = now_rfc3339();
    return response;
}

Request make_request(const std::string& command,
                     std::optional<nlohmann::json> args,
                     std::optional<std::string> reply_to,
                     std::optional<double> timeout) {
    Request request;
    request.id = generate_uuid();
    request.command = command;
    request.args = std::move(args);
    request.reply_to = std::move(reply_to);
    request.timeout = timeout;
    request.timestamp = now_rfc3339();
    return request;
}

std::string now_rfc3339() {
    auto now = std::chrono::system_clock::now();
    std::time_t tt = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buffer[32] = {0};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &tm);
    char result[40] = {0};
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis));
    return result;
}

bool is_rfc3339_timestamp(const std::string& text) {
    static const std::regex pattern(
        R"(^\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(\.\d+)?(Z|[+-]\d{2}:\d{2})$)");
    return std::regex_match(text, pattern);
}

std::string generate_uuid() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng());
    uint64_t lo = dist(rng());

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buffer[37] = {0};
    std::snprintf(buffer, sizeof(buffer), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buffer;
}

std::string make_reply_path(const std::string& directory) {
    static std::atomic<uint64_t> sequence{0};
    std::uniform_int_distribution<uint32_t> dist;

    char buffer[96] = {0};
    std::snprintf(buffer, sizeof(buffer), "janus_client_%d_%llu_%08x.sock",
                  static_cast<int>(::getpid()),
                  static_cast<unsigned long long>(sequence.fetch_add(1)),
                  dist(rng()));

    std::string path = directory.empty() ? std::string("/tmp") : directory;
    if (path.back() != '/') {
        path += '/';
    }
    return path + buffer;
}

} // namespace janus
