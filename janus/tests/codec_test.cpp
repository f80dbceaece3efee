#include <gtest/gtest.h>

#include "codec.hpp"
#include "error.hpp"
#include "protocol.hpp"

#include <msgpack.hpp>

#include <regex>
#include <string>

using janus::codec::WireFormat;

namespace {

janus::ErrorCode decode_failure(const std::string& bytes) {
    try {
        janus::codec::decode_request(bytes);
    } catch (const janus::JanusError& exc) {
        return *exc.error().known_code();
    }
    return janus::ErrorCode::internal_error;
}

std::string to_msgpack(const nlohmann::json& document) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    janus::codec::pack_json(pk, document);
    return std::string(buffer.data(), buffer.size());
}

} // namespace

TEST(Codec, RequestRoundTripKeepsAbsentFieldsAbsent) {
    auto request = janus::make_request("ping", std::nullopt, std::nullopt, std::nullopt);
    auto decoded = janus::codec::decode_request(janus::codec::encode_request(request));

    EXPECT_EQ(decoded.id, request.id);
    EXPECT_EQ(decoded.command, "ping");
    EXPECT_EQ(decoded.timestamp, request.timestamp);
    EXPECT_FALSE(decoded.args.has_value());
    EXPECT_FALSE(decoded.reply_to.has_value());
    EXPECT_FALSE(decoded.timeout.has_value());
    EXPECT_FALSE(decoded.expects_reply());
    EXPECT_TRUE(decoded.args_or_empty().empty());
}

TEST(Codec, RequestCarriesCommandUnderBothNames) {
    auto request = janus::make_request("echo", nlohmann::json{{"message", "hi"}}, std::string("/tmp/r.sock"), 5.0);
    auto document = janus::codec::request_to_json(request);
    EXPECT_EQ(document["command"], "echo");
    EXPECT_EQ(document["method"], "echo");
    EXPECT_EQ(document["reply_to"], "/tmp/r.sock");
    EXPECT_DOUBLE_EQ(document["timeout"].get<double>(), 5.0);
}

TEST(Codec, MethodIsAcceptedWhenCommandIsMissing) {
    auto request = janus::codec::decode_request(
        R"({"id":"r1","method":"ping","timestamp":"2024-01-01T00:00:00.000Z","extra":[1,2]})");
    EXPECT_EQ(request.command, "ping");
    EXPECT_EQ(request.id, "r1");
}

TEST(Codec, ResponseCarriesRequestIdUnderBothNames) {
    auto response = janus::Response::ok("req-1", {{"message", "pong"}});
    auto document = janus::codec::response_to_json(response);
    EXPECT_EQ(document["request_id"], "req-1");
    EXPECT_EQ(document["command_id"], "req-1");
    EXPECT_FALSE(document.contains("error"));

    auto decoded = janus::codec::decode_response(R"({"command_id":"req-2","success":true,"result":{"x":1}})");
    EXPECT_EQ(decoded.request_id, "req-2");
    ASSERT_TRUE(decoded.result.has_value());
    EXPECT_EQ((*decoded.result)["x"], 1);
}

TEST(Codec, FailedResponseRoundTripsError) {
    auto response = janus::Response::failure(
        "req-3", janus::StructuredError::make(janus::ErrorCode::method_not_found, "unknown command"));
    auto decoded = janus::codec::decode_response(janus::codec::encode_response(response));
    EXPECT_FALSE(decoded.success);
    EXPECT_FALSE(decoded.result.has_value());
    ASSERT_TRUE(decoded.error.has_value());
    EXPECT_TRUE(decoded.error->is(janus::ErrorCode::method_not_found));
    EXPECT_EQ(decoded.error->data->details.value_or(""), "unknown command");
}

TEST(Codec, FailedResponseWithoutErrorIsInvalid) {
    EXPECT_THROW(janus::codec::decode_response(R"({"request_id":"a","success":false})"), janus::JanusError);
}

TEST(Codec, MessagePackIsDetectedAndDecoded) {
    auto request = janus::make_request("echo", nlohmann::json{{"message", "hi"}}, std::string("/tmp/r.sock"), 2.5);
    std::string bytes = janus::codec::encode_request(request, WireFormat::msgpack);
    EXPECT_EQ(janus::codec::detect_format(bytes), WireFormat::msgpack);
    EXPECT_EQ(janus::codec::detect_format(janus::codec::encode_request(request)), WireFormat::json);

    auto decoded = janus::codec::decode_request(bytes);
    EXPECT_EQ(decoded.id, request.id);
    EXPECT_EQ(decoded.command, "echo");
    EXPECT_EQ(decoded.args_or_empty()["message"], "hi");
    EXPECT_EQ(decoded.reply_to.value_or(""), "/tmp/r.sock");
    EXPECT_DOUBLE_EQ(decoded.timeout.value_or(0), 2.5);
}

TEST(Codec, GarbageIsParseErrorAndBadEnvelopeIsInvalidRequest) {
    EXPECT_EQ(decode_failure(""), janus::ErrorCode::parse_error);
    EXPECT_EQ(decode_failure("not json at all"), janus::ErrorCode::parse_error);
    EXPECT_EQ(decode_failure(R"({"id":"a","command":)"), janus::ErrorCode::parse_error);

    EXPECT_EQ(decode_failure("[1,2,3]"), janus::ErrorCode::invalid_request);
    EXPECT_EQ(decode_failure(R"({"command":"ping"})"), janus::ErrorCode::invalid_request);
    EXPECT_EQ(decode_failure(R"({"id":"a"})"), janus::ErrorCode::invalid_request);
    EXPECT_EQ(decode_failure(R"({"id":"a","command":"ping","args":[1]})"), janus::ErrorCode::invalid_request);
    EXPECT_EQ(decode_failure(R"({"id":"a","command":"ping","timeout":"soon"})"), janus::ErrorCode::invalid_request);
}

TEST(Codec, NumericTimestampIsNormalised) {
    auto request = janus::codec::decode_request(R"({"id":"a","command":"ping","timestamp":1700000000.25})");
    EXPECT_EQ(request.timestamp, "2023-11-14T22:13:20.250Z");
}

TEST(Codec, ReplyToIsSalvagedFromBrokenPayloads) {
    auto salvaged = janus::codec::salvage_reply_to(R"({"reply_to":"/tmp/c.sock","command":)");
    EXPECT_EQ(salvaged.value_or(""), "/tmp/c.sock");
    EXPECT_FALSE(janus::codec::salvage_reply_to("garbage").has_value());

    std::string packed = to_msgpack({{"reply_to", "/tmp/m.sock"}, {"command", 7}});
    EXPECT_EQ(janus::codec::salvage_reply_to(packed).value_or(""), "/tmp/m.sock");
}

TEST(Protocol, TimestampsAndIdentifiers) {
    EXPECT_TRUE(janus::is_rfc3339_timestamp(janus::now_rfc3339()));
    EXPECT_TRUE(janus::is_rfc3339_timestamp("2024-05-01T10:00:00+02:00"));
    EXPECT_FALSE(janus::is_rfc3339_timestamp("2024-05-01 10:00:00"));

    static const std::regex uuid_v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::string first = janus::generate_uuid();
    EXPECT_TRUE(std::regex_match(first, uuid_v4)) << first;
    EXPECT_NE(first, janus::generate_uuid());

    std::string reply = janus::make_reply_path("/tmp");
    EXPECT_EQ(reply.rfind("/tmp/janus_client_", 0), 0u);
    EXPECT_NE(reply, janus::make_reply_path("/tmp"));
}
