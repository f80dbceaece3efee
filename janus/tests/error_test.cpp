#include <gtest/gtest.h>

#include "error.hpp"

#include <string>

TEST(ErrorCodes, CanonicalMessagesAndNames) {
    EXPECT_STREQ(janus::error_message(janus::ErrorCode::parse_error), "Parse error");
    EXPECT_STREQ(janus::error_message(janus::ErrorCode::invalid_request), "Invalid Request");
    EXPECT_STREQ(janus::error_message(janus::ErrorCode::method_not_found), "Method not found");
    EXPECT_STREQ(janus::error_message(janus::ErrorCode::handler_timeout), "Handler timeout");
    EXPECT_STREQ(janus::error_message(janus::ErrorCode::resource_limit_exceeded), "Resource limit exceeded");
    EXPECT_STREQ(janus::error_name(janus::ErrorCode::security_violation), "SECURITY_VIOLATION");
    EXPECT_EQ(static_cast<int>(janus::ErrorCode::method_not_found), -32601);
    EXPECT_EQ(static_cast<int>(janus::ErrorCode::resource_limit_exceeded), -32010);
}

TEST(ErrorCodes, FromIntAcceptsOnlyKnownCodes) {
    EXPECT_EQ(janus::error_code_from_int(-32700), janus::ErrorCode::parse_error);
    EXPECT_EQ(janus::error_code_from_int(-32006), janus::ErrorCode::handler_timeout);
    EXPECT_FALSE(janus::error_code_from_int(-32011).has_value());
    EXPECT_FALSE(janus::error_code_from_int(-32604).has_value());
    EXPECT_FALSE(janus::error_code_from_int(0).has_value());
}

TEST(StructuredError, DescribeIncludesDetails) {
    auto error = janus::StructuredError::make(janus::ErrorCode::invalid_params, "name is required");
    EXPECT_EQ(error.describe(), "JSON-RPC Error -32602: Invalid params - name is required");

    auto bare = janus::StructuredError::make(janus::ErrorCode::internal_error);
    EXPECT_EQ(bare.describe(), "JSON-RPC Error -32603: Internal error");
    EXPECT_FALSE(bare.data.has_value());
}

TEST(StructuredError, WireShapeOmitsEmptyData) {
    auto bare = janus::StructuredError::make(janus::ErrorCode::method_not_found);
    nlohmann::json j = janus::to_json(bare);
    EXPECT_EQ(j["code"], -32601);
    EXPECT_EQ(j["message"], "Method not found");
    EXPECT_FALSE(j.contains("data"));
}

TEST(StructuredError, ValidationCarriesFieldValueAndConstraints) {
    auto error = janus::StructuredError::validation(janus::ErrorCode::invalid_params, "name", "My Workspace!",
                                                    "does not match", {{"pattern", "^[a-z]+$"}});
    nlohmann::json j = janus::to_json(error);
    EXPECT_EQ(j["data"]["field"], "name");
    EXPECT_EQ(j["data"]["value"], "My Workspace!");
    EXPECT_EQ(j["data"]["constraints"]["pattern"], "^[a-z]+$");

    auto parsed = janus::structured_error_from_json(j);
    EXPECT_EQ(parsed.code, -32602);
    ASSERT_TRUE(parsed.data.has_value());
    EXPECT_EQ(parsed.data->field, std::string("name"));
    EXPECT_EQ(parsed.data->details, std::string("does not match"));
}

TEST(StructuredError, UnknownCodeIsPreservedFromWire) {
    auto parsed = janus::structured_error_from_json({{"code", -31999}, {"message", "custom"}});
    EXPECT_EQ(parsed.code, -31999);
    EXPECT_EQ(parsed.message, "custom");
    EXPECT_FALSE(parsed.known_code().has_value());
}

TEST(StructuredError, MissingMessageFallsBackToCanonical) {
    auto parsed = janus::structured_error_from_json({{"code", -32004}});
    EXPECT_EQ(parsed.message, "Resource not found");
}

TEST(StructuredError, NonIntegerCodeIsRejected) {
    EXPECT_THROW(janus::structured_error_from_json({{"code", "E1"}}), janus::JanusError);
    EXPECT_THROW(janus::structured_error_from_json("oops"), janus::JanusError);
}

TEST(JanusError, WhatMatchesDescribe) {
    janus::JanusError error(janus::ErrorCode::socket_error, "bind failed");
    EXPECT_STREQ(error.what(), "JSON-RPC Error -32007: Socket error - bind failed");
    EXPECT_EQ(error.code(), -32007);
    EXPECT_TRUE(error.error().is(janus::ErrorCode::socket_error));
}
