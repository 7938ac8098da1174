//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_codec.cpp
// Purpose: Frame classification, envelope errors, and id recovery
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "mcprt/MessageCodec.h"

using namespace mcprt;

namespace {
DecodeFailure failureOf(const std::string& frame) {
    DecodedMessage m = MessageCodec::Decode(frame);
    EXPECT_TRUE(std::holds_alternative<DecodeFailure>(m)) << frame;
    if (auto* f = std::get_if<DecodeFailure>(&m)) {
        return *f;
    }
    return DecodeFailure{};
}
} // namespace

TEST(MessageCodec, ClassifiesRequestsAndNotifications) {
    DecodedMessage req = MessageCodec::Decode(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(req));
    EXPECT_EQ(std::get<JSONRPCRequest>(req).method, "tools/list");
    EXPECT_FALSE(std::get<JSONRPCRequest>(req).params.has_value());

    DecodedMessage note = MessageCodec::Decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCNotification>(note));

    DecodedMessage strId = MessageCodec::Decode(R"({"jsonrpc":"2.0","id":"abc","method":"x","params":{"k":1}})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCRequest>(strId));
    EXPECT_EQ(IdKey(std::get<JSONRPCRequest>(strId).id), "s:abc");
    EXPECT_TRUE(std::get<JSONRPCRequest>(strId).params.has_value());
}

TEST(MessageCodec, ParseErrorRecoversId) {
    DecodeFailure f = failureOf(R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{)");
    EXPECT_EQ(f.error.code, JSONRPCErrorCodes::ParseError);
    ASSERT_TRUE(f.id.has_value());
    EXPECT_EQ(IdKey(f.id.value()), "i:42");

    DecodeFailure s = failureOf(R"({"id":"req-7","jsonrpc":"2.0",)");
    ASSERT_TRUE(s.id.has_value());
    EXPECT_EQ(IdKey(s.id.value()), "s:req-7");
}

TEST(MessageCodec, ParseErrorWithoutIdHasNoId) {
    DecodeFailure f = failureOf("this is not json");
    EXPECT_EQ(f.error.code, JSONRPCErrorCodes::ParseError);
    EXPECT_FALSE(f.id.has_value());
}

TEST(MessageCodec, NestedIdIsNotRecovered) {
    DecodeFailure f = failureOf(R"({"params":{"id":5},"method":)");
    EXPECT_FALSE(f.id.has_value());
}

TEST(MessageCodec, EnvelopeErrorsAreInvalidRequest) {
    DecodeFailure version = failureOf(R"({"jsonrpc":"1.0","id":3,"method":"x"})");
    EXPECT_EQ(version.error.code, JSONRPCErrorCodes::InvalidRequest);
    ASSERT_TRUE(version.id.has_value());
    EXPECT_EQ(IdKey(version.id.value()), "i:3");

    DecodeFailure method = failureOf(R"({"jsonrpc":"2.0","id":4,"method":12})");
    EXPECT_EQ(method.error.code, JSONRPCErrorCodes::InvalidRequest);

    DecodeFailure params = failureOf(R"({"jsonrpc":"2.0","id":5,"method":"x","params":"str"})");
    EXPECT_EQ(params.error.code, JSONRPCErrorCodes::InvalidRequest);

    DecodeFailure notObject = failureOf("[1,2,3]");
    EXPECT_EQ(notObject.error.code, JSONRPCErrorCodes::InvalidRequest);
    EXPECT_FALSE(notObject.id.has_value());
}

TEST(MessageCodec, UnusableIdIsNotAnswerable) {
    DecodeFailure f = failureOf(R"({"jsonrpc":"2.0","id":{"x":1},"method":"x"})");
    EXPECT_EQ(f.error.code, JSONRPCErrorCodes::InvalidRequest);
    EXPECT_FALSE(f.id.has_value());
}

TEST(MessageCodec, ResponsesAreRejected) {
    DecodeFailure f = failureOf(R"({"jsonrpc":"2.0","id":9,"result":{}})");
    EXPECT_EQ(f.error.code, JSONRPCErrorCodes::InvalidRequest);
    EXPECT_FALSE(f.id.has_value());
}

TEST(MessageCodec, RecoverIdRejectsNonIntegers) {
    EXPECT_FALSE(MessageCodec::RecoverId(R"({"id":1.5,"x":)").has_value());
    EXPECT_FALSE(MessageCodec::RecoverId(R"({"id":null})").has_value());
    auto neg = MessageCodec::RecoverId(R"({"id": -8 , "broken)");
    ASSERT_TRUE(neg.has_value());
    EXPECT_EQ(IdKey(neg.value()), "i:-8");
}
