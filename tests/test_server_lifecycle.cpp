//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_lifecycle.cpp
// Purpose: End-to-end session tests: initialize, dispatch, errors, and shutdown over an in-memory pair
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>

#include "TestServer.h"

using namespace mcprt;
using namespace mcprt::test;
using namespace std::chrono_literals;

namespace {
JSONRPCId num(int64_t v) { return JSONRPCId{v}; }

const JSONValue::Array& arrayAt(const JSONValue& v, const std::string& key) {
    static const JSONValue::Array empty;
    const JSONValue* m = v.find(key);
    return (m && m->isArray()) ? std::get<JSONValue::Array>(m->value) : empty;
}
} // namespace

//////////////////////////////////////////// Initialize ////////////////////////////////////////////

TEST(ServerLifecycle, InitializeReturnsServerInfoAndManifest) {
    ServerHarness h;
    h.Start();
    JSONRPCResponse r = h.Client().Initialize();
    ASSERT_FALSE(r.IsError());
    ASSERT_TRUE(r.result.has_value());
    const JSONValue& res = r.result.value();
    EXPECT_EQ(stringAt(res, "protocolVersion"), PROTOCOL_VERSION);
    EXPECT_EQ(stringAt(*res.find("serverInfo"), "name"), "test-server");
    EXPECT_EQ(stringAt(*res.find("serverInfo"), "version"), "0.0.1");
    ASSERT_NE(res.find("capabilities"), nullptr);
    EXPECT_NE(res.find("capabilities")->find("tools"), nullptr);

    const JSONValue* manifest = res.find("manifest");
    ASSERT_NE(manifest, nullptr);
    const auto& tools = arrayAt(*manifest, "tools");
    ASSERT_EQ(tools.size(), 6u);
    EXPECT_EQ(stringAt(*tools[0], "name"), "add_numbers");
    EXPECT_NE(tools[0]->find("inputSchema"), nullptr);
    const auto& resources = arrayAt(*manifest, "resources");
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(stringAt(*resources[0], "uri"), "config://server");
    EXPECT_EQ(arrayAt(*manifest, "prompts").size(), 1u);
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::Ready);
}

TEST(ServerLifecycle, UnsupportedProtocolVersionIsNegotiated) {
    ServerHarness h;
    h.Start();
    JSONRPCResponse r = h.Client().Initialize("1999-01-01");
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(stringAt(r.result.value(), "protocolVersion"), PROTOCOL_VERSION);

    ServerHarness older;
    older.Start();
    JSONRPCResponse o = older.Client().Initialize("2024-11-05");
    EXPECT_EQ(stringAt(o.result.value(), "protocolVersion"), "2024-11-05");
}

TEST(ServerLifecycle, InitializeWithoutProtocolVersionIsInvalidParams) {
    ServerHarness h;
    h.Start();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::Initialize, R"({"clientInfo":{"name":"x"}})");
    auto err = errorOf(r);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::Uninitialized);
}

TEST(ServerLifecycle, SecondInitializeRejected) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse again = h.Client().Call(num(2), Methods::Initialize, R"({"protocolVersion":"2025-06-18"})");
    auto err = errorOf(again);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidRequest);
}

TEST(ServerLifecycle, RequestBeforeInitializeIsServerNotReady) {
    ServerHarness h;
    h.Start();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::CallTool, R"({"name":"add_numbers","arguments":{"a":2,"b":3}})");
    auto err = errorOf(r);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::ServerNotReady);
}

TEST(ServerLifecycle, RegistrationClosesAtInitialize) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    EXPECT_THROW(h.Srv().RegisterTool(Tool{"late", "late"}, [](const JSONValue&, std::stop_token) {
        return typed::textResult("late");
    }), errors::RegistryClosedError);
}

//////////////////////////////////////////// Tools ////////////////////////////////////////////

TEST(ServerTools, AddNumbersReturnsSum) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::CallTool, R"({"name":"add_numbers","arguments":{"a":2,"b":3}})");
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(toolText(r), "5");
    EXPECT_FALSE(toolIsError(r));
    EXPECT_EQ(IdKey(r.id), "i:1");
}

TEST(ServerTools, WrongArgumentTypeIsInvalidParamsNamingField) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(2), Methods::CallTool, R"({"name":"add_numbers","arguments":{"a":"5","b":3}})");
    auto err = errorOf(r);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(stringAt(err->data.value(), "field"), "a");
}

TEST(ServerTools, InvalidArgumentsNeverReachHandler) {
    ServerHarness h;
    auto calls = std::make_shared<std::atomic<int>>(0);
    h.Srv().RegisterTool(Tool{"count", "Counts invocations",
        schemaOf(R"({"type":"object","properties":{"n":{"type":"integer"}},"required":["n"],"additionalProperties":false})")},
        [calls](const JSONValue&, std::stop_token) {
            calls->fetch_add(1);
            return typed::textResult("counted");
        });
    h.Start();
    h.Client().Initialize();
    const char* invalid[] = {
        R"({"name":"count","arguments":{"n":"x"}})",
        R"({"name":"count","arguments":{}})",
        R"({"name":"count","arguments":{"n":1,"m":2}})",
        R"({"name":"count","arguments":{"n":1.5}})",
    };
    int64_t next = 1;
    for (const char* params : invalid) {
        auto err = errorOf(h.Client().Call(num(next++), Methods::CallTool, params));
        ASSERT_TRUE(err.has_value()) << params;
        EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams) << params;
    }
    EXPECT_EQ(calls->load(), 0);
    JSONRPCResponse ok = h.Client().Call(num(next), Methods::CallTool, R"({"name":"count","arguments":{"n":1}})");
    EXPECT_EQ(toolText(ok), "counted");
    EXPECT_EQ(calls->load(), 1);
}

TEST(ServerTools, AddNumbersAcceptsIntegralDoubles) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::CallTool, R"({"name":"add_numbers","arguments":{"a":2.0,"b":3}})");
    EXPECT_EQ(toolText(r), "5");
}

TEST(ServerTools, AddNumbersOverflowIsToolError) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::CallTool,
                                        R"({"name":"add_numbers","arguments":{"a":9223372036854775807,"b":1}})");
    ASSERT_FALSE(r.IsError());
    EXPECT_TRUE(toolIsError(r));
    EXPECT_EQ(toolText(r), "integer overflow");
}

TEST(ServerTools, ArgumentsForSchemalessToolRejected) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse ok = h.Client().Call(num(1), Methods::CallTool, R"({"name":"ping"})");
    EXPECT_EQ(toolText(ok), "pong");
    JSONRPCResponse bad = h.Client().Call(num(2), Methods::CallTool, R"({"name":"ping","arguments":{"x":1}})");
    auto err = errorOf(bad);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
}

TEST(ServerTools, UnknownToolIsCapabilityNotFound) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(3), Methods::CallTool, R"({"name":"subtract","arguments":{}})");
    auto err = errorOf(r);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::CapabilityNotFound);
    EXPECT_EQ(err->message, "Tool not found: subtract");
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(stringAt(err->data.value(), "name"), "subtract");
}

TEST(ServerTools, MissingOrMalformedEnvelopeIsInvalidParams) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    auto noName = errorOf(h.Client().Call(num(1), Methods::CallTool, "{}"));
    ASSERT_TRUE(noName.has_value());
    EXPECT_EQ(noName->code, JSONRPCErrorCodes::InvalidParams);
    auto badArgs = errorOf(h.Client().Call(num(2), Methods::CallTool, R"({"name":"echo","arguments":[1]})"));
    ASSERT_TRUE(badArgs.has_value());
    EXPECT_EQ(badArgs->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(stringAt(badArgs->data.value(), "field"), "arguments");
    // _meta is always accepted
    JSONRPCResponse meta = h.Client().Call(num(3), Methods::CallTool,
                                           R"({"name":"echo","arguments":{"message":"hi"},"_meta":{"progressToken":1}})");
    EXPECT_EQ(toolText(meta), "hi");
}

TEST(ServerTools, ApplicationFailureIsErrorResultNotProtocolError) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(4), Methods::CallTool, R"({"name":"fail"})");
    ASSERT_FALSE(r.IsError());
    EXPECT_TRUE(toolIsError(r));
    EXPECT_EQ(toolText(r), "disk full");
}

TEST(ServerTools, UnknownMethodIsMethodNotFound) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    auto err = errorOf(h.Client().Call(num(5), "tools/frobnicate", "{}"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::MethodNotFound);
}

TEST(ServerTools, ConcurrentCallsAllAnsweredOnce) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    for (int64_t i = 0; i < 16; ++i) {
        h.Client().Request(num(100 + i), Methods::CallTool,
                           R"({"name":"add_numbers","arguments":{"a":)" + std::to_string(i) + R"(,"b":1000}})");
    }
    std::set<std::string> seen;
    for (int64_t i = 0; i < 16; ++i) {
        auto r = h.Client().ResponseFor(num(100 + i), 5s);
        ASSERT_TRUE(r.has_value()) << "missing response " << i;
        EXPECT_EQ(toolText(r.value()), std::to_string(1000 + i));
        EXPECT_TRUE(seen.insert(IdKey(r->id)).second);
    }
    EXPECT_TRUE(h.Client().Silent());
}

TEST(ServerTools, ToolOutputIsTruncated) {
    ServerOptions o = testOptions();
    o.maxToolOutputBytes = 64;
    ServerHarness h(o);
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse small = h.Client().Call(num(1), Methods::CallTool, R"({"name":"big","arguments":{"n":64}})");
    EXPECT_EQ(toolText(small).size(), 64u);
    JSONRPCResponse big = h.Client().Call(num(2), Methods::CallTool, R"({"name":"big","arguments":{"n":500}})");
    const std::string text = toolText(big);
    EXPECT_EQ(text.substr(0, 64), std::string(64, 'x'));
    EXPECT_NE(text.find("[truncated 436 bytes]"), std::string::npos);
}

TEST(ServerTools, TimeoutIsReportedAsRequestTimeout) {
    ServerOptions o = testOptions();
    o.requestTimeout = 100ms;
    ServerHarness h(o);
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(9), Methods::CallTool, R"({"name":"slow","arguments":{"ms":3000}})");
    auto err = errorOf(r);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::RequestTimeout);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(*err->data->find("timeoutMs"), JSONValue(static_cast<int64_t>(100)));
    // The abandoned handler's late result never reaches the client
    EXPECT_TRUE(h.Client().Silent(300ms));
}

//////////////////////////////////////////// Framing ////////////////////////////////////////////

TEST(ServerFraming, ParseErrorWithRecoverableIdIsAnswered) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    h.Client().SendRaw(R"({"jsonrpc":"2.0","id":77,"method":"tools/list",)");
    auto r = h.Client().ResponseFor(num(77));
    ASSERT_TRUE(r.has_value());
    auto err = errorOf(r.value());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::ParseError);
}

TEST(ServerFraming, UnanswerableFramesAreDroppedAndSessionContinues) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    h.Client().SendRaw("not json at all");
    h.Client().SendRaw(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})");
    h.Client().SendRaw(R"({"jsonrpc":"2.0","id":4,"result":{}})");
    EXPECT_TRUE(h.Client().Silent());
    JSONRPCResponse r = h.Client().Call(num(5), Methods::CallTool, R"({"name":"ping"})");
    EXPECT_EQ(toolText(r), "pong");
}

TEST(ServerFraming, EnvelopeErrorWithIdIsInvalidRequest) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    h.Client().SendRaw(R"({"jsonrpc":"1.0","id":"v","method":"tools/list"})");
    auto r = h.Client().ResponseFor(JSONRPCId{std::string("v")});
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(errorOf(r.value())->code, JSONRPCErrorCodes::InvalidRequest);
}

TEST(ServerFraming, DuplicateInFlightIdIsDropped) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    h.Client().Request(num(5), Methods::CallTool, R"({"name":"slow","arguments":{"ms":300}})");
    h.Client().Request(num(5), Methods::CallTool, R"({"name":"echo","arguments":{"message":"dup"}})");
    auto r = h.Client().ResponseFor(num(5), 3s);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(toolText(r.value()), "done");
    EXPECT_TRUE(h.Client().Silent(300ms));
    // Once answered, the id may be reused
    JSONRPCResponse again = h.Client().Call(num(5), Methods::CallTool, R"({"name":"echo","arguments":{"message":"again"}})");
    EXPECT_EQ(toolText(again), "again");
}

TEST(ServerFraming, StringAndIntegerIdsAreDistinct) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    h.Client().Request(JSONRPCId{std::string("1")}, Methods::CallTool, R"({"name":"slow","arguments":{"ms":100}})");
    h.Client().Request(num(1), Methods::CallTool, R"({"name":"echo","arguments":{"message":"int"}})");
    auto intResp = h.Client().ResponseFor(num(1));
    auto strResp = h.Client().ResponseFor(JSONRPCId{std::string("1")});
    ASSERT_TRUE(intResp.has_value());
    ASSERT_TRUE(strResp.has_value());
    EXPECT_EQ(toolText(intResp.value()), "int");
    EXPECT_EQ(toolText(strResp.value()), "done");
}

//////////////////////////////////////////// Listing ////////////////////////////////////////////

TEST(ServerListing, PagesThroughToolsInRegistrationOrder) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    std::vector<std::string> names;
    std::string params = R"({"limit":4})";
    for (int page = 0; page < 5; ++page) {
        JSONRPCResponse r = h.Client().Call(num(10 + page), Methods::ListTools, params);
        ASSERT_FALSE(r.IsError());
        for (const auto& t : arrayAt(r.result.value(), "tools")) {
            names.push_back(stringAt(*t, "name"));
        }
        const JSONValue* next = r.result->find("nextCursor");
        if (next == nullptr) {
            break;
        }
        params = R"({"limit":4,"cursor":")" + std::get<std::string>(next->value) + R"("})";
    }
    const std::vector<std::string> expected{"add_numbers", "echo", "fail", "slow", "big", "ping"};
    EXPECT_EQ(names, expected);
}

TEST(ServerListing, ListWithoutParamsReturnsEverything) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse tools = h.Client().Call(num(1), Methods::ListTools);
    EXPECT_EQ(arrayAt(tools.result.value(), "tools").size(), 6u);
    EXPECT_EQ(tools.result->find("nextCursor"), nullptr);
    JSONRPCResponse res = h.Client().Call(num(2), Methods::ListResources);
    const auto& resources = arrayAt(res.result.value(), "resources");
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(stringAt(*resources[0], "mimeType"), "application/json");
    JSONRPCResponse prompts = h.Client().Call(num(3), Methods::ListPrompts);
    EXPECT_EQ(arrayAt(prompts.result.value(), "prompts").size(), 1u);
}

TEST(ServerListing, InvalidCursorOrUnknownParamRejected) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    auto cursor = errorOf(h.Client().Call(num(1), Methods::ListTools, R"({"cursor":"abc"})"));
    ASSERT_TRUE(cursor.has_value());
    EXPECT_EQ(cursor->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(stringAt(cursor->data.value(), "field"), "cursor");
    auto extra = errorOf(h.Client().Call(num(2), Methods::ListTools, R"({"foo":1})"));
    ASSERT_TRUE(extra.has_value());
    EXPECT_EQ(stringAt(extra->data.value(), "field"), "foo");
    auto limit = errorOf(h.Client().Call(num(3), Methods::ListTools, R"({"limit":0})"));
    ASSERT_TRUE(limit.has_value());
    EXPECT_EQ(stringAt(limit->data.value(), "field"), "limit");
}

TEST(ServerListing, LimitBeyondIntegerRangeListsEverything) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::ListTools, R"({"limit":1e300})");
    ASSERT_FALSE(r.IsError());
    EXPECT_EQ(arrayAt(r.result.value(), "tools").size(), 6u);
    EXPECT_EQ(r.result->find("nextCursor"), nullptr);
    JSONRPCResponse big = h.Client().Call(num(2), Methods::ListTools, R"({"limit":9223372036854775807,"cursor":"2"})");
    ASSERT_FALSE(big.IsError());
    EXPECT_EQ(arrayAt(big.result.value(), "tools").size(), 4u);
    EXPECT_EQ(big.result->find("nextCursor"), nullptr);
}

//////////////////////////////////////////// Resources and prompts ////////////////////////////////////////////

TEST(ServerResources, ReadReturnsContents) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::ReadResource, R"({"uri":"config://server"})");
    ASSERT_FALSE(r.IsError());
    const auto& contents = arrayAt(r.result.value(), "contents");
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(stringAt(*contents[0], "uri"), "config://server");
    EXPECT_EQ(stringAt(*contents[0], "text"), R"({"ok":true})");
    EXPECT_EQ(r.result->find("isError"), nullptr);
}

TEST(ServerResources, UnknownUriAndFailingReader) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    auto missing = errorOf(h.Client().Call(num(1), Methods::ReadResource, R"({"uri":"file:///nope"})"));
    ASSERT_TRUE(missing.has_value());
    EXPECT_EQ(missing->code, JSONRPCErrorCodes::CapabilityNotFound);
    EXPECT_EQ(missing->message, "Resource not found: file:///nope");

    JSONRPCResponse broken = h.Client().Call(num(2), Methods::ReadResource, R"({"uri":"file:///broken"})");
    ASSERT_FALSE(broken.IsError());
    const JSONValue* isError = broken.result->find("isError");
    ASSERT_NE(isError, nullptr);
    EXPECT_EQ(*isError, JSONValue(true));
    const auto& contents = arrayAt(broken.result.value(), "contents");
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(stringAt(*contents[0], "text"), "permission denied");
}

TEST(ServerPrompts, GetRendersMessages) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::GetPrompt,
                                        R"({"name":"code_review","arguments":{"code":"int x;","language":"C++"}})");
    ASSERT_FALSE(r.IsError());
    const auto& messages = arrayAt(r.result.value(), "messages");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(stringAt(*messages[0], "role"), "user");
    EXPECT_EQ(stringAt(*messages[0]->find("content"), "text"), "Review this code: int x; (C++)");
}

TEST(ServerPrompts, MissingRequiredArgumentIsInvalidParams) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    auto err = errorOf(h.Client().Call(num(1), Methods::GetPrompt, R"({"name":"code_review","arguments":{}})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(stringAt(err->data.value(), "field"), "code");
    auto unknown = errorOf(h.Client().Call(num(2), Methods::GetPrompt, R"({"name":"summarize"})"));
    ASSERT_TRUE(unknown.has_value());
    EXPECT_EQ(unknown->code, JSONRPCErrorCodes::CapabilityNotFound);
}

//////////////////////////////////////////// Validation ////////////////////////////////////////////

TEST(ServerValidation, StrictModeRejectsMalformedResults) {
    ServerOptions o = testOptions();
    o.validationMode = validation::ValidationMode::Strict;
    Server server(o);
    server.RegisterTool(Tool{"weird", "Bad content"}, [](const JSONValue&, std::stop_token) {
        CallToolResult r;
        JSONValue::Object block;
        block["type"] = std::make_shared<JSONValue>(std::string("hologram"));
        r.content.push_back(JSONValue{block});
        return r;
    });
    auto pair = InMemoryTransport::CreatePair();
    TestClient client(std::move(pair.first));
    server.Start(std::move(pair.second)).get();
    client.Initialize();
    auto err = errorOf(client.Call(num(1), Methods::CallTool, R"({"name":"weird"})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InternalError);
    server.Stop().wait_for(5s);
}

//////////////////////////////////////////// Shutdown ////////////////////////////////////////////

TEST(ServerShutdown, RequestsDuringShutdownAreRejectedWhileInFlightFinish) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    h.Client().Request(JSONRPCId{std::string("s1")}, Methods::CallTool, R"({"name":"slow","arguments":{"ms":300}})");
    h.Client().Notify(Methods::Shutdown);
    JSONRPCResponse rejected = h.Client().Call(num(2), Methods::CallTool, R"({"name":"add_numbers","arguments":{"a":1,"b":1}})");
    auto err = errorOf(rejected);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::ShuttingDown);

    // In-flight work still completes inside the grace period
    auto slow = h.Client().ResponseFor(JSONRPCId{std::string("s1")}, 3s);
    ASSERT_TRUE(slow.has_value());
    EXPECT_EQ(toolText(slow.value()), "done");
    EXPECT_TRUE(h.Client().InputEnded());
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::Closed);
}

TEST(ServerShutdown, RequestAfterShutdownWithNothingInFlightIsRejected) {
    ServerOptions o = testOptions();
    o.shutdownGrace = 5000ms;
    ServerHarness h(o);
    h.Start();
    h.Client().Initialize();
    h.Client().Notify(Methods::Shutdown);
    // Nothing is in flight, so only the client hangup may close the session now
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::ShuttingDown);
    for (int64_t i = 2; i < 5; ++i) {
        auto err = errorOf(h.Client().Call(num(i), Methods::CallTool, R"({"name":"add_numbers","arguments":{"a":1,"b":1}})"));
        ASSERT_TRUE(err.has_value());
        EXPECT_EQ(err->code, JSONRPCErrorCodes::ShuttingDown);
    }
    // Hanging up ends the session well before the grace period
    h.Client().Transport().CloseWrite();
    EXPECT_TRUE(h.Client().InputEnded(2000ms));
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::Closed);
}

TEST(ServerShutdown, ShutdownRequestIsAcknowledged) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse r = h.Client().Call(num(1), Methods::Shutdown);
    ASSERT_FALSE(r.IsError());
    EXPECT_TRUE(r.result->isObject());
    EXPECT_TRUE(h.Client().InputEnded());
}

TEST(ServerShutdown, InputEofClosesSession) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    EXPECT_TRUE(h.Srv().IsRunning());
    h.Client().Transport().CloseWrite();
    EXPECT_TRUE(h.Client().InputEnded());
    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (h.Srv().IsRunning() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(h.Srv().IsRunning());
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::Closed);
}

TEST(ServerShutdown, StopFromApplicationCompletes) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    auto stopped = h.Srv().Stop();
    ASSERT_EQ(stopped.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(h.Srv().Phase(), SessionPhase::Closed);
    EXPECT_TRUE(h.Client().InputEnded());
}

TEST(ServerShutdown, RunTwiceIsRejected) {
    ServerHarness h;
    h.Start();
    auto pair = InMemoryTransport::CreatePair();
    EXPECT_THROW(h.Srv().Start(std::move(pair.second)), std::logic_error);
}
