//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_cancellation.cpp
// Purpose: Tests for server-side cancellation propagation via notifications/cancelled
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "TestServer.h"

using namespace mcprt;
using namespace mcprt::test;
using namespace std::chrono_literals;

TEST(Cancellation, CancelsLongRunningTool) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();

    // Send tools/call with a known id so we can cancel it
    const JSONRPCId id{std::string("cancel-1")};
    h.Client().Request(id, Methods::CallTool, R"({"name":"slow","arguments":{"ms":5000}})");
    std::this_thread::sleep_for(50ms);
    h.Client().Notify(Methods::Cancelled, R"({"requestId":"cancel-1","reason":"user pressed stop"})");

    auto r = h.Client().ResponseFor(id, 2s);
    ASSERT_TRUE(r.has_value());
    auto err = errorOf(r.value());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::RequestCancelled);
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(stringAt(err->data.value(), "reason"), "user pressed stop");
    // Exactly one response for the cancelled id
    EXPECT_TRUE(h.Client().Silent(300ms));
}

TEST(Cancellation, HandlerObservesStopToken) {
    auto observed = std::make_shared<std::atomic<bool>>(false);
    auto started = std::make_shared<std::atomic<bool>>(false);
    Server server(testOptions());
    server.RegisterTool(Tool{"watch", "Waits for cancellation"}, [observed, started](const JSONValue&, std::stop_token st) {
        started->store(true);
        const auto deadline = std::chrono::steady_clock::now() + 3s;
        while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(2ms);
        }
        observed->store(st.stop_requested());
        return typed::textResult("finished");
    });
    auto pair = InMemoryTransport::CreatePair();
    TestClient client(std::move(pair.first));
    server.Start(std::move(pair.second)).get();
    client.Initialize();

    client.Request(JSONRPCId{static_cast<int64_t>(11)}, Methods::CallTool, R"({"name":"watch"})");
    const auto startDeadline = std::chrono::steady_clock::now() + 2s;
    while (!started->load() && std::chrono::steady_clock::now() < startDeadline) {
        std::this_thread::sleep_for(2ms);
    }
    ASSERT_TRUE(started->load());
    // Integer ids are matched as integers
    client.Notify(Methods::Cancelled, R"({"requestId":11})");
    auto r = client.ResponseFor(JSONRPCId{static_cast<int64_t>(11)}, 2s);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(errorOf(r.value())->code, JSONRPCErrorCodes::RequestCancelled);
    EXPECT_EQ(stringAt(errorOf(r.value())->data.value(), "reason"), "Cancelled by client");

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!observed->load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(observed->load());
    server.Stop().wait_for(5s);
}

TEST(Cancellation, UnknownOrCompletedIdsAreIgnored) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    JSONRPCResponse done = h.Client().Call(JSONRPCId{static_cast<int64_t>(1)}, Methods::CallTool, R"({"name":"ping"})");
    EXPECT_EQ(toolText(done), "pong");

    h.Client().Notify(Methods::Cancelled, R"({"requestId":1})");
    h.Client().Notify(Methods::Cancelled, R"({"requestId":"never-sent"})");
    h.Client().Notify(Methods::Cancelled, R"({"reason":"no id"})");
    h.Client().Notify(Methods::Cancelled);
    EXPECT_TRUE(h.Client().Silent());

    // Session keeps serving after ignored cancellations
    JSONRPCResponse after = h.Client().Call(JSONRPCId{static_cast<int64_t>(2)}, Methods::CallTool, R"({"name":"ping"})");
    EXPECT_EQ(toolText(after), "pong");
}

TEST(Cancellation, CancellingOneCallLeavesOthersRunning) {
    ServerHarness h;
    h.Start();
    h.Client().Initialize();
    const JSONRPCId a{std::string("a")};
    const JSONRPCId b{std::string("b")};
    h.Client().Request(a, Methods::CallTool, R"({"name":"slow","arguments":{"ms":5000}})");
    h.Client().Request(b, Methods::CallTool, R"({"name":"slow","arguments":{"ms":200}})");
    h.Client().Notify(Methods::Cancelled, R"({"requestId":"a"})");

    auto ra = h.Client().ResponseFor(a, 2s);
    ASSERT_TRUE(ra.has_value());
    EXPECT_EQ(errorOf(ra.value())->code, JSONRPCErrorCodes::RequestCancelled);
    auto rb = h.Client().ResponseFor(b, 2s);
    ASSERT_TRUE(rb.has_value());
    EXPECT_EQ(toolText(rb.value()), "done");
}
