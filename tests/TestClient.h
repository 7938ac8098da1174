//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TestClient.h
// Purpose: Raw-frame test client over the client end of an InMemoryTransport pair
//==========================================================================================================
#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "mcprt/InMemoryTransport.hpp"
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/Protocol.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {
namespace test {

class TestClient {
public:
    explicit TestClient(std::unique_ptr<InMemoryTransport> t) : transport(std::move(t)) {
        transport->Start().get();
    }

    InMemoryTransport& Transport() { return *transport; }

    void SendRaw(const std::string& frame) {
        ASSERT_TRUE(transport->Send(frame));
    }

    // params is JSON text; empty means no params member
    void Request(const JSONRPCId& id, const std::string& method, const std::string& params = "") {
        JSONRPCRequest req(id, method);
        if (!params.empty()) {
            req.params = ParseJSON(params);
        }
        SendRaw(req.Serialize());
    }

    void Notify(const std::string& method, const std::string& params = "") {
        JSONRPCNotification note(method);
        if (!params.empty()) {
            note.params = ParseJSON(params);
        }
        SendRaw(note.Serialize());
    }

    // Next response; any buffered by ResponseFor are returned first
    std::optional<JSONRPCResponse> Next(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        if (!buffered.empty()) {
            auto it = buffered.begin();
            JSONRPCResponse r = it->second;
            buffered.erase(it);
            return r;
        }
        return readOne(timeout);
    }

    // Waits for the response carrying id; other responses are kept for later calls
    std::optional<JSONRPCResponse> ResponseFor(const JSONRPCId& id,
                                               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        const std::string key = IdKey(id);
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto it = buffered.find(key);
            if (it != buffered.end()) {
                JSONRPCResponse r = it->second;
                buffered.erase(it);
                return r;
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return std::nullopt;
            }
            auto r = readOne(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
            if (!r.has_value()) {
                return std::nullopt;
            }
            if (IdKey(r->id) == key) {
                return r;
            }
            buffered.emplace(IdKey(r->id), std::move(r.value()));
        }
    }

    JSONRPCResponse Call(const JSONRPCId& id, const std::string& method, const std::string& params = "") {
        Request(id, method, params);
        auto r = ResponseFor(id);
        if (!r.has_value()) {
            ADD_FAILURE() << "no response for " << method << " id " << IdToString(id);
            return JSONRPCResponse(id, CreateErrorObject(0, "no response"), true);
        }
        return r.value();
    }

    JSONRPCResponse Initialize(const std::string& version = PROTOCOL_VERSION) {
        auto r = Call(JSONRPCId{std::string("init")}, Methods::Initialize,
                      "{\"protocolVersion\":\"" + version + "\",\"clientInfo\":{\"name\":\"test\",\"version\":\"1\"}}");
        Notify(Methods::Initialized);
        return r;
    }

    // True when no frame arrives within the window
    bool Silent(std::chrono::milliseconds window = std::chrono::milliseconds(200)) {
        return buffered.empty() && !readOne(window).has_value();
    }

    // Waits for the server to close its write side
    bool InputEnded(std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (transport->InputEnded()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return transport->InputEnded();
    }

private:
    std::optional<JSONRPCResponse> readOne(std::chrono::milliseconds timeout) {
        auto frame = transport->ReceiveFor(timeout);
        if (!frame.has_value()) {
            return std::nullopt;
        }
        auto r = JSONRPCResponse::FromJSON(frame.value());
        EXPECT_TRUE(r.has_value()) << "not a response: " << frame.value();
        return r;
    }

    std::unique_ptr<InMemoryTransport> transport;
    std::unordered_map<std::string, JSONRPCResponse> buffered;
};

inline std::optional<errors::McpError> errorOf(const JSONRPCResponse& r) {
    return errors::mcpErrorFromResponse(r);
}

inline std::string stringAt(const JSONValue& v, const std::string& key) {
    const JSONValue* m = v.find(key);
    return (m && m->isString()) ? std::get<std::string>(m->value) : std::string();
}

// First text block of a tools/call result
inline std::string toolText(const JSONRPCResponse& r) {
    if (!r.result.has_value()) return std::string();
    const JSONValue* content = r.result->find("content");
    if (!content || !content->isArray() || std::get<JSONValue::Array>(content->value).empty()) {
        return std::string();
    }
    return stringAt(*std::get<JSONValue::Array>(content->value).front(), "text");
}

inline bool toolIsError(const JSONRPCResponse& r) {
    if (!r.result.has_value()) return false;
    const JSONValue* e = r.result->find("isError");
    return e && std::holds_alternative<bool>(e->value) && std::get<bool>(e->value);
}

} // namespace test
} // namespace mcprt
