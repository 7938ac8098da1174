//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Frame decoding with envelope validation and best-effort id recovery
//==========================================================================================================

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcprt/MessageCodec.h"

namespace mcprt {

namespace {
bool isWs(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

// Locate the value of a top-level key (e.g., id at root, not inside params) in possibly broken JSON.
// Returns the offset of the first non-whitespace character after the ':'.
std::optional<std::size_t> findTopLevelValue(const std::string& s, const std::string& key) {
    std::size_t i = 0;
    while (i < s.size() && isWs(s[i])) {
        ++i;
    }
    if (i >= s.size() || s[i] != '{') {
        return std::nullopt;
    }
    ++i;
    unsigned int depth = 1u;
    while (i < s.size()) {
        char c = s[i++];
        if (c == '"') {
            std::string keyStr;
            bool esc = false;
            bool closed = false;
            while (i < s.size()) {
                char d = s[i++];
                if (esc) {
                    esc = false;
                    keyStr.push_back(d);
                    continue;
                }
                if (d == '\\') {
                    esc = true;
                    continue;
                }
                if (d == '"') {
                    closed = true;
                    break;
                }
                keyStr.push_back(d);
            }
            if (!closed) {
                return std::nullopt;
            }
            std::size_t j = i;
            while (j < s.size() && isWs(s[j])) {
                ++j;
            }
            if (j < s.size() && s[j] == ':') {
                ++j;
                if (depth == 1u && keyStr == key) {
                    while (j < s.size() && isWs(s[j])) {
                        ++j;
                    }
                    return j;
                }
                i = j;
            }
            continue;
        }
        if (c == '{' || c == '[') {
            ++depth;
            continue;
        }
        if (c == '}' || c == ']') {
            if (depth <= 1u) {
                break;
            }
            --depth;
        }
    }
    return std::nullopt;
}

std::optional<JSONRPCId> idFromValue(const JSONValue& v) {
    if (v.isString()) {
        return JSONRPCId{std::get<std::string>(v.value)};
    }
    if (v.isInteger()) {
        return JSONRPCId{std::get<int64_t>(v.value)};
    }
    return std::nullopt;
}

DecodeFailure invalidRequest(std::optional<JSONRPCId> id, const std::string& reason) {
    DecodeFailure f;
    f.id = std::move(id);
    f.error = errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: " + reason);
    return f;
}
} // namespace

std::optional<JSONRPCId> MessageCodec::RecoverId(const std::string& frame) {
    auto pos = findTopLevelValue(frame, "id");
    if (!pos.has_value() || pos.value() >= frame.size()) {
        return std::nullopt;
    }
    std::size_t i = pos.value();
    if (frame[i] == '"') {
        std::string out;
        ++i;
        while (i < frame.size()) {
            char c = frame[i++];
            if (c == '"') {
                return JSONRPCId{out};
            }
            if (c == '\\') {
                // Only simple escapes are recovered; anything else abandons recovery
                if (i >= frame.size()) return std::nullopt;
                char e = frame[i++];
                if (e == '"' || e == '\\' || e == '/') { out.push_back(e); continue; }
                return std::nullopt;
            }
            out.push_back(c);
        }
        return std::nullopt;
    }
    std::size_t start = i;
    if (frame[i] == '-') ++i;
    std::size_t digitsStart = i;
    while (i < frame.size() && frame[i] >= '0' && frame[i] <= '9') ++i;
    if (i == digitsStart) {
        return std::nullopt;
    }
    // The literal must end at a delimiter; "1.5" or "12abc" are not integer ids
    std::size_t k = i;
    while (k < frame.size() && isWs(frame[k])) ++k;
    if (k < frame.size() && frame[k] != ',' && frame[k] != '}') {
        return std::nullopt;
    }
    errno = 0;
    long long v = std::strtoll(frame.substr(start, i - start).c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return std::nullopt;
    }
    return JSONRPCId{static_cast<int64_t>(v)};
}

DecodedMessage MessageCodec::Decode(const std::string& frame) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(frame);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("MessageCodec: parse error: {}", e.what());
        DecodeFailure f;
        f.id = RecoverId(frame);
        f.error = errors::makeError(JSONRPCErrorCodes::ParseError, "Parse error");
        return f;
    }

    if (!doc.isObject()) {
        return invalidRequest(std::nullopt, "message is not a JSON object");
    }

    // Resolve the id first so envelope errors can be answered
    std::optional<JSONRPCId> id;
    const JSONValue* idVal = doc.find("id");
    const bool hasId = (idVal != nullptr);
    if (hasId) {
        id = idFromValue(*idVal);
    }

    const JSONValue* method = doc.find("method");
    if (!method && (doc.find("result") || doc.find("error"))) {
        // A response addressed to us; the runtime never issues requests, so there is nothing to answer
        return invalidRequest(std::nullopt, "unexpected response message");
    }

    const JSONValue* version = doc.find("jsonrpc");
    if (!version || !version->isString() || std::get<std::string>(version->value) != "2.0") {
        return invalidRequest(id, "jsonrpc must be \"2.0\"");
    }
    if (hasId && !id.has_value()) {
        return invalidRequest(std::nullopt, "id must be a string or an integer");
    }
    if (!method || !method->isString()) {
        return invalidRequest(id, "method must be a string");
    }
    const std::string& methodName = std::get<std::string>(method->value);
    if (methodName.empty()) {
        return invalidRequest(id, "method must not be empty");
    }

    std::optional<JSONValue> params;
    if (const JSONValue* p = doc.find("params")) {
        if (!p->isObject() && !p->isArray()) {
            return invalidRequest(id, "params must be an object or an array");
        }
        params = *p;
    }

    if (id.has_value()) {
        return JSONRPCRequest(id.value(), methodName, std::move(params));
    }
    return JSONRPCNotification(methodName, std::move(params));
}

std::string MessageCodec::Encode(const JSONRPCResponse& response) {
    return response.Serialize();
}

std::string MessageCodec::Encode(const JSONRPCRequest& request) {
    return request.Serialize();
}

std::string MessageCodec::Encode(const JSONRPCNotification& notification) {
    return notification.Serialize();
}

} // namespace mcprt
