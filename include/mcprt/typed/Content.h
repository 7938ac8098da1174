//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Builders and inspectors for content blocks carried in tool, resource, and prompt results
//==========================================================================================================

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcprt/Protocol.h"

namespace mcprt {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// Resource contents item: { uri, mimeType, text }
inline JSONValue makeTextResource(const std::string& uri, const std::string& mimeType, const std::string& text) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(uri);
    obj["mimeType"] = std::make_shared<JSONValue>(mimeType);
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// Prompt message: { role, content: { type: "text", text } }
inline JSONValue makePromptMessage(const std::string& role, const std::string& text) {
    JSONValue::Object obj;
    obj["role"] = std::make_shared<JSONValue>(role);
    obj["content"] = std::make_shared<JSONValue>(makeText(text));
    return JSONValue{obj};
}

inline CallToolResult textResult(const std::string& text, bool isError = false) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    r.isError = isError;
    return r;
}

//------------------------------ Inspectors ------------------------------
inline bool isText(const JSONValue& v) {
    const JSONValue* type = v.find("type");
    return type && type->isString() && std::get<std::string>(type->value) == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    const JSONValue* text = v.find("text");
    if (!text || !text->isString()) return std::nullopt;
    return std::get<std::string>(text->value);
}

inline std::vector<std::string> collectText(const std::vector<JSONValue>& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    auto v = collectText(r.content);
    if (v.empty()) return std::nullopt;
    return v.front();
}

//------------------------------ Argument accessors ------------------------------
// Returns the string member `key` of an arguments object, or std::nullopt.
inline std::optional<std::string> stringArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    if (!v || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

// Returns the integer member `key` of an arguments object, or std::nullopt. Integral doubles are accepted
// when they fit in int64_t.
inline std::optional<int64_t> integerArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    if (!v || !v->isNumber()) return std::nullopt;
    if (v->isInteger()) return std::get<int64_t>(v->value);
    const double d = std::get<double>(v->value);
    // 2^63 is exactly representable; anything at or beyond it does not fit
    constexpr double kLimit = 9223372036854775808.0;
    if (!std::isfinite(d) || std::floor(d) != d || d < -kLimit || d >= kLimit) return std::nullopt;
    return static_cast<int64_t>(d);
}

// Returns the numeric member `key` (integer or double) as double, or std::nullopt.
inline std::optional<double> numberArg(const JSONValue& args, const std::string& key) {
    const JSONValue* v = args.find(key);
    if (!v || !v->isNumber()) return std::nullopt;
    if (v->isInteger()) return static_cast<double>(std::get<int64_t>(v->value));
    return std::get<double>(v->value);
}

} // namespace typed
} // namespace mcprt
