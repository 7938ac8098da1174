//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Shape checks for handler results before they are serialized (Strict validation mode)
//==========================================================================================================

#pragma once

#include <string>
#include <optional>
#include <vector>
#include "mcprt/Protocol.h"

namespace mcprt {
namespace validation {

//------------------------------ Primitive content checks ------------------------------
inline bool isStringMember(const JSONValue& v, const char* key) {
    const JSONValue* m = v.find(key);
    return m && m->isString();
}

// Tool content block: text, image/audio (data + mimeType), or embedded resource
inline bool isContentBlock(const JSONValue& v) {
    if (!isStringMember(v, "type")) return false;
    const std::string& type = std::get<std::string>(v.find("type")->value);
    if (type == "text") return isStringMember(v, "text");
    if (type == "image" || type == "audio") return isStringMember(v, "data") && isStringMember(v, "mimeType");
    if (type == "resource") {
        const JSONValue* r = v.find("resource");
        return r && r->isObject() && isStringMember(*r, "uri");
    }
    return false;
}

// Resource contents item: { uri, mimeType?, text | blob }
inline bool isResourceContents(const JSONValue& v) {
    if (!isStringMember(v, "uri")) return false;
    const JSONValue* mime = v.find("mimeType");
    if (mime && !mime->isString()) return false;
    return isStringMember(v, "text") || isStringMember(v, "blob");
}

// Prompt message: { role: "user" | "assistant", content: <content block> }
inline bool isPromptMessage(const JSONValue& v) {
    if (!isStringMember(v, "role")) return false;
    const std::string& role = std::get<std::string>(v.find("role")->value);
    if (role != "user" && role != "assistant") return false;
    const JSONValue* content = v.find("content");
    return content && isContentBlock(*content);
}

//------------------------------ Typed struct validators (server-side before serialize) --------------
// Returns a description of the first problem, or std::nullopt when the shape is valid.
inline std::optional<std::string> validateCallToolResult(const CallToolResult& r) {
    for (std::size_t i = 0; i < r.content.size(); ++i) {
        if (!isContentBlock(r.content[i])) return "content[" + std::to_string(i) + "] is not a content block";
    }
    return std::nullopt;
}

inline std::optional<std::string> validateReadResourceResult(const ReadResourceResult& r) {
    for (std::size_t i = 0; i < r.contents.size(); ++i) {
        if (!isResourceContents(r.contents[i])) return "contents[" + std::to_string(i) + "] is not a resource contents item";
    }
    return std::nullopt;
}

inline std::optional<std::string> validateGetPromptResult(const GetPromptResult& r) {
    for (std::size_t i = 0; i < r.messages.size(); ++i) {
        if (!isPromptMessage(r.messages[i])) return "messages[" + std::to_string(i) + "] is not a prompt message";
    }
    return std::nullopt;
}

} // namespace validation
} // namespace mcprt
