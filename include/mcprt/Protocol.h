//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, capability descriptors, and method names
//==========================================================================================================

#pragma once

#include "mcprt/JSONRPCTypes.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace mcprt {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capability descriptors, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Latest protocol revision this runtime speaks
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Revisions accepted from clients during initialize (newest first)
inline const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions{"2025-06-18", "2025-03-26", "2024-11-05"};
    return versions;
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capability kinds ///////////////////////////////////////////
enum class CapabilityKind {
    Tool,
    Resource,
    Prompt
};

inline const char* toString(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Tool: return "tool";
        case CapabilityKind::Resource: return "resource";
        case CapabilityKind::Prompt: return "prompt";
    }
    return "unknown";
}

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool structures
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool arguments
    // Serialize calls to this tool (at most one in flight)
    bool nonReentrant = false;
    // Overrides the server-wide request timeout when set
    std::optional<std::chrono::milliseconds> timeout;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content blocks
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
// Resource structures
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ReadResourceResult {
    std::vector<JSONValue> contents;  // Array of {uri, mimeType, text|blob}
    bool isError = false;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
// Prompt structures
struct PromptArgument {
    std::string name;
    std::string description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    Prompt() = default;
    Prompt(std::string name, std::string description, std::vector<PromptArgument> arguments = {})
        : name(std::move(name)), description(std::move(description)), arguments(std::move(arguments)) {}
};

struct GetPromptResult {
    std::string description;
    std::vector<JSONValue> messages;  // Array of {role, content}
    bool isError = false;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Lifecycle
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Shutdown = "shutdown";
    constexpr const char* Cancelled = "notifications/cancelled";

    // Tools
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Resources
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Prompts
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
}

} // namespace mcprt
