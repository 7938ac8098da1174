//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.h
// Purpose: Ordered, append-only catalog of tools, resources, and prompts with their handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcprt/Protocol.h"

namespace mcprt {

// Handlers run on scheduler workers and may block. The stop_token is signalled on timeout or cancellation.
// Returning isError (or throwing) reports an application failure to the client.
using ToolHandler = std::function<CallToolResult(const JSONValue& arguments, std::stop_token)>;
using ResourceHandler = std::function<ReadResourceResult(const std::string& uri, std::stop_token)>;
using PromptHandler = std::function<GetPromptResult(const JSONValue& arguments, std::stop_token)>;

//==========================================================================================================
// Capability
// Purpose: One registered tool, resource, or prompt.
// Fields:
//   kind: Which catalog the entry belongs to.
//   name: Lookup key (tool name, resource uri, or prompt name); unique within its kind.
//   inputSchema: Schema the request params are validated against before the handler runs.
//   nonReentrant/timeout: Scheduling hints (tools only).
//==========================================================================================================
struct Capability {
    CapabilityKind kind{CapabilityKind::Tool};
    std::string name;
    std::string description;
    JSONValue inputSchema;
    bool nonReentrant{false};
    std::optional<std::chrono::milliseconds> timeout;

    std::optional<Tool> tool;
    std::optional<Resource> resource;
    std::optional<Prompt> prompt;

    ToolHandler toolHandler;
    ResourceHandler resourceHandler;
    PromptHandler promptHandler;

    static Capability FromTool(Tool tool, ToolHandler handler);
    static Capability FromResource(Resource resource, ResourceHandler handler);
    static Capability FromPrompt(Prompt prompt, PromptHandler handler);

    // Descriptor as advertised by the list methods and the initialize manifest.
    JSONValue Describe() const;
};

//==========================================================================================================
// CapabilityRegistry
// Purpose: Registration happens while the session is Uninitialized; Close() freezes the catalog when the
//          session becomes Ready, after which reads take no lock.
//==========================================================================================================
class CapabilityRegistry {
public:
    CapabilityRegistry();
    ~CapabilityRegistry();

    CapabilityRegistry(const CapabilityRegistry&) = delete;
    CapabilityRegistry& operator=(const CapabilityRegistry&) = delete;

    //==========================================================================================================
    // Register
    // Purpose: Appends a capability.
    // Args:
    //   capability: Entry with a non-empty name and a handler matching its kind.
    // Throws:
    //   errors::DuplicateCapabilityError when the name is taken within the same kind.
    //   errors::RegistryClosedError after Close().
    //   std::invalid_argument when the name is empty or the handler is missing.
    //==========================================================================================================
    void Register(Capability capability);

    //==========================================================================================================
    // Lookup
    // Returns:
    //   The capability, or nullptr when no entry of that kind has that name. The pointer stays valid for the
    //   lifetime of the registry.
    //==========================================================================================================
    const Capability* Lookup(CapabilityKind kind, const std::string& name) const;

    //==========================================================================================================
    // List
    // Returns:
    //   All capabilities of the given kind in registration order.
    //==========================================================================================================
    std::vector<const Capability*> List(CapabilityKind kind) const;

    std::size_t Count(CapabilityKind kind) const;

    void Close();
    bool IsClosed() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcprt
