//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityRegistry.cpp
// Purpose: Capability catalog implementation
//==========================================================================================================

#include "mcprt/CapabilityRegistry.h"

#include <array>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

namespace {
std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

// {"type":"object","properties":{},"additionalProperties":false}
JSONValue emptyObjectSchema() {
    JSONValue::Object o;
    o["type"] = str("object");
    o["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    o["additionalProperties"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(o)};
}

JSONValue resourceSchema() {
    JSONValue::Object uriProp;
    uriProp["type"] = str("string");
    JSONValue::Object props;
    props["uri"] = std::make_shared<JSONValue>(std::move(uriProp));
    JSONValue::Object o;
    o["type"] = str("object");
    o["properties"] = std::make_shared<JSONValue>(std::move(props));
    o["required"] = std::make_shared<JSONValue>(JSONValue::Array{str("uri")});
    o["additionalProperties"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(o)};
}

// Prompt arguments are strings keyed by argument name
JSONValue promptSchema(const Prompt& prompt) {
    JSONValue::Object props;
    JSONValue::Array required;
    for (const auto& arg : prompt.arguments) {
        JSONValue::Object p;
        p["type"] = str("string");
        if (!arg.description.empty()) {
            p["description"] = str(arg.description);
        }
        props[arg.name] = std::make_shared<JSONValue>(std::move(p));
        if (arg.required) {
            required.push_back(str(arg.name));
        }
    }
    JSONValue::Object o;
    o["type"] = str("object");
    o["properties"] = std::make_shared<JSONValue>(std::move(props));
    if (!required.empty()) {
        o["required"] = std::make_shared<JSONValue>(std::move(required));
    }
    o["additionalProperties"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(o)};
}

std::size_t kindIndex(CapabilityKind kind) {
    return static_cast<std::size_t>(kind);
}
} // namespace

Capability Capability::FromTool(Tool tool, ToolHandler handler) {
    Capability c;
    c.kind = CapabilityKind::Tool;
    c.name = tool.name;
    c.description = tool.description;
    c.inputSchema = tool.inputSchema.isNull() ? emptyObjectSchema() : tool.inputSchema;
    c.nonReentrant = tool.nonReentrant;
    c.timeout = tool.timeout;
    c.tool = std::move(tool);
    c.toolHandler = std::move(handler);
    return c;
}

Capability Capability::FromResource(Resource resource, ResourceHandler handler) {
    Capability c;
    c.kind = CapabilityKind::Resource;
    c.name = resource.uri;
    c.description = resource.description.value_or("");
    c.inputSchema = resourceSchema();
    c.resource = std::move(resource);
    c.resourceHandler = std::move(handler);
    return c;
}

Capability Capability::FromPrompt(Prompt prompt, PromptHandler handler) {
    Capability c;
    c.kind = CapabilityKind::Prompt;
    c.name = prompt.name;
    c.description = prompt.description;
    c.inputSchema = promptSchema(prompt);
    c.prompt = std::move(prompt);
    c.promptHandler = std::move(handler);
    return c;
}

JSONValue Capability::Describe() const {
    JSONValue::Object o;
    switch (kind) {
        case CapabilityKind::Tool:
            o["name"] = str(name);
            o["description"] = str(description);
            o["inputSchema"] = std::make_shared<JSONValue>(inputSchema);
            break;
        case CapabilityKind::Resource:
            o["uri"] = str(name);
            o["name"] = str(resource ? resource->name : name);
            if (resource && resource->description) {
                o["description"] = str(resource->description.value());
            }
            if (resource && resource->mimeType) {
                o["mimeType"] = str(resource->mimeType.value());
            }
            break;
        case CapabilityKind::Prompt: {
            o["name"] = str(name);
            o["description"] = str(description);
            JSONValue::Array args;
            if (prompt) {
                for (const auto& a : prompt->arguments) {
                    JSONValue::Object ao;
                    ao["name"] = str(a.name);
                    if (!a.description.empty()) {
                        ao["description"] = str(a.description);
                    }
                    ao["required"] = std::make_shared<JSONValue>(a.required);
                    args.push_back(std::make_shared<JSONValue>(std::move(ao)));
                }
            }
            o["arguments"] = std::make_shared<JSONValue>(std::move(args));
            break;
        }
    }
    return JSONValue{std::move(o)};
}

class CapabilityRegistry::Impl {
public:
    struct Catalog {
        std::vector<std::unique_ptr<Capability>> entries;
        std::unordered_map<std::string, const Capability*> byName;
    };

    mutable std::mutex mutex;
    std::atomic<bool> closed{false};
    std::array<Catalog, 3> catalogs;

    const Capability* lookupUnlocked(CapabilityKind kind, const std::string& name) const {
        const auto& cat = catalogs[kindIndex(kind)];
        auto it = cat.byName.find(name);
        return it == cat.byName.end() ? nullptr : it->second;
    }
};

CapabilityRegistry::CapabilityRegistry() : pImpl(std::make_unique<Impl>()) {}
CapabilityRegistry::~CapabilityRegistry() = default;

void CapabilityRegistry::Register(Capability capability) {
    FUNC_SCOPE();
    if (capability.name.empty()) {
        throw std::invalid_argument(std::string("Capability name must not be empty (kind=") + toString(capability.kind) + ")");
    }
    const bool hasHandler =
        (capability.kind == CapabilityKind::Tool && capability.toolHandler) ||
        (capability.kind == CapabilityKind::Resource && capability.resourceHandler) ||
        (capability.kind == CapabilityKind::Prompt && capability.promptHandler);
    if (!hasHandler) {
        throw std::invalid_argument("Capability has no handler: " + capability.name);
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->closed.load()) {
        throw errors::RegistryClosedError(capability.name);
    }
    auto& cat = pImpl->catalogs[kindIndex(capability.kind)];
    if (cat.byName.count(capability.name) != 0) {
        throw errors::DuplicateCapabilityError(toString(capability.kind), capability.name);
    }
    auto entry = std::make_unique<Capability>(std::move(capability));
    cat.byName.emplace(entry->name, entry.get());
    LOG_DEBUG("CapabilityRegistry: registered {} '{}'", toString(entry->kind), entry->name);
    cat.entries.push_back(std::move(entry));
}

const Capability* CapabilityRegistry::Lookup(CapabilityKind kind, const std::string& name) const {
    if (pImpl->closed.load(std::memory_order_acquire)) {
        return pImpl->lookupUnlocked(kind, name);
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->lookupUnlocked(kind, name);
}

std::vector<const Capability*> CapabilityRegistry::List(CapabilityKind kind) const {
    auto collect = [&]() {
        std::vector<const Capability*> out;
        const auto& cat = pImpl->catalogs[kindIndex(kind)];
        out.reserve(cat.entries.size());
        for (const auto& e : cat.entries) {
            out.push_back(e.get());
        }
        return out;
    };
    if (pImpl->closed.load(std::memory_order_acquire)) {
        return collect();
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return collect();
}

std::size_t CapabilityRegistry::Count(CapabilityKind kind) const {
    if (pImpl->closed.load(std::memory_order_acquire)) {
        return pImpl->catalogs[kindIndex(kind)].entries.size();
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->catalogs[kindIndex(kind)].entries.size();
}

void CapabilityRegistry::Close() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->closed.exchange(true, std::memory_order_acq_rel)) {
        LOG_DEBUG("CapabilityRegistry: closed ({} tools, {} resources, {} prompts)",
                  pImpl->catalogs[0].entries.size(), pImpl->catalogs[1].entries.size(), pImpl->catalogs[2].entries.size());
    }
}

bool CapabilityRegistry::IsClosed() const {
    return pImpl->closed.load();
}

} // namespace mcprt
