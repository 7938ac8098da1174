//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Session state machine, request routing, and response emission
//==========================================================================================================

#include "mcprt/Dispatcher.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <variant>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcprt/MessageCodec.h"
#include "mcprt/Protocol.h"
#include "mcprt/errors/Errors.h"
#include "mcprt/typed/Content.h"
#include "mcprt/validation/SchemaValidator.h"
#include "mcprt/validation/Validators.h"

namespace mcprt {

namespace {

// Handler returned a result that does not match the protocol shape (Strict mode only)
class ResultShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

std::shared_ptr<JSONValue> arrayOf(const std::vector<JSONValue>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.push_back(std::make_shared<JSONValue>(item));
    }
    return std::make_shared<JSONValue>(std::move(arr));
}

JSONValue emptyObject() {
    return JSONValue{JSONValue::Object{}};
}

// {type: object, properties: {...}, required: [...], additionalProperties: false}; _meta is always allowed
JSONValue envelopeSchema(std::initializer_list<std::pair<const char*, const char*>> props,
                         std::initializer_list<const char*> required) {
    JSONValue::Object properties;
    for (const auto& [name, type] : props) {
        JSONValue::Object p;
        if (std::string(type) == "cursor") {
            JSONValue::Array types;
            types.push_back(str("string"));
            types.push_back(str("integer"));
            p["type"] = std::make_shared<JSONValue>(std::move(types));
        } else {
            p["type"] = str(type);
        }
        // Members of "arguments" are checked later against the capability's own schema
        if (std::string(type) == "object") {
            p["additionalProperties"] = std::make_shared<JSONValue>(true);
        }
        if (std::string(name) == "limit") {
            p["minimum"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
        }
        properties[name] = std::make_shared<JSONValue>(std::move(p));
    }
    JSONValue::Object meta;
    meta["type"] = str("object");
    meta["additionalProperties"] = std::make_shared<JSONValue>(true);
    properties["_meta"] = std::make_shared<JSONValue>(std::move(meta));

    JSONValue::Array req;
    for (const char* r : required) {
        req.push_back(str(r));
    }
    JSONValue::Object schema;
    schema["type"] = str("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    schema["required"] = std::make_shared<JSONValue>(std::move(req));
    schema["additionalProperties"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(schema)};
}

const JSONValue& listParamsSchema() {
    static const JSONValue schema = envelopeSchema({{"cursor", "cursor"}, {"limit", "integer"}}, {});
    return schema;
}

const JSONValue& callToolParamsSchema() {
    static const JSONValue schema = envelopeSchema({{"name", "string"}, {"arguments", "object"}}, {"name"});
    return schema;
}

const JSONValue& readResourceParamsSchema() {
    static const JSONValue schema = envelopeSchema({{"uri", "string"}}, {"uri"});
    return schema;
}

const JSONValue& getPromptParamsSchema() {
    static const JSONValue schema = envelopeSchema({{"name", "string"}, {"arguments", "object"}}, {"name"});
    return schema;
}

JSONValue withoutMeta(const JSONValue& params) {
    if (!params.isObject()) return params;
    JSONValue::Object o = std::get<JSONValue::Object>(params.value);
    o.erase("_meta");
    return JSONValue{std::move(o)};
}

// Cuts text at maxBytes (on a UTF-8 boundary) and appends a marker
std::string truncateText(const std::string& text, std::size_t maxBytes) {
    if (maxBytes == 0 || text.size() <= maxBytes) return text;
    std::size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
    return text.substr(0, cut) + fmt::format("\n... [truncated {} bytes]", text.size() - cut);
}

void truncateToolOutput(CallToolResult& r, std::size_t maxBytes) {
    if (maxBytes == 0) return;
    for (auto& block : r.content) {
        if (!typed::isText(block)) continue;
        auto text = typed::getText(block);
        if (!text || text->size() <= maxBytes) continue;
        LOG_DEBUG("Dispatcher: truncating tool output of {} bytes to {}", text->size(), maxBytes);
        block = typed::makeText(truncateText(text.value(), maxBytes));
    }
}

/////////////////////////////////////////// Result encoding ///////////////////////////////////////////
JSONValue encodeToolResult(const CallToolResult& r) {
    JSONValue::Object o;
    o["content"] = arrayOf(r.content);
    o["isError"] = std::make_shared<JSONValue>(r.isError);
    return JSONValue{std::move(o)};
}

JSONValue encodeResourceResult(const ReadResourceResult& r) {
    JSONValue::Object o;
    o["contents"] = arrayOf(r.contents);
    if (r.isError) {
        o["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue{std::move(o)};
}

JSONValue encodePromptResult(const GetPromptResult& r) {
    JSONValue::Object o;
    if (!r.description.empty()) {
        o["description"] = str(r.description);
    }
    o["messages"] = arrayOf(r.messages);
    if (r.isError) {
        o["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue{std::move(o)};
}

void logApplicationFailure(const char* kind, const std::string& target, const std::exception& e) {
    if (dynamic_cast<const errors::ApplicationError*>(&e) != nullptr) {
        LOG_INFO("Dispatcher: {} '{}' reported failure: {}", kind, target, e.what());
    } else {
        LOG_WARN("Dispatcher: {} '{}' threw: {}", kind, target, e.what());
    }
}

bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

} // namespace

class Dispatcher::Impl {
public:
    const ServerOptions options;
    CapabilityRegistry& registry;
    ExecutionScheduler& scheduler;
    SessionState& session;
    FrameSink sink;
    ShutdownListener shutdownListener;
    std::mutex listenerMutex;

    // Shared while emitting, exclusive while closing, so no frame is written after Closed
    std::shared_mutex emitMutex;

    Impl(const ServerOptions& o, CapabilityRegistry& r, ExecutionScheduler& s, SessionState& ss, FrameSink fs)
        : options(o), registry(r), scheduler(s), session(ss), sink(std::move(fs)) {}

    /////////////////////////////////////////// Emission ///////////////////////////////////////////
    // Sends a response for a tracked id and releases it from the in-flight set.
    void emit(const JSONRPCResponse& response) {
        const std::string key = IdKey(response.id);
        std::shared_lock<std::shared_mutex> lk(emitMutex);
        if (session.Phase() == SessionPhase::Closed) {
            session.Finish(key);
            LOG_DEBUG("Dispatcher: session closed; dropping response for id {}", IdToString(response.id));
            return;
        }
        const std::string frame = MessageCodec::Encode(response);
        session.Finish(key);
        if (!sink(frame)) {
            LOG_WARN("Dispatcher: transport refused response for id {}", IdToString(response.id));
        }
    }

    void emitResult(const JSONRPCId& id, JSONValue result) {
        emit(JSONRPCResponse(id, std::move(result)));
    }

    void emitError(const JSONRPCId& id, const errors::McpError& err) {
        LOG_DEBUG("Dispatcher: error {} for id {}: {}", err.code, IdToString(id), err.message);
        auto resp = errors::makeErrorResponse(id, err);
        emit(*resp);
    }

    /////////////////////////////////////////// Entry points ///////////////////////////////////////////
    void handleDecodeFailure(const DecodeFailure& failure) {
        if (!failure.id.has_value() || std::holds_alternative<std::nullptr_t>(failure.id.value())) {
            LOG_WARN("Dispatcher: dropping unanswerable frame: {}", failure.error.message);
            return;
        }
        const JSONRPCId& id = failure.id.value();
        if (session.Phase() == SessionPhase::Closed) {
            return;
        }
        if (!session.TryBegin(IdKey(id))) {
            LOG_WARN("Dispatcher: malformed frame reuses in-flight id {}; not answered", IdToString(id));
            return;
        }
        emitError(id, failure.error);
    }

    void handleRequest(const JSONRPCRequest& req) {
        FUNC_SCOPE();
        const SessionPhase phase = session.Phase();
        if (phase == SessionPhase::Closed) {
            LOG_DEBUG("Dispatcher: session closed; ignoring {}", req.method);
            return;
        }
        if (!session.TryBegin(IdKey(req.id))) {
            LOG_WARN("Dispatcher: id {} is already in flight; dropping duplicate {}", IdToString(req.id), req.method);
            return;
        }
        if (phase == SessionPhase::ShuttingDown) {
            emitError(req.id, errors::makeError(JSONRPCErrorCodes::ShuttingDown, "Server is shutting down"));
            return;
        }
        if (req.method == Methods::Initialize) {
            handleInitialize(req);
            return;
        }
        if (req.method == Methods::Shutdown) {
            emitResult(req.id, emptyObject());
            beginShutdown("shutdown request");
            return;
        }
        if (phase == SessionPhase::Uninitialized) {
            emitError(req.id, errors::makeError(JSONRPCErrorCodes::ServerNotReady, "Server not initialized"));
            return;
        }

        const JSONValue params = req.params.has_value() ? req.params.value() : emptyObject();
        if (req.method == Methods::ListTools) {
            handleList(req.id, params, CapabilityKind::Tool, "tools");
        } else if (req.method == Methods::ListResources) {
            handleList(req.id, params, CapabilityKind::Resource, "resources");
        } else if (req.method == Methods::ListPrompts) {
            handleList(req.id, params, CapabilityKind::Prompt, "prompts");
        } else if (req.method == Methods::CallTool) {
            handleCallTool(req.id, params);
        } else if (req.method == Methods::ReadResource) {
            handleReadResource(req.id, params);
        } else if (req.method == Methods::GetPrompt) {
            handleGetPrompt(req.id, params);
        } else {
            JSONValue::Object data;
            data["method"] = str(req.method);
            emitError(req.id, errors::makeError(JSONRPCErrorCodes::MethodNotFound,
                                                "Method not found: " + req.method, JSONValue{std::move(data)}));
        }
    }

    void handleNotification(const JSONRPCNotification& note) {
        FUNC_SCOPE();
        if (note.method == Methods::Initialized) {
            LOG_DEBUG("Dispatcher: client reported initialized");
        } else if (note.method == Methods::Shutdown) {
            beginShutdown("shutdown notification");
        } else if (note.method == Methods::Cancelled) {
            handleCancelled(note);
        } else {
            LOG_DEBUG("Dispatcher: ignoring notification {}", note.method);
        }
    }

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    void handleInitialize(const JSONRPCRequest& req) {
        if (session.Phase() != SessionPhase::Uninitialized) {
            emitError(req.id, errors::makeError(JSONRPCErrorCodes::InvalidRequest, "Server already initialized"));
            return;
        }
        const JSONValue params = req.params.has_value() ? req.params.value() : emptyObject();
        if (!params.isObject()) {
            emitError(req.id, errors::invalidParams("(root)", "expected object"));
            return;
        }
        const JSONValue* version = params.find("protocolVersion");
        if (version == nullptr) {
            emitError(req.id, errors::invalidParams("protocolVersion", "required property is missing"));
            return;
        }
        if (!version->isString()) {
            emitError(req.id, errors::invalidParams("protocolVersion", "expected string"));
            return;
        }
        const std::string requested = std::get<std::string>(version->value);
        const auto& supported = SupportedProtocolVersions();
        const bool known = std::find(supported.begin(), supported.end(), requested) != supported.end();
        const std::string negotiated = known ? requested : std::string(PROTOCOL_VERSION);
        if (!known) {
            LOG_WARN("Dispatcher: client requested unsupported protocol {}; offering {}", requested, negotiated);
        }

        Implementation client("unknown", "");
        if (const JSONValue* info = params.find("clientInfo"); info && info->isObject()) {
            if (auto n = typed::stringArg(*info, "name")) client.name = n.value();
            if (auto v = typed::stringArg(*info, "version")) client.version = v.value();
        }
        session.SetClient(client, negotiated);

        registry.Close();
        JSONValue result = buildInitializeResult(negotiated);
        if (!session.Advance(SessionPhase::Uninitialized, SessionPhase::Ready)) {
            emitError(req.id, errors::makeError(JSONRPCErrorCodes::ShuttingDown, "Server is shutting down"));
            return;
        }
        LOG_INFO("Dispatcher: initialized by {} {} (protocol {})", client.name, client.version, negotiated);
        emitResult(req.id, std::move(result));
    }

    JSONValue buildInitializeResult(const std::string& negotiated) {
        JSONValue::Object caps;
        JSONValue::Object listChanged;
        listChanged["listChanged"] = std::make_shared<JSONValue>(false);
        caps["tools"] = std::make_shared<JSONValue>(listChanged);
        caps["prompts"] = std::make_shared<JSONValue>(listChanged);
        JSONValue::Object resCaps = listChanged;
        resCaps["subscribe"] = std::make_shared<JSONValue>(false);
        caps["resources"] = std::make_shared<JSONValue>(std::move(resCaps));

        JSONValue::Object serverInfo;
        serverInfo["name"] = str(options.serverName);
        serverInfo["version"] = str(options.serverVersion);

        JSONValue::Object manifest;
        manifest["tools"] = manifestEntries(CapabilityKind::Tool);
        manifest["resources"] = manifestEntries(CapabilityKind::Resource);
        manifest["prompts"] = manifestEntries(CapabilityKind::Prompt);

        JSONValue::Object result;
        result["protocolVersion"] = str(negotiated);
        result["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
        result["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfo));
        result["manifest"] = std::make_shared<JSONValue>(std::move(manifest));
        if (!options.instructions.empty()) {
            result["instructions"] = str(options.instructions);
        }
        return JSONValue{std::move(result)};
    }

    std::shared_ptr<JSONValue> manifestEntries(CapabilityKind kind) {
        JSONValue::Array arr;
        for (const Capability* cap : registry.List(kind)) {
            JSONValue::Object e;
            e[kind == CapabilityKind::Resource ? "uri" : "name"] = str(cap->name);
            e["inputSchema"] = std::make_shared<JSONValue>(cap->inputSchema);
            arr.push_back(std::make_shared<JSONValue>(std::move(e)));
        }
        return std::make_shared<JSONValue>(std::move(arr));
    }

    bool beginShutdown(const std::string& reason) {
        if (!session.BeginShutdown()) {
            return false;
        }
        LOG_INFO("Dispatcher: shutting down ({}); {} request(s) in flight", reason, session.InFlightCount());
        ShutdownListener listener;
        {
            std::lock_guard<std::mutex> lk(listenerMutex);
            listener = shutdownListener;
        }
        if (listener) {
            listener();
        }
        return true;
    }

    bool finishShutdown() {
        if (session.Phase() == SessionPhase::Closed) {
            return true;
        }
        beginShutdown("closing");
        const auto grace = std::min(options.shutdownGrace, std::chrono::milliseconds(static_cast<int64_t>(kMaxDurationMs)));
        const auto deadline = std::chrono::steady_clock::now() + grace;
        const bool drained = session.WaitDrained(grace);
        if (!drained) {
            LOG_WARN("Dispatcher: grace period elapsed with {} request(s) unanswered", session.InFlightCount());
        }
        // Late requests keep getting ShuttingDown until the client hangs up or the grace period ends
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (!session.WaitInputEnded(std::max(left, std::chrono::milliseconds(0)))) {
            LOG_DEBUG("Dispatcher: client still connected after the grace period; closing");
        }
        {
            std::unique_lock<std::shared_mutex> lk(emitMutex);
            session.MarkClosed();
        }
        scheduler.Shutdown();
        return drained;
    }

    /////////////////////////////////////////// Listing ///////////////////////////////////////////
    void handleList(const JSONRPCId& id, const JSONValue& params, CapabilityKind kind, const char* arrayKey) {
        if (auto err = validation::SchemaValidator::Validate(listParamsSchema(), params)) {
            emitError(id, errors::invalidParams(err->field, err->reason));
            return;
        }
        std::size_t start = 0;
        if (const JSONValue* cursor = params.find("cursor")) {
            if (cursor->isInteger() && std::get<int64_t>(cursor->value) >= 0) {
                start = static_cast<std::size_t>(std::get<int64_t>(cursor->value));
            } else if (cursor->isString() && isDigits(std::get<std::string>(cursor->value)) &&
                       std::get<std::string>(cursor->value).size() < 19) {
                start = static_cast<std::size_t>(std::stoull(std::get<std::string>(cursor->value)));
            } else {
                emitError(id, errors::invalidParams("cursor", "invalid cursor"));
                return;
            }
        }
        std::optional<std::size_t> limit;
        if (params.find("limit") != nullptr) {
            // The schema guarantees an integral value >= 1; one beyond int64_t (1e300) means no limit
            const auto n = typed::integerArg(params, "limit");
            limit = n.has_value() ? static_cast<std::size_t>(n.value()) : std::numeric_limits<std::size_t>::max();
        }

        const auto caps = registry.List(kind);
        const std::size_t total = caps.size();
        if (start > total) start = total;
        const std::size_t end = (limit.has_value() && limit.value() < total - start) ? start + limit.value() : total;

        JSONValue::Array items;
        for (std::size_t i = start; i < end; ++i) {
            items.push_back(std::make_shared<JSONValue>(caps[i]->Describe()));
        }
        JSONValue::Object result;
        result[arrayKey] = std::make_shared<JSONValue>(std::move(items));
        if (end < total) {
            result["nextCursor"] = str(std::to_string(end));
        }
        emitResult(id, JSONValue{std::move(result)});
    }

    /////////////////////////////////////////// Execution ///////////////////////////////////////////
    void notFound(const JSONRPCId& id, CapabilityKind kind, const std::string& name) {
        JSONValue::Object data;
        data["kind"] = str(toString(kind));
        data["name"] = str(name);
        std::string label = toString(kind);
        label[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(label[0])));
        emitError(id, errors::makeError(JSONRPCErrorCodes::CapabilityNotFound,
                                        label + " not found: " + name, JSONValue{std::move(data)}));
    }

    // Checks the request envelope, then the target, then the target's own schema.
    const Capability* resolve(const JSONRPCId& id, const JSONValue& params, const JSONValue& envelope,
                              CapabilityKind kind, const char* nameKey, const JSONValue& input) {
        if (auto err = validation::SchemaValidator::Validate(envelope, params)) {
            emitError(id, errors::invalidParams(err->field, err->reason));
            return nullptr;
        }
        const std::string name = typed::stringArg(params, nameKey).value_or("");
        if (name.empty()) {
            emitError(id, errors::invalidParams(nameKey, "must not be empty"));
            return nullptr;
        }
        const Capability* cap = registry.Lookup(kind, name);
        if (cap == nullptr) {
            notFound(id, kind, name);
            return nullptr;
        }
        if (auto err = validation::SchemaValidator::Validate(cap->inputSchema, input)) {
            LOG_DEBUG("Dispatcher: {} '{}' rejected params: {}: {}", toString(kind), name, err->field, err->reason);
            emitError(id, errors::invalidParams(err->field, err->reason));
            return nullptr;
        }
        return cap;
    }

    void handleCallTool(const JSONRPCId& id, const JSONValue& params) {
        const JSONValue* a = params.isObject() ? params.find("arguments") : nullptr;
        const JSONValue args = a ? *a : emptyObject();
        const Capability* cap = resolve(id, params, callToolParamsSchema(), CapabilityKind::Tool, "name", args);
        if (cap == nullptr) return;

        ToolHandler handler = cap->toolHandler;
        const std::string name = cap->name;
        const std::size_t maxBytes = options.maxToolOutputBytes;
        const bool strict = options.validationMode == validation::ValidationMode::Strict;
        ExecutionScheduler::Job job = [handler, args, name, maxBytes, strict](std::stop_token st) -> JSONValue {
            CallToolResult r;
            try {
                r = handler(args, st);
            } catch (const std::exception& e) {
                logApplicationFailure("tool", name, e);
                r = typed::textResult(e.what(), true);
            }
            if (strict) {
                if (auto problem = validation::validateCallToolResult(r)) {
                    throw ResultShapeError("Invalid tools/call result: " + problem.value());
                }
            }
            truncateToolOutput(r, maxBytes);
            return encodeToolResult(r);
        };
        submit(id, *cap, std::move(job));
    }

    void handleReadResource(const JSONRPCId& id, const JSONValue& params) {
        const JSONValue input = withoutMeta(params);
        const Capability* cap = resolve(id, params, readResourceParamsSchema(), CapabilityKind::Resource, "uri", input);
        if (cap == nullptr) return;

        ResourceHandler handler = cap->resourceHandler;
        const std::string uri = cap->name;
        const bool strict = options.validationMode == validation::ValidationMode::Strict;
        ExecutionScheduler::Job job = [handler, uri, strict](std::stop_token st) -> JSONValue {
            ReadResourceResult r;
            try {
                r = handler(uri, st);
            } catch (const std::exception& e) {
                logApplicationFailure("resource", uri, e);
                r.contents = {typed::makeTextResource(uri, "text/plain", e.what())};
                r.isError = true;
            }
            if (strict) {
                if (auto problem = validation::validateReadResourceResult(r)) {
                    throw ResultShapeError("Invalid resources/read result: " + problem.value());
                }
            }
            return encodeResourceResult(r);
        };
        submit(id, *cap, std::move(job));
    }

    void handleGetPrompt(const JSONRPCId& id, const JSONValue& params) {
        const JSONValue* a = params.isObject() ? params.find("arguments") : nullptr;
        const JSONValue args = a ? *a : emptyObject();
        const Capability* cap = resolve(id, params, getPromptParamsSchema(), CapabilityKind::Prompt, "name", args);
        if (cap == nullptr) return;

        PromptHandler handler = cap->promptHandler;
        const std::string name = cap->name;
        const bool strict = options.validationMode == validation::ValidationMode::Strict;
        ExecutionScheduler::Job job = [handler, args, name, strict](std::stop_token st) -> JSONValue {
            GetPromptResult r;
            try {
                r = handler(args, st);
            } catch (const std::exception& e) {
                logApplicationFailure("prompt", name, e);
                r.description = e.what();
                r.messages = {typed::makePromptMessage("assistant", e.what())};
                r.isError = true;
            }
            if (strict) {
                if (auto problem = validation::validateGetPromptResult(r)) {
                    throw ResultShapeError("Invalid prompts/get result: " + problem.value());
                }
            }
            return encodePromptResult(r);
        };
        submit(id, *cap, std::move(job));
    }

    void submit(const JSONRPCId& id, const Capability& cap, ExecutionScheduler::Job job) {
        SubmitOptions opts;
        opts.timeout = std::min(cap.timeout.value_or(options.requestTimeout),
                                std::chrono::milliseconds(static_cast<int64_t>(kMaxDurationMs)));
        if (cap.nonReentrant) {
            opts.serialKey = std::string(toString(cap.kind)) + ":" + cap.name;
        }
        const std::string target = cap.name;
        const auto timeout = opts.timeout;
        const bool accepted = scheduler.Submit(IdKey(id), std::move(job), std::move(opts),
            [this, id, target, timeout](ExecutionResult r) { onExecuted(id, target, timeout, std::move(r)); });
        if (!accepted) {
            LOG_WARN("Dispatcher: scheduler refused request {} for '{}'", IdToString(id), target);
            emitError(id, errors::makeError(JSONRPCErrorCodes::ShuttingDown, "Server is shutting down"));
        }
    }

    void onExecuted(const JSONRPCId& id, const std::string& target, std::chrono::milliseconds timeout, ExecutionResult r) {
        switch (r.outcome) {
            case ExecutionOutcome::Completed:
                emitResult(id, r.value.has_value() ? std::move(r.value.value()) : emptyObject());
                return;
            case ExecutionOutcome::Failed:
                LOG_ERROR("Dispatcher: request {} for '{}' failed: {}", IdToString(id), target, r.message);
                emitError(id, errors::makeError(JSONRPCErrorCodes::InternalError, r.message));
                return;
            case ExecutionOutcome::TimedOut: {
                JSONValue::Object data;
                data["timeoutMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(timeout.count()));
                emitError(id, errors::makeError(JSONRPCErrorCodes::RequestTimeout, r.message, JSONValue{std::move(data)}));
                return;
            }
            case ExecutionOutcome::Cancelled: {
                JSONValue::Object data;
                data["reason"] = str(r.message);
                emitError(id, errors::makeError(JSONRPCErrorCodes::RequestCancelled, "Request cancelled",
                                                JSONValue{std::move(data)}));
                return;
            }
        }
    }

    void handleCancelled(const JSONRPCNotification& note) {
        if (!note.params.has_value() || !note.params->isObject()) {
            LOG_WARN("Dispatcher: cancellation without params object ignored");
            return;
        }
        const JSONValue& p = note.params.value();
        const JSONValue* target = p.find("requestId");
        if (target == nullptr) {
            target = p.find("id");
        }
        std::optional<JSONRPCId> id;
        if (target != nullptr && target->isString()) {
            id = JSONRPCId{std::get<std::string>(target->value)};
        } else if (target != nullptr && target->isInteger()) {
            id = JSONRPCId{std::get<int64_t>(target->value)};
        }
        if (!id.has_value()) {
            LOG_WARN("Dispatcher: cancellation without a usable requestId ignored");
            return;
        }
        const std::string reason = typed::stringArg(p, "reason").value_or("Cancelled by client");
        if (!scheduler.Cancel(IdKey(id.value()), reason)) {
            LOG_DEBUG("Dispatcher: nothing to cancel for id {}", IdToString(id.value()));
        }
    }
};

Dispatcher::Dispatcher(const ServerOptions& options,
                       CapabilityRegistry& registry,
                       ExecutionScheduler& scheduler,
                       SessionState& session,
                       FrameSink sink)
    : pImpl(std::make_unique<Impl>(options, registry, scheduler, session, std::move(sink))) {}

Dispatcher::~Dispatcher() {
    // Completions capture this dispatcher; none may run once it is gone
    pImpl->scheduler.Shutdown(std::chrono::milliseconds(0));
}

void Dispatcher::HandleFrame(const std::string& frame) {
    FUNC_SCOPE();
    DecodedMessage msg = MessageCodec::Decode(frame);
    if (auto* req = std::get_if<JSONRPCRequest>(&msg)) {
        pImpl->handleRequest(*req);
    } else if (auto* note = std::get_if<JSONRPCNotification>(&msg)) {
        pImpl->handleNotification(*note);
    } else {
        pImpl->handleDecodeFailure(std::get<DecodeFailure>(msg));
    }
}

void Dispatcher::HandleRequest(const JSONRPCRequest& request) {
    pImpl->handleRequest(request);
}

void Dispatcher::HandleNotification(const JSONRPCNotification& notification) {
    pImpl->handleNotification(notification);
}

void Dispatcher::SetShutdownListener(ShutdownListener listener) {
    std::lock_guard<std::mutex> lk(pImpl->listenerMutex);
    pImpl->shutdownListener = std::move(listener);
}

bool Dispatcher::BeginShutdown(const std::string& reason) {
    return pImpl->beginShutdown(reason);
}

bool Dispatcher::FinishShutdown() {
    return pImpl->finishShutdown();
}

SessionPhase Dispatcher::Phase() const {
    return pImpl->session.Phase();
}

} // namespace mcprt
