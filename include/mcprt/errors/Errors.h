//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, registry exceptions, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcprt/JSONRPCTypes.h"

namespace mcprt {
namespace errors {

// Categorization of protocol error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    RequestTimeout,
    CapabilityNotFound,
    ServerNotReady,
    ShuttingDown,
    RequestCancelled,
    Unknown
};

// Typed error representation used by the runtime.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or runtime-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::RequestTimeout;
        case JSONRPCErrorCodes::CapabilityNotFound: return ErrorCategory::CapabilityNotFound;
        case JSONRPCErrorCodes::ServerNotReady: return ErrorCategory::ServerNotReady;
        case JSONRPCErrorCodes::ShuttingDown: return ErrorCategory::ShuttingDown;
        case JSONRPCErrorCodes::RequestCancelled: return ErrorCategory::RequestCancelled;
        default: return ErrorCategory::Unknown;
    }
}

// Build a McpError with its category derived from the code.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.find("code");
    const JSONValue* msg = errVal.find("message");
    if (!code || !msg || !code->isInteger() || !msg->isString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(std::get<int64_t>(code->value)),
                     std::get<std::string>(msg->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

// InvalidParams carrying { field, reason } so clients can point at the offending argument.
inline McpError invalidParams(const std::string& field, const std::string& reason) {
    JSONValue::Object data;
    data["field"] = std::make_shared<JSONValue>(field);
    data["reason"] = std::make_shared<JSONValue>(reason);
    return makeError(JSONRPCErrorCodes::InvalidParams,
                     "Invalid params: " + field + ": " + reason, JSONValue{std::move(data)});
}

//////////////////////////////////////////// Exceptions ////////////////////////////////////////////

//==========================================================================================================
// DuplicateCapabilityError
// Purpose: Thrown when a capability name is registered twice within the same kind.
//==========================================================================================================
class DuplicateCapabilityError : public std::logic_error {
public:
    DuplicateCapabilityError(const std::string& kind, const std::string& name)
        : std::logic_error("Duplicate " + kind + " capability: " + name), kind_(kind), name_(name) {}
    const std::string& kind() const noexcept { return kind_; }
    const std::string& name() const noexcept { return name_; }
private:
    std::string kind_;
    std::string name_;
};

//==========================================================================================================
// RegistryClosedError
// Purpose: Thrown when registration is attempted after the session reached Ready.
//==========================================================================================================
class RegistryClosedError : public std::logic_error {
public:
    explicit RegistryClosedError(const std::string& name)
        : std::logic_error("Capability registry is closed; cannot register: " + name) {}
};

//==========================================================================================================
// ApplicationError
// Purpose: Thrown by handlers to report a domain failure. Reported to the client as a successful response
//          whose payload is marked isError.
//==========================================================================================================
class ApplicationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace errors
} // namespace mcprt
