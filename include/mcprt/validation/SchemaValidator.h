//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Structural validation of request params against a JSON-Schema subset
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcprt/JSONRPCTypes.h"

namespace mcprt {
namespace validation {

//==========================================================================================================
// ValidationError
// Purpose: First violation found.
// Fields:
//   field: Dotted path with array indices (e.g. "items[2].name"); "(root)" for the value itself.
//   reason: Human-readable description of the violation.
//==========================================================================================================
struct ValidationError {
    std::string field;
    std::string reason;
};

//==========================================================================================================
// SchemaValidator
// Purpose: Supported keywords: type (string or array; integer/number/string/boolean/object/array/null),
//          enum, const, properties, required, additionalProperties (boolean or schema), items,
//          minItems/maxItems, minLength/maxLength, minimum/maximum, exclusiveMinimum/exclusiveMaximum.
//          Unknown keywords are ignored. Object schemas reject properties they do not declare unless
//          additionalProperties allows them.
//==========================================================================================================
class SchemaValidator {
public:
    //==========================================================================================================
    // Validate
    // Args:
    //   schema: Schema object. A null or empty schema accepts anything.
    //   instance: Value to check.
    // Returns:
    //   std::nullopt when valid, otherwise the first violation (properties are checked in name order).
    //==========================================================================================================
    static std::optional<ValidationError> Validate(const JSONValue& schema, const JSONValue& instance);
};

} // namespace validation
} // namespace mcprt
