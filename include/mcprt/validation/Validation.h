//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Opt-in result-shape validation mode (Off by default); input schemas are always enforced
//==========================================================================================================

#pragma once

#include <string>

namespace mcprt {
namespace validation {

// Validation modes for outgoing result shape checks
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Utility to convert to/from string for docs/config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

inline ValidationMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict" || s == "STRICT") return ValidationMode::Strict;
    return ValidationMode::Off;
}

} // namespace validation
} // namespace mcprt
