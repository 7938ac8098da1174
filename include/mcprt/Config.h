//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server options loaded from MCPRT_* environment variables and "key=value;..." config strings
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "mcprt/validation/Validation.h"

namespace mcprt {

//==========================================================================================================
// ServerOptions
// Fields:
//   serverName/serverVersion: Reported as serverInfo during initialize.
//   instructions: Optional usage hint returned by initialize (omitted when empty).
//   requestTimeout: Default handler deadline; a tool's own timeout overrides it. At most kMaxDurationMs.
//   maxConcurrency: Worker threads available to handlers.
//   shutdownGrace: How long shutdown waits for in-flight requests and the client hangup before closing.
//   maxToolOutputBytes: Text content of tool results is truncated past this size (0 disables).
//   validationMode: Strict checks handler result shapes before they are sent.
//==========================================================================================================
struct ServerOptions {
    std::string serverName{"mcprt"};
    std::string serverVersion;
    std::string instructions;
    std::chrono::milliseconds requestTimeout{30000};
    std::size_t maxConcurrency{4};
    std::chrono::milliseconds shutdownGrace{5000};
    std::size_t maxToolOutputBytes{50000};
    validation::ValidationMode validationMode{validation::ValidationMode::Off};

    ServerOptions();
};

// Longest accepted duration setting (24 h). Larger values would overflow steady_clock arithmetic.
constexpr uint64_t kMaxDurationMs = 24ull * 60 * 60 * 1000;

// Converts a millisecond setting, clamping it to kMaxDurationMs with a warning naming key.
std::chrono::milliseconds ClampDurationMs(uint64_t ms, const char* key);

//==========================================================================================================
// ParseConfigString
// Purpose: Splits "key=value;key=value" into trimmed pairs. Tokens without '=' are logged and skipped.
//==========================================================================================================
std::vector<std::pair<std::string, std::string>> ParseConfigString(const std::string& config);

//==========================================================================================================
// LoadServerOptionsFromEnv
// Purpose: Defaults overridden by MCPRT_SERVER_NAME, MCPRT_SERVER_VERSION, MCPRT_INSTRUCTIONS,
//          MCPRT_REQUEST_TIMEOUT_MS, MCPRT_MAX_CONCURRENCY, MCPRT_SHUTDOWN_GRACE_MS,
//          MCPRT_MAX_TOOL_OUTPUT_BYTES, and MCPRT_VALIDATION (off|strict).
//==========================================================================================================
ServerOptions LoadServerOptionsFromEnv();

//==========================================================================================================
// ApplyServerConfig
// Purpose: Overrides options from a config string. Keys: server_name, server_version, instructions,
//          request_timeout_ms, max_concurrency, shutdown_grace_ms, max_tool_output_bytes, validation.
// Returns:
//   Number of keys applied. Unknown keys and invalid values are logged and ignored.
//==========================================================================================================
std::size_t ApplyServerConfig(ServerOptions& options, const std::string& config);

} // namespace mcprt
