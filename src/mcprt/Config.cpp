//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Server option loading
//==========================================================================================================

#include "mcprt/Config.h"

#include <optional>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcprt/version.h"

namespace mcprt {

namespace {
std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::string();
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::optional<uint64_t> parseUint(const std::string& s) {
    if (s.empty() || s[0] == '-') return std::nullopt;
    try {
        std::size_t used = 0;
        const unsigned long long v = std::stoull(s, &used);
        if (used != s.size()) return std::nullopt;
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

bool isValidationName(const std::string& s) {
    return s == "off" || s == "Off" || s == "OFF" || s == "strict" || s == "Strict" || s == "STRICT";
}
} // namespace

ServerOptions::ServerOptions() : serverVersion(getVersionString()) {}

std::chrono::milliseconds ClampDurationMs(uint64_t ms, const char* key) {
    if (ms > kMaxDurationMs) {
        LOG_WARN("Config: {}={} exceeds the {} ms maximum; clamping", key, ms, kMaxDurationMs);
        return std::chrono::milliseconds(static_cast<int64_t>(kMaxDurationMs));
    }
    return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

std::vector<std::pair<std::string, std::string>> ParseConfigString(const std::string& config) {
    std::vector<std::pair<std::string, std::string>> out;
    std::size_t pos = 0;
    while (pos <= config.size()) {
        std::size_t end = config.find(';', pos);
        if (end == std::string::npos) end = config.size();
        const std::string token = trim(config.substr(pos, end - pos));
        pos = end + 1;
        if (token.empty()) continue;
        const auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("Config: ignoring malformed token '{}'", token);
            continue;
        }
        out.emplace_back(trim(token.substr(0, eq)), trim(token.substr(eq + 1)));
    }
    return out;
}

ServerOptions LoadServerOptionsFromEnv() {
    ServerOptions o;
    o.serverName = GetEnvOrDefault("MCPRT_SERVER_NAME", o.serverName);
    o.serverVersion = GetEnvOrDefault("MCPRT_SERVER_VERSION", o.serverVersion);
    o.instructions = GetEnvOrDefault("MCPRT_INSTRUCTIONS", o.instructions);
    o.requestTimeout = ClampDurationMs(
        GetEnvUintOrDefault("MCPRT_REQUEST_TIMEOUT_MS", static_cast<uint64_t>(o.requestTimeout.count())),
        "MCPRT_REQUEST_TIMEOUT_MS");
    const uint64_t workers = GetEnvUintOrDefault("MCPRT_MAX_CONCURRENCY", o.maxConcurrency);
    if (workers > 0) {
        o.maxConcurrency = static_cast<std::size_t>(workers);
    } else {
        LOG_WARN("Config: MCPRT_MAX_CONCURRENCY must be > 0; keeping {}", o.maxConcurrency);
    }
    o.shutdownGrace = ClampDurationMs(
        GetEnvUintOrDefault("MCPRT_SHUTDOWN_GRACE_MS", static_cast<uint64_t>(o.shutdownGrace.count())),
        "MCPRT_SHUTDOWN_GRACE_MS");
    o.maxToolOutputBytes = static_cast<std::size_t>(
        GetEnvUintOrDefault("MCPRT_MAX_TOOL_OUTPUT_BYTES", o.maxToolOutputBytes));
    const std::string mode = GetEnvOrDefault("MCPRT_VALIDATION", "");
    if (!mode.empty()) {
        if (isValidationName(mode)) {
            o.validationMode = validation::parseMode(mode);
        } else {
            LOG_WARN("Config: unknown MCPRT_VALIDATION '{}'", mode);
        }
    }
    return o;
}

std::size_t ApplyServerConfig(ServerOptions& options, const std::string& config) {
    FUNC_SCOPE();
    std::size_t applied = 0;
    for (const auto& [key, val] : ParseConfigString(config)) {
        if (key == "server_name") {
            options.serverName = val;
        } else if (key == "server_version") {
            options.serverVersion = val;
        } else if (key == "instructions") {
            options.instructions = val;
        } else if (key == "validation") {
            if (!isValidationName(val)) {
                LOG_WARN("Config: ignoring validation='{}' (expected off or strict)", val);
                continue;
            }
            options.validationMode = validation::parseMode(val);
        } else if (key == "request_timeout_ms" || key == "max_concurrency" ||
                   key == "shutdown_grace_ms" || key == "max_tool_output_bytes") {
            const auto v = parseUint(val);
            if (!v.has_value()) {
                LOG_WARN("Config: ignoring non-numeric value for {}: '{}'", key, val);
                continue;
            }
            if (key == "request_timeout_ms") {
                options.requestTimeout = ClampDurationMs(v.value(), "request_timeout_ms");
            } else if (key == "max_concurrency") {
                if (v.value() == 0) {
                    LOG_WARN("Config: max_concurrency must be > 0");
                    continue;
                }
                options.maxConcurrency = static_cast<std::size_t>(v.value());
            } else if (key == "shutdown_grace_ms") {
                options.shutdownGrace = ClampDurationMs(v.value(), "shutdown_grace_ms");
            } else {
                options.maxToolOutputBytes = static_cast<std::size_t>(v.value());
            }
        } else {
            LOG_WARN("Config: unknown key '{}'", key);
            continue;
        }
        ++applied;
    }
    return applied;
}

} // namespace mcprt
