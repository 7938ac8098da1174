//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Stdio MCP server exposing workspace tools
//==========================================================================================================

#include "logging/Logger.h"
#include "mcprt/Server.h"
#include "mcprt/StdioTransport.hpp"
#include "mcprt/version.h"
#include "WorkspaceTools.h"
#include <cstddef>
#include <exception>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "env/EnvVars.h"

using namespace mcprt;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--config")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    // stdout carries protocol frames; logs go to stderr (and MCPRT_LOG_FILE when set)
    Logger::configureFromEnv();
    FUNC_SCOPE();

    if (hasFlag(argc, argv, "--version")) {
        LOG_INFO("mcprt_server {}", getVersionString());
        return 0;
    }

    ServerOptions options = LoadServerOptionsFromEnv();
    if (auto cfg = getArgValue(argc, argv, "--config"); cfg.has_value()) {
        const std::size_t applied = ApplyServerConfig(options, cfg.value());
        LOG_INFO("Applied {} server option(s) from --config", applied);
    }

    std::string root = GetEnvOrDefault("MCPRT_WORKSPACE", std::filesystem::current_path().string());
    if (auto ws = getArgValue(argc, argv, "--workspace"); ws.has_value()) {
        root = ws.value();
    }

    std::string transportCfg = GetEnvOrDefault("MCPRT_STDIO_CONFIG", "");
    if (auto v = getArgValue(argc, argv, "--transport-config"); v.has_value()) {
        transportCfg = v.value();
    }

    try {
        auto workspace = std::make_shared<examples::Workspace>(root);
        LOG_INFO("Workspace root: {}", workspace->Root().string());

        Server server(options);
        server.SetErrorHandler([](const std::string& err) {
            LOG_WARN("Session ending after transport error: {}", err);
        });
        examples::RegisterWorkspaceCapabilities(server, workspace);

        StdioTransportFactory factory;
        server.Run(factory.CreateTransport(transportCfg));
    } catch (const std::exception& e) {
        LOG_ERROR("mcprt_server failed: {}", e.what());
        return 1;
    }
    return 0;
}
