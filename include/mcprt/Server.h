//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: Application-facing MCP server: capability registration and the session read loop
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcprt/CapabilityRegistry.h"
#include "mcprt/Config.h"
#include "mcprt/Protocol.h"
#include "mcprt/Session.h"
#include "mcprt/Transport.h"

namespace mcprt {

//==========================================================================================================
// Server
// Purpose: Owns the capability registry, execution scheduler, session, dispatcher, and transport for one
//          process-lifetime session.
// Notes:
//   - Register capabilities before running; the catalog freezes once the client initializes.
//   - Handlers run on scheduler workers, never on the read loop.
//==========================================================================================================
class Server {
public:
    explicit Server(ServerOptions options = LoadServerOptionsFromEnv());
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    ////////////////////////////////////////////// Registration /////////////////////////////////////////////
    //==========================================================================================================
    // RegisterTool
    // Purpose: Adds a tool. A null inputSchema means the tool takes no arguments.
    // Throws:
    //   errors::DuplicateCapabilityError, errors::RegistryClosedError, std::invalid_argument.
    //==========================================================================================================
    void RegisterTool(const Tool& tool, ToolHandler handler);

    //==========================================================================================================
    // RegisterResource
    // Purpose: Adds a resource keyed by its uri.
    //==========================================================================================================
    void RegisterResource(const Resource& resource, ResourceHandler handler);

    //==========================================================================================================
    // RegisterPrompt
    // Purpose: Adds a prompt; its input schema is derived from the declared arguments.
    //==========================================================================================================
    void RegisterPrompt(const Prompt& prompt, PromptHandler handler);

    ////////////////////////////////////////////// Lifecycle /////////////////////////////////////////////
    //==========================================================================================================
    // Run
    // Purpose: Starts the transport and processes frames until the input ends or the session closes.
    //          In-flight requests get the shutdown grace period to finish before Run returns.
    // Throws:
    //   std::logic_error when the server is already running or has already run.
    //==========================================================================================================
    void Run(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Start
    // Purpose: Runs the read loop on a background thread.
    // Returns:
    //   A future that completes once the transport is started and frames are being read.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Stop
    // Purpose: Begins shutdown as if the client had sent `shutdown`.
    // Returns:
    //   A future that completes when the session is closed and the read loop has exited.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;
    SessionPhase Phase() const;
    const ServerOptions& Options() const;
    const CapabilityRegistry& Registry() const;

    // Receives transport errors (framing corruption, write failures) after they are logged.
    void SetErrorHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcprt
