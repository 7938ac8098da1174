//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Protocol state machine; routes decoded requests to capabilities and emits responses
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mcprt/CapabilityRegistry.h"
#include "mcprt/Config.h"
#include "mcprt/ExecutionScheduler.h"
#include "mcprt/JSONRPCTypes.h"
#include "mcprt/Session.h"

namespace mcprt {

//==========================================================================================================
// Dispatcher
// Purpose: Applies the session lifecycle and the per-request algorithm:
//            phase gate -> method lookup -> target lookup -> schema validation -> scheduler -> response.
// Notes:
//   - HandleFrame is called from a single read loop; responses may be emitted later from worker threads.
//   - At most one response is emitted per request id, and none once the session is Closed.
//==========================================================================================================
class Dispatcher {
public:
    // Writes one encoded response frame; returns false when the transport refused it.
    using FrameSink = std::function<bool(const std::string& frame)>;
    // Invoked once when the session enters ShuttingDown.
    using ShutdownListener = std::function<void()>;

    Dispatcher(const ServerOptions& options,
               CapabilityRegistry& registry,
               ExecutionScheduler& scheduler,
               SessionState& session,
               FrameSink sink);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    //==========================================================================================================
    // HandleFrame
    // Purpose: Decodes and processes one inbound frame. Malformed frames are answered when their id can be
    //          recovered and dropped otherwise; they never end the session.
    //==========================================================================================================
    void HandleFrame(const std::string& frame);

    void HandleRequest(const JSONRPCRequest& request);
    void HandleNotification(const JSONRPCNotification& notification);

    void SetShutdownListener(ShutdownListener listener);

    //==========================================================================================================
    // BeginShutdown
    // Purpose: Moves the session to ShuttingDown (new requests are refused). Idempotent.
    // Returns:
    //   true when this call performed the transition.
    //==========================================================================================================
    bool BeginShutdown(const std::string& reason);

    //==========================================================================================================
    // FinishShutdown
    // Purpose: Waits for in-flight requests, then for the input side to end (SessionState::EndInput), both
    //          bounded by the shutdown grace. Requests arriving meanwhile are answered with ShuttingDown. Then
    //          closes the session and stops the scheduler. No response is emitted afterwards.
    // Returns:
    //   true when every in-flight request was answered before closing.
    //==========================================================================================================
    bool FinishShutdown();

    SessionPhase Phase() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcprt
