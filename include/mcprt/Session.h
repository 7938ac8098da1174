//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Session lifecycle phase and the set of request ids awaiting a response
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include "mcprt/Protocol.h"

namespace mcprt {

enum class SessionPhase {
    Uninitialized,
    Ready,
    ShuttingDown,
    Closed
};

inline const char* toString(SessionPhase p) {
    switch (p) {
        case SessionPhase::Uninitialized: return "Uninitialized";
        case SessionPhase::Ready: return "Ready";
        case SessionPhase::ShuttingDown: return "ShuttingDown";
        case SessionPhase::Closed: return "Closed";
    }
    return "Unknown";
}

//==========================================================================================================
// SessionState
// Purpose: Phase only moves forward. The in-flight set holds ids (IdKey form) of requests that were accepted
//          and not yet answered.
//==========================================================================================================
class SessionState {
public:
    SessionPhase Phase() const { return phase.load(); }

    //==========================================================================================================
    // Advance
    // Purpose: Atomically moves from `from` to `to`.
    // Returns:
    //   false when the current phase is not `from` (another thread got there first).
    //==========================================================================================================
    bool Advance(SessionPhase from, SessionPhase to);

    // Moves to ShuttingDown from Uninitialized or Ready. Returns false when already shutting down or closed.
    bool BeginShutdown();

    void MarkClosed();

    /////////////////////////////////////////// In-flight ids ///////////////////////////////////////////
    // Returns false when the id is already in flight.
    bool TryBegin(const std::string& idKey);
    // Returns false when the id was not in flight.
    bool Finish(const std::string& idKey);
    bool IsInFlight(const std::string& idKey) const;
    std::size_t InFlightCount() const;

    // Waits until no request is in flight. Returns true when drained before the timeout.
    bool WaitDrained(std::chrono::milliseconds timeout);

    /////////////////////////////////////////// Input side ///////////////////////////////////////////
    // Called once the client hung up or the application no longer waits for it.
    void EndInput();
    bool InputEnded() const;
    // Returns true when input ended before the timeout.
    bool WaitInputEnded(std::chrono::milliseconds timeout);

    /////////////////////////////////////////// Negotiated client ///////////////////////////////////////////
    void SetClient(Implementation info, std::string protocolVersion);
    std::optional<Implementation> ClientInfo() const;
    std::string ProtocolVersion() const;

private:
    std::atomic<SessionPhase> phase{SessionPhase::Uninitialized};

    mutable std::mutex mutex;
    std::condition_variable cvDrained;
    std::unordered_set<std::string> inFlight;
    bool inputEnded{false};
    std::optional<Implementation> clientInfo;
    std::string protocolVersion;
};

} // namespace mcprt
