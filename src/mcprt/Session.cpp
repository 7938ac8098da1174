//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session phase transitions and in-flight id tracking
//==========================================================================================================

#include "mcprt/Session.h"

#include "logging/Logger.h"

namespace mcprt {

bool SessionState::Advance(SessionPhase from, SessionPhase to) {
    SessionPhase expected = from;
    if (!phase.compare_exchange_strong(expected, to)) {
        return false;
    }
    LOG_INFO("Session: {} -> {}", toString(from), toString(to));
    return true;
}

bool SessionState::BeginShutdown() {
    return Advance(SessionPhase::Ready, SessionPhase::ShuttingDown) ||
           Advance(SessionPhase::Uninitialized, SessionPhase::ShuttingDown);
}

void SessionState::MarkClosed() {
    const SessionPhase prev = phase.exchange(SessionPhase::Closed);
    if (prev != SessionPhase::Closed) {
        LOG_INFO("Session: {} -> Closed", toString(prev));
    }
    cvDrained.notify_all();
}

bool SessionState::TryBegin(const std::string& idKey) {
    std::lock_guard<std::mutex> lk(mutex);
    return inFlight.insert(idKey).second;
}

bool SessionState::Finish(const std::string& idKey) {
    bool erased = false;
    {
        std::lock_guard<std::mutex> lk(mutex);
        erased = inFlight.erase(idKey) > 0;
    }
    if (erased) {
        cvDrained.notify_all();
    }
    return erased;
}

bool SessionState::IsInFlight(const std::string& idKey) const {
    std::lock_guard<std::mutex> lk(mutex);
    return inFlight.count(idKey) > 0;
}

std::size_t SessionState::InFlightCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return inFlight.size();
}

bool SessionState::WaitDrained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex);
    return cvDrained.wait_for(lk, timeout, [&]{ return inFlight.empty(); });
}

void SessionState::EndInput() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        inputEnded = true;
    }
    cvDrained.notify_all();
}

bool SessionState::InputEnded() const {
    std::lock_guard<std::mutex> lk(mutex);
    return inputEnded;
}

bool SessionState::WaitInputEnded(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mutex);
    return cvDrained.wait_for(lk, timeout, [&]{ return inputEnded; });
}

void SessionState::SetClient(Implementation info, std::string version) {
    std::lock_guard<std::mutex> lk(mutex);
    clientInfo = std::move(info);
    protocolVersion = std::move(version);
}

std::optional<Implementation> SessionState::ClientInfo() const {
    std::lock_guard<std::mutex> lk(mutex);
    return clientInfo;
}

std::string SessionState::ProtocolVersion() const {
    std::lock_guard<std::mutex> lk(mutex);
    return protocolVersion;
}

} // namespace mcprt
