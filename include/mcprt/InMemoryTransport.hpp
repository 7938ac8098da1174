//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory frame transport for tests and embedding
//==========================================================================================================
#pragma once

#include "mcprt/Transport.h"
#include <chrono>
#include <memory>
#include <utility>

namespace mcprt {

//==========================================================================================================
// InMemoryTransport
// Purpose: In-process transport that delivers frames to a paired instance without any I/O.
//          Closing one end delivers EOF to the other once the frames already sent to it are consumed.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    virtual ~InMemoryTransport();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two paired transports wired to each other in-memory.
    // Returns:
    //   pair(left,right) where sending on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::optional<std::string> Receive() override;
    bool Send(const std::string& frame) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // ReceiveFor
    // Purpose: Receive with a deadline, for tests that must not hang.
    // Returns:
    //   The next frame, or std::nullopt on timeout or EOF.
    //==========================================================================================================
    std::optional<std::string> ReceiveFor(std::chrono::milliseconds timeout);

    // Half-close: the peer sees EOF after draining, while this end can still receive.
    void CloseWrite();

    // True once no more frames can arrive and the inbound queue is empty.
    bool InputEnded() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcprt
