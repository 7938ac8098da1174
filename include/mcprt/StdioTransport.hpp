//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited frame transport over stdin/stdout (or any pair of file descriptors)
//==========================================================================================================
#pragma once

#include "mcprt/Transport.h"
#include <memory>
#include <cstdint>

namespace mcprt {

//==========================================================================================================
// StdioTransport
// Purpose: Frame transport for local process integrations. A reader thread splits the input stream into
//          lines; a writer thread drains a bounded queue of outgoing frames.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    // Reads STDIN_FILENO and writes STDOUT_FILENO.
    StdioTransport();
    // Reads inFd and writes outFd; the descriptors stay owned by the caller.
    StdioTransport(int inFd, int outFd);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader/writer loops.
    // Returns:
    //   Future that completes when loops are running.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops reading, flushes queued frames (bounded by the flush timeout), and joins the loops.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::optional<std::string> Receive() override;
    bool Send(const std::string& frame) override;

    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetMaxFrameBytes
    // Purpose: Upper bound for one line. A longer line is treated as framing corruption and disconnects.
    // Args:
    //   maxBytes: Maximum frame length in bytes (default 4 MiB).
    //==========================================================================================================
    void SetMaxFrameBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetIdleReadTimeoutMs
    // Purpose: If > 0, emit an error and disconnect when no bytes arrive for the given duration.
    // Args:
    //   timeoutMs: Idle read timeout in milliseconds (0 disables idle timeout).
    //==========================================================================================================
    void SetIdleReadTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending write buffers.
    // Args:
    //   maxBytes: Maximum allowed bytes in write queue before emitting an error and disconnecting.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteTimeoutMs
    // Purpose: Per-frame write timeout while the output descriptor is not writable.
    // Args:
    //   timeoutMs: Milliseconds to allow for writing a frame before error/disconnect (0 disables).
    //==========================================================================================================
    void SetWriteTimeoutMs(uint64_t timeoutMs);

    // Maximum time Close() waits for queued frames to reach the output descriptor.
    void SetFlushTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Creates stdio transports from "max_frame_bytes=..;write_queue_max_bytes=..;write_timeout_ms=..;
//          idle_read_timeout_ms=..;flush_timeout_ms=.." configuration strings. Unknown keys are ignored.
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

struct StdioTransportTestHooks {
    // Splits complete lines out of buffer into the inbound queue exactly as the reader thread does.
    static void drainFrames(StdioTransport& t, std::string& buffer);
    // Applies end-of-stream handling to whatever is left in buffer.
    static void finishInput(StdioTransport& t, std::string& buffer);
    static void setConnected(StdioTransport& t, bool v);
    static bool isConnected(const StdioTransport& t);
    static std::size_t maxFrameBytes(const StdioTransport& t);
    static std::size_t writeQueueMaxBytes(const StdioTransport& t);
};

} // namespace mcprt
