//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Frame-level transport interface; carries opaque lines and knows nothing about JSON-RPC
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <optional>
#include <cstdint>

namespace mcprt {

//==========================================================================================================
// ITransport
// Purpose: Reads and writes newline-delimited frames on a byte stream.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loops.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport is running.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. Frames already accepted by Send are flushed within a bounded deadline.
    // Any thread blocked in Receive is woken and observes EOF.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Frame I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Blocks until the next complete frame is available.
    // Returns:
    //   The frame without its line terminator, or std::nullopt on EOF, close, or a fatal transport error.
    //==========================================================================================================
    virtual std::optional<std::string> Receive() = 0;

    //==========================================================================================================
    // Queues one frame for writing; the transport appends the line terminator.
    // Args:
    //   frame: Serialized message that must not contain a raw newline.
    // Returns:
    //   true when accepted; false when the transport is closed or its write queue overflowed.
    //==========================================================================================================
    virtual bool Send(const std::string& frame) = 0;

    /////////////////////////////////////////// Error handling ///////////////////////////////////////////
    //==========================================================================================================
    // Registers an error handler to receive transport errors.
    // Args:
    //   handler: Callback with error string.
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific "key=value;key=value" configuration string.
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace mcprt
