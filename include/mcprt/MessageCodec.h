//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Converts between raw frames and typed JSON-RPC envelopes
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>

#include "mcprt/JSONRPCTypes.h"
#include "mcprt/errors/Errors.h"

namespace mcprt {

//==========================================================================================================
// DecodeFailure
// Purpose: A frame that could not be turned into a Request or Notification.
// Fields:
//   id: Request id recovered from the frame, when any. Failures without an id are never answered.
//   error: ParseError (-32700) for malformed JSON; InvalidRequest (-32600) for a bad envelope.
//==========================================================================================================
struct DecodeFailure {
    std::optional<JSONRPCId> id;
    errors::McpError error;
};

using DecodedMessage = std::variant<JSONRPCRequest, JSONRPCNotification, DecodeFailure>;

//==========================================================================================================
// MessageCodec
// Purpose: Stateless frame codec. Unknown methods decode successfully; routing rejects them later.
//==========================================================================================================
class MessageCodec {
public:
    //==========================================================================================================
    // Decode
    // Purpose: Classifies and validates one frame.
    // Args:
    //   frame: One newline-delimited frame without its terminator.
    // Returns:
    //   JSONRPCRequest, JSONRPCNotification, or DecodeFailure.
    //==========================================================================================================
    static DecodedMessage Decode(const std::string& frame);

    //==========================================================================================================
    // Encode
    // Purpose: Serializes a response to a single line (no embedded newlines, no terminator).
    //==========================================================================================================
    static std::string Encode(const JSONRPCResponse& response);
    static std::string Encode(const JSONRPCRequest& request);
    static std::string Encode(const JSONRPCNotification& notification);

    //==========================================================================================================
    // RecoverId
    // Purpose: Tolerant scan for a top-level "id" member in text that may not be valid JSON.
    // Returns:
    //   The id when its value is a string literal or an integer literal; std::nullopt otherwise.
    //==========================================================================================================
    static std::optional<JSONRPCId> RecoverId(const std::string& frame);
};

} // namespace mcprt
