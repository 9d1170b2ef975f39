//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Newline-delimited framing for JSON-RPC byte streams
//========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace mcpcore {

//========================================================================================================
// LineFramer
// Purpose: Splits an accumulating byte buffer into newline-terminated frames.
// Notes:
//   - A trailing '\r' is stripped so CRLF peers resynchronize cleanly.
//   - Blank lines are skipped.
//   - A line longer than maxFrameBytes yields FrameTooLarge; the caller decides whether to close.
//========================================================================================================
class LineFramer {
public:
    static constexpr std::size_t DefaultMaxFrameBytes = 20 * 1024 * 1024;

    enum class DecodeStatus {
        Ok,
        Incomplete,
        FrameTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer (also set when Incomplete)
    };

    explicit LineFramer(std::size_t maxFrameBytes = DefaultMaxFrameBytes) : maxFrameBytes(maxFrameBytes) {}

    // Appends the terminating newline. Payloads must not contain raw newlines (compact JSON never does).
    std::string encode(const std::string& payload) const;

    DecodeResult tryDecodeEx(const std::string& buffer) const;

    // Convenience: decodes one frame and erases it from buffer. Skipped blank lines are erased even when no
    // frame is complete yet; an oversized frame leaves buffer untouched.
    std::optional<std::string> tryDecode(std::string& buffer) const;

    std::size_t getMaxFrameBytes() const { return maxFrameBytes; }

private:
    std::size_t maxFrameBytes;
};

} // namespace mcpcore
