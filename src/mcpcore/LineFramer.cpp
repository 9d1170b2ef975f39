//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Newline-delimited framer used by the pipe and socket transports
//========================================================================================================

#include "mcpcore/LineFramer.h"

namespace mcpcore {

std::string LineFramer::encode(const std::string& payload) const {
    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.append(payload);
    frame.push_back('\n');
    return frame;
}

LineFramer::DecodeResult LineFramer::tryDecodeEx(const std::string& buffer) const {
    std::size_t start = 0;
    while (true) {
        std::size_t eol = buffer.find('\n', start);
        if (eol == std::string::npos) {
            if (buffer.size() - start > maxFrameBytes) {
                return { DecodeStatus::FrameTooLarge, std::nullopt, buffer.size() };
            }
            // Blank lines already scanned are reported so the caller can drop them.
            return { DecodeStatus::Incomplete, std::nullopt, start };
        }
        std::size_t end = eol;
        if (end > start && buffer[end - 1] == '\r') {
            --end;
        }
        if (end - start > maxFrameBytes) {
            return { DecodeStatus::FrameTooLarge, std::nullopt, eol + 1 };
        }
        if (end == start) {
            start = eol + 1;
            continue;
        }
        return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
    }
}

std::optional<std::string> LineFramer::tryDecode(std::string& buffer) const {
    DecodeResult r = tryDecodeEx(buffer);
    if (r.status == DecodeStatus::FrameTooLarge) {
        return std::nullopt;
    }
    if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
        buffer.erase(0, r.bytesConsumed);
    }
    return r.payload;
}

} // namespace mcpcore
