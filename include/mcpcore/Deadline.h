//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Deadline.h
// Purpose: Saturating conversion of a relative timeout into a steady_clock deadline
//==========================================================================================================

#pragma once

#include <chrono>

namespace mcpcore {

// Returns from + timeout, saturated to time_point::max() for very large timeouts (milliseconds::max() means
// "no deadline") and to from for non-positive ones.
inline std::chrono::steady_clock::time_point DeadlineFrom(std::chrono::steady_clock::time_point from,
                                                          std::chrono::milliseconds timeout) {
    using Clock = std::chrono::steady_clock;
    if (timeout <= std::chrono::milliseconds::zero()) {
        return from;
    }
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - from);
    if (timeout >= headroom) {
        return Clock::time_point::max();
    }
    return from + std::chrono::duration_cast<Clock::duration>(timeout);
}

inline std::chrono::steady_clock::time_point DeadlineAfter(std::chrono::milliseconds timeout) {
    return DeadlineFrom(std::chrono::steady_clock::now(), timeout);
}

} // namespace mcpcore
