//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseDispatcher.h
// Purpose: Correlates inbound responses to pending requests by JSON-RPC id
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "mcpcore/JSONRPCTypes.h"

class Logger;

namespace mcpcore {

//==========================================================================================================
// ResponseDispatcher
// Purpose: Map from request id to a single-use promise.
// Notes:
//   - RegisterRequest() must complete before the request is written, so a fast reply always finds its entry.
//   - Every entry is removed exactly once: by Dispatch() on the matching reply, by Unregister() after a
//     caller timeout, or by FailAll() when the transport dies. Promises are fulfilled outside the lock.
//   - Keys are JSONRPCId::ToString(), so "7" and 7 correlate.
//==========================================================================================================
class ResponseDispatcher {
public:
    explicit ResponseDispatcher(std::shared_ptr<Logger> logger);
    ~ResponseDispatcher();

    ResponseDispatcher(const ResponseDispatcher&) = delete;
    ResponseDispatcher& operator=(const ResponseDispatcher&) = delete;

    //==========================================================================================================
    // Registers a pending entry for id.
    // Returns:
    //   Future receiving the response or error message for id.
    // Throws:
    //   std::invalid_argument when id is absent or an entry for it is still live.
    //==========================================================================================================
    std::future<JSONRPCMessage> RegisterRequest(const JSONRPCId& id);

    //==========================================================================================================
    // Routes a response/error message to its pending entry.
    // Returns:
    //   true when delivered; false when no entry matched (late reply, duplicate, or unsolicited) and the
    //   message was logged and dropped.
    //==========================================================================================================
    bool Dispatch(JSONRPCMessage message);

    // Removes an entry without fulfilling it. Returns false when it was already consumed.
    bool Unregister(const JSONRPCId& id);

    // Fails every pending entry with errors::TransportError(reason). Returns the number failed.
    std::size_t FailAll(const std::string& reason);

    std::size_t PendingCount() const;

    //==========================================================================================================
    // AwaitResponse
    // Purpose: Blocks on a registered future for up to timeout; on expiry unregisters id.
    // Throws:
    //   errors::TimeoutError on expiry; whatever FailAll stored when the transport failed.
    //==========================================================================================================
    JSONRPCMessage AwaitResponse(const JSONRPCId& id, std::future<JSONRPCMessage>& future,
                                 std::chrono::milliseconds timeout);

private:
    std::shared_ptr<Logger> logger;
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::promise<JSONRPCMessage>> pending;
};

} // namespace mcpcore
