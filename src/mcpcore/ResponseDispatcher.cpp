//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResponseDispatcher.cpp
// Purpose: Pending-request map with at-most-once delivery
//==========================================================================================================

#include "mcpcore/ResponseDispatcher.h"

#include <stdexcept>
#include <vector>

#include "logging/Logger.h"
#include "mcpcore/Deadline.h"
#include "mcpcore/errors/Errors.h"

namespace mcpcore {

ResponseDispatcher::ResponseDispatcher(std::shared_ptr<Logger> logger)
    : logger(std::move(logger)) {}

ResponseDispatcher::~ResponseDispatcher() {
    FailAll("Dispatcher destroyed");
}

std::future<JSONRPCMessage> ResponseDispatcher::RegisterRequest(const JSONRPCId& id) {
    if (id.IsAbsent()) {
        throw std::invalid_argument("cannot register a request without an id");
    }
    const std::string key = id.ToString();
    std::promise<JSONRPCMessage> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto [it, inserted] = pending.try_emplace(key, std::move(promise));
        if (!inserted) {
            throw std::invalid_argument("request id already pending: " + key);
        }
    }
    return future;
}

bool ResponseDispatcher::Dispatch(JSONRPCMessage message) {
    const std::string key = message.id.ToString();
    std::promise<JSONRPCMessage> promise;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = message.id.IsAbsent() ? pending.end() : pending.find(key);
        if (it == pending.end()) {
            LOG_DEBUG(logger, "ResponseDispatcher: dropping {} with unmatched id '{}'", MessageKindName(message.Kind()), key);
            return false;
        }
        promise = std::move(it->second);
        pending.erase(it);
    }
    promise.set_value(std::move(message));
    return true;
}

bool ResponseDispatcher::Unregister(const JSONRPCId& id) {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.erase(id.ToString()) > 0;
}

std::size_t ResponseDispatcher::FailAll(const std::string& reason) {
    std::unordered_map<std::string, std::promise<JSONRPCMessage>> drained;
    {
        std::lock_guard<std::mutex> lock(mutex);
        drained.swap(pending);
    }
    for (auto& [key, promise] : drained) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError(reason)));
    }
    if (!drained.empty()) {
        LOG_WARN(logger, "ResponseDispatcher: failed {} pending request(s): {}", drained.size(), reason);
    }
    return drained.size();
}

std::size_t ResponseDispatcher::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return pending.size();
}

JSONRPCMessage ResponseDispatcher::AwaitResponse(const JSONRPCId& id, std::future<JSONRPCMessage>& future,
                                                 std::chrono::milliseconds timeout) {
    if (future.wait_until(DeadlineAfter(timeout)) != std::future_status::ready) {
        if (Unregister(id)) {
            LOG_WARN(logger, "Request '{}' timed out after {} ms (pending={})", id.ToString(),
                     static_cast<long long>(timeout.count()), PendingCount());
            throw errors::TimeoutError("request '" + id.ToString() + "' timed out");
        }
        // Lost the race: the reply was taken concurrently with the deadline and is about to be set.
    }
    return future.get();
}

} // namespace mcpcore
