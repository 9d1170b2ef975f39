//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiters enabling co_await on std::future and on blocking calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace mcpcore {
namespace async {

//==========================================================================================================
// FutureAwaitable<T>
// Purpose: co_await adapter for std::future<T> (T may be void).
// Notes:
//   - The coroutine resumes on a detached waiter thread once the future is ready.
//   - The stored value or exception surfaces from await_resume().
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        // wait() does not throw for a valid future; get() in await_resume delivers any stored exception.
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

// Runs a blocking call (a dispatcher wait, a task-result wait) on its own thread and resumes the awaiting
// coroutine with its result.
template <typename F>
inline auto offload(F&& fn) -> FutureAwaitable<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    return FutureAwaitable<R>(std::async(std::launch::async, std::forward<F>(fn)));
}

} // namespace async
} // namespace mcpcore
