//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine type whose outcome is read through a std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace mcpcore {
namespace async {

namespace detail {

// Shared by both promise flavours: runs eagerly to the first co_await, never suspends at the end, and
// routes escaping exceptions into the future.
template <typename T>
struct PromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

template <typename T>
struct ValuePromise : PromiseBase<T> {
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
};

struct VoidPromise : PromiseBase<void> {
    void return_void() { promise.set_value(); }
};

} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Return type for the client's coroutines. Public APIs hand callers toFuture().
// Notes:
//   - Coroutine parameters must be taken by value; references dangle after the first suspension.
//   - toFuture() may be called once.
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type
        : std::conditional_t<std::is_void_v<T>, detail::VoidPromise, detail::ValuePromise<T>> {
        Task get_return_object() noexcept { return Task{this->promise.get_future()}; }
    };

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

} // namespace async
} // namespace mcpcore
