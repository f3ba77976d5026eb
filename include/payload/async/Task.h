//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Coroutine Task type bridging handler coroutines to the std::future the dispatcher waits on
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <future>
#include <exception>
#include <utility>
#include <type_traits>

namespace payload {
namespace async {

// Task<T> - eagerly started coroutine whose outcome (value or exception) lands in a std::future<T>.
// Usage: Task<JSONValue> transform(const JSONValue& p) { co_return result; } -> transform(p).toFuture()

template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type {
        std::promise<T> promise;
        Task get_return_object() { return Task{ promise.get_future() }; }
        std::suspend_never initial_suspend() noexcept { return {}; }
        std::suspend_never final_suspend() noexcept { return {}; }
        void unhandled_exception() { promise.set_exception(std::current_exception()); }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

// Ready future holding value; for handlers that compute synchronously.
template <typename T>
std::future<std::decay_t<T>> makeReady(T&& value) {
    std::promise<std::decay_t<T>> p;
    p.set_value(std::forward<T>(value));
    return p.get_future();
}

// Failed future holding the exception e.
template <typename T, typename E>
std::future<T> makeFailed(E&& e) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(std::forward<E>(e)));
    return p.get_future();
}

} // namespace async
} // namespace payload
