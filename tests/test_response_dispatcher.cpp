//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_response_dispatcher.cpp
// Purpose: GoogleTests for reply correlation: at-most-once delivery, timeouts and connection loss
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <random>
#include <thread>
#include <vector>

#include "mcpcore/Deadline.h"
#include "mcpcore/ResponseDispatcher.h"
#include "mcpcore/errors/Errors.h"
#include "TestSupport.h"

using namespace mcpcore;

namespace {
JSONRPCMessage reply(const JSONRPCId& id, int64_t marker) {
    JSONValue::Object obj;
    obj["marker"] = std::make_shared<JSONValue>(marker);
    return JSONRPCMessage::MakeResponse(id, JSONValue{obj});
}
} // namespace

TEST(ResponseDispatcher, DeliversMatchingReply) {
    ResponseDispatcher d(testsupport::QuietLogger());
    auto fut = d.RegisterRequest(JSONRPCId(1));
    EXPECT_EQ(d.PendingCount(), 1u);
    EXPECT_TRUE(d.Dispatch(reply(JSONRPCId(1), 11)));
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    auto msg = fut.get();
    EXPECT_EQ(GetIntMember(msg.result.value(), "marker").value_or(0), 11);
    EXPECT_EQ(d.PendingCount(), 0u);
}

TEST(ResponseDispatcher, StringIdReplyMatchesNumericRequest) {
    ResponseDispatcher d(testsupport::QuietLogger());
    auto fut = d.RegisterRequest(JSONRPCId(7));
    EXPECT_TRUE(d.Dispatch(reply(JSONRPCId("7"), 1)));
    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
}

TEST(ResponseDispatcher, DuplicateReplyDropped) {
    testsupport::LogCapture capture;
    ResponseDispatcher d(capture.Get());
    auto fut = d.RegisterRequest(JSONRPCId(5));
    EXPECT_TRUE(d.Dispatch(reply(JSONRPCId(5), 1)));
    EXPECT_FALSE(d.Dispatch(reply(JSONRPCId(5), 2)));
    EXPECT_EQ(GetIntMember(fut.get().result.value(), "marker").value_or(0), 1);
    EXPECT_EQ(capture.Count(Logger::Level::DEBUG, "unmatched id '5'"), 1u);
}

TEST(ResponseDispatcher, UnknownAndAbsentIdsDropped) {
    ResponseDispatcher d(testsupport::QuietLogger());
    EXPECT_FALSE(d.Dispatch(reply(JSONRPCId(99), 1)));
    EXPECT_FALSE(d.Dispatch(JSONRPCMessage::MakeResponse(JSONRPCId(), JSONValue{})));
}

TEST(ResponseDispatcher, RegisterRejectsAbsentAndDuplicateIds) {
    ResponseDispatcher d(testsupport::QuietLogger());
    EXPECT_THROW(d.RegisterRequest(JSONRPCId()), std::invalid_argument);
    auto fut = d.RegisterRequest(JSONRPCId(1));
    EXPECT_THROW(d.RegisterRequest(JSONRPCId("1")), std::invalid_argument);
}

TEST(ResponseDispatcher, TimeoutUnregistersEntry) {
    testsupport::LogCapture capture(Logger::Level::WARN);
    ResponseDispatcher d(capture.Get());
    JSONRPCId id(3);
    auto fut = d.RegisterRequest(id);
    EXPECT_THROW(d.AwaitResponse(id, fut, std::chrono::milliseconds(20)), errors::TimeoutError);
    EXPECT_EQ(d.PendingCount(), 0u);
    EXPECT_FALSE(d.Dispatch(reply(id, 1)));
    EXPECT_EQ(capture.Count(Logger::Level::WARN, "timed out"), 1u);
}

TEST(ResponseDispatcher, UnboundedTimeoutWaitsForReply) {
    ResponseDispatcher d(testsupport::QuietLogger());
    JSONRPCId id(4);
    auto fut = d.RegisterRequest(id);
    std::thread responder([&d, id]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        d.Dispatch(reply(id, 44));
    });
    auto msg = d.AwaitResponse(id, fut, std::chrono::milliseconds::max());
    responder.join();
    EXPECT_EQ(GetIntMember(msg.result.value(), "marker").value_or(0), 44);
    EXPECT_EQ(d.PendingCount(), 0u);
}

TEST(Deadline, SaturatesInsteadOfOverflowing) {
    using Clock = std::chrono::steady_clock;
    const auto from = Clock::now();
    EXPECT_EQ(DeadlineFrom(from, std::chrono::milliseconds::max()), Clock::time_point::max());
    EXPECT_EQ(DeadlineFrom(from, std::chrono::milliseconds(-5)), from);
    EXPECT_EQ(DeadlineFrom(from, std::chrono::milliseconds::min()), from);
    EXPECT_EQ(DeadlineFrom(from, std::chrono::milliseconds(250)), from + std::chrono::milliseconds(250));
}

TEST(ResponseDispatcher, FailAllRejectsEveryPendingRequest) {
    ResponseDispatcher d(testsupport::QuietLogger());
    std::vector<std::future<JSONRPCMessage>> futures;
    for (int i = 0; i < 5; ++i) {
        futures.push_back(d.RegisterRequest(JSONRPCId(i)));
    }
    EXPECT_EQ(d.FailAll("server closed its stdout"), 5u);
    EXPECT_EQ(d.PendingCount(), 0u);
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(std::chrono::seconds(1)), std::future_status::ready);
        try {
            f.get();
            FAIL() << "expected TransportError";
        } catch (const errors::TransportError& e) {
            EXPECT_STREQ(e.what(), "server closed its stdout");
        }
    }
    EXPECT_EQ(d.FailAll("again"), 0u);
}

// Every reply injected from another thread after a short random delay reaches its waiter.
TEST(ResponseDispatcher, DelayedRepliesAlwaysDelivered) {
    ResponseDispatcher d(testsupport::QuietLogger());
    constexpr int kRequests = 10000;
    int answered = 0;
    int timedOut = 0;
    int misrouted = 0;

    std::mt19937 rng(12345u);
    std::uniform_int_distribution<int> delay(0, 300);
    for (int i = 0; i < kRequests; ++i) {
        JSONRPCId id(static_cast<int64_t>(i));
        auto fut = d.RegisterRequest(id);
        const int us = delay(rng);
        std::thread responder([&d, id, i, us]() {
            std::this_thread::sleep_for(std::chrono::microseconds(us));
            d.Dispatch(reply(id, i));
        });
        try {
            auto msg = d.AwaitResponse(id, fut, std::chrono::seconds(5));
            if (GetIntMember(msg.result.value(), "marker").value_or(-1) != i) {
                ++misrouted;
            }
            ++answered;
        } catch (const errors::TimeoutError&) {
            ++timedOut;
        }
        responder.join();
    }
    EXPECT_EQ(answered, kRequests);
    EXPECT_EQ(timedOut, 0);
    EXPECT_EQ(misrouted, 0);
    EXPECT_EQ(d.PendingCount(), 0u);
}

// Replies race with deadlines from many threads; every request resolves exactly once and no entry leaks.
TEST(ResponseDispatcher, ConcurrentRepliesAndTimeoutsStress) {
    ResponseDispatcher d(testsupport::QuietLogger());
    constexpr int kRequests = 10000;
    constexpr int kThreads = 8;
    std::atomic<int> answered{0};
    std::atomic<int> timedOut{0};
    std::atomic<int> misrouted{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned int>(t) * 7919u + 1u);
            std::uniform_int_distribution<int> delay(0, 300);
            for (int i = t; i < kRequests; i += kThreads) {
                JSONRPCId id(static_cast<int64_t>(i));
                auto fut = d.RegisterRequest(id);
                const int us = delay(rng);
                std::thread responder([&d, id, i, us]() {
                    std::this_thread::sleep_for(std::chrono::microseconds(us));
                    d.Dispatch(reply(id, i));
                });
                try {
                    auto msg = d.AwaitResponse(id, fut, std::chrono::milliseconds(i % 2));
                    if (GetIntMember(msg.result.value(), "marker").value_or(-1) != i) {
                        ++misrouted;
                    }
                    ++answered;
                } catch (const errors::TimeoutError&) {
                    ++timedOut;
                }
                responder.join();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(answered.load() + timedOut.load(), kRequests);
    EXPECT_EQ(misrouted.load(), 0);
    EXPECT_EQ(d.PendingCount(), 0u);
}
