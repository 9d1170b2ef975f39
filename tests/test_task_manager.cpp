//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_task_manager.cpp
// Purpose: GoogleTests for the task state machine, expiry sweep, cancellation and shutdown broadcast
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

#include "mcpcore/errors/Errors.h"
#include "mcpcore/tasks/Task.h"
#include "mcpcore/tasks/TaskManager.h"
#include "TestSupport.h"

using namespace mcpcore;
using namespace mcpcore::tasks;
using namespace std::chrono_literals;

namespace {
std::shared_ptr<TaskManager> makeManager(TaskManagerOptions opts = {}) {
    return std::make_shared<TaskManager>(opts, testsupport::QuietLogger());
}

JSONValue textResult(const std::string& text) {
    JSONValue::Object obj;
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}
} // namespace

TEST(TaskStatus, WireNamesRoundTrip) {
    for (auto s : {TaskStatus::Working, TaskStatus::InputRequired, TaskStatus::Completed,
                   TaskStatus::Failed, TaskStatus::Canceled}) {
        auto parsed = TaskStatusFromString(TaskStatusName(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(parsed.value(), s);
    }
    EXPECT_STREQ(TaskStatusName(TaskStatus::InputRequired), "input_required");
    EXPECT_FALSE(TaskStatusFromString("done").has_value());
}

TEST(TaskStatus, TransitionTable) {
    EXPECT_TRUE(IsValidTransition(TaskStatus::Working, TaskStatus::InputRequired));
    EXPECT_TRUE(IsValidTransition(TaskStatus::Working, TaskStatus::Completed));
    EXPECT_TRUE(IsValidTransition(TaskStatus::InputRequired, TaskStatus::Working));
    EXPECT_TRUE(IsValidTransition(TaskStatus::InputRequired, TaskStatus::Canceled));
    EXPECT_FALSE(IsValidTransition(TaskStatus::InputRequired, TaskStatus::Completed));
    EXPECT_FALSE(IsValidTransition(TaskStatus::Completed, TaskStatus::Working));
    EXPECT_FALSE(IsValidTransition(TaskStatus::Canceled, TaskStatus::Canceled));
}

TEST(TaskManager, CreateAssignsRandomIdsAndWorkingStatus) {
    auto mgr = makeManager();
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        Task t = mgr->CreateTask("tools/call");
        EXPECT_EQ(t.status, TaskStatus::Working);
        EXPECT_EQ(t.statusMessage, "Task is being processed");
        EXPECT_EQ(t.id.size(), 36u);
        EXPECT_EQ(t.id[14], '4');
        ids.insert(t.id);
    }
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(mgr->GetTaskCount(), 200u);
}

TEST(TaskManager, TtlClampedAndDefaulted) {
    TaskManagerOptions opts;
    opts.defaultTtl = 1000ms;
    opts.maxTtl = 5000ms;
    auto mgr = makeManager(opts);

    EXPECT_EQ(mgr->CreateTask("m").ttl, 1000ms);
    EXPECT_EQ(mgr->CreateTask("m", std::nullopt, 0ms).ttl, 1000ms);
    EXPECT_EQ(mgr->CreateTask("m", std::nullopt, 2000ms).ttl, 2000ms);
    Task clamped = mgr->CreateTask("m", std::nullopt, 60000ms);
    EXPECT_EQ(clamped.ttl, 5000ms);
    EXPECT_EQ(clamped.expiresAt - clamped.createdAt, std::chrono::milliseconds(5000));
}

TEST(TaskManager, UnknownTaskIsNotFound) {
    auto mgr = makeManager();
    EXPECT_THROW(mgr->GetTask("nope"), errors::TaskNotFoundError);
    EXPECT_THROW(mgr->GetMetadata("nope"), errors::TaskNotFoundError);
    EXPECT_THROW(mgr->CancelTask("nope"), errors::TaskNotFoundError);
    EXPECT_THROW(mgr->WaitForResult("nope", 10ms), errors::TaskNotFoundError);
    EXPECT_FALSE(mgr->DeleteTask("nope"));
}

TEST(TaskManager, TerminalStatusNeverChanges) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    mgr->CompleteTask(t.id, textResult("done"));
    EXPECT_EQ(mgr->GetTask(t.id).status, TaskStatus::Completed);

    EXPECT_THROW(mgr->CancelTask(t.id), errors::TaskTerminalError);
    EXPECT_THROW(mgr->FailTask(t.id, errors::makeMcpError(-1, "late")), errors::TaskTerminalError);
    EXPECT_THROW(mgr->CompleteTask(t.id, textResult("again")), errors::TaskTerminalError);
    EXPECT_THROW(mgr->UpdateTaskStatus(t.id, TaskStatus::Working), errors::TaskTerminalError);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(mgr->GetTask(t.id).status, TaskStatus::Completed);
    }
    EXPECT_EQ(GetStringMember(mgr->WaitForResult(t.id, 10ms), "text").value_or(""), "done");
}

TEST(TaskManager, CancelSucceedsOnceThenReportsTerminal) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    std::stop_token token = mgr->GetCancellationToken(t.id);
    EXPECT_FALSE(token.stop_requested());

    TaskMetadata meta = mgr->CancelTask(t.id);
    EXPECT_EQ(meta.status, TaskStatus::Canceled);
    EXPECT_EQ(meta.statusMessage.value_or(""), "Task was canceled");
    EXPECT_TRUE(token.stop_requested());

    EXPECT_THROW(mgr->CancelTask(t.id), errors::TaskTerminalError);
    EXPECT_THROW(mgr->WaitForResult(t.id, 10ms), errors::TaskCanceledError);
}

TEST(TaskManager, InputRequiredRoundTrip) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    auto meta = mgr->UpdateTaskStatus(t.id, TaskStatus::InputRequired, "need a file name");
    EXPECT_EQ(meta.status, TaskStatus::InputRequired);
    EXPECT_EQ(meta.statusMessage.value_or(""), "need a file name");

    EXPECT_THROW(mgr->UpdateTaskStatus(t.id, TaskStatus::Completed), errors::InvalidTaskTransitionError);

    meta = mgr->UpdateTaskStatus(t.id, TaskStatus::Working);
    EXPECT_EQ(meta.statusMessage.value_or(""), "Task is being processed");
    EXPECT_GE(meta.lastUpdatedAt, meta.createdAt);
}

TEST(TaskManager, WaitForResultWakesOnCompletion) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    auto waiter = std::async(std::launch::async, [&] { return mgr->WaitForResult(t.id, 5s); });
    std::this_thread::sleep_for(20ms);
    mgr->CompleteTask(t.id, textResult("value"));
    ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(GetStringMember(waiter.get(), "text").value_or(""), "value");
}

TEST(TaskManager, WaitForResultWithUnboundedTimeout) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    auto waiter = std::async(std::launch::async,
                             [&] { return mgr->WaitForResult(t.id, std::chrono::milliseconds::max()); });
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(waiter.wait_for(0ms), std::future_status::timeout);
    mgr->CompleteTask(t.id, textResult("eventually"));
    ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(GetStringMember(waiter.get(), "text").value_or(""), "eventually");
}

TEST(TaskManager, WaitForResultSurfacesFailure) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    mgr->FailTask(t.id, errors::makeMcpError(JSONRPCErrorCodes::InternalError, "exploded"));
    EXPECT_EQ(mgr->GetTask(t.id).statusMessage, "Task failed: exploded");
    try {
        mgr->WaitForResult(t.id, 10ms);
        FAIL() << "expected TaskFailedError";
    } catch (const errors::TaskFailedError& e) {
        EXPECT_EQ(e.GetError().code, JSONRPCErrorCodes::InternalError);
        EXPECT_EQ(e.GetError().message, "exploded");
    }
}

TEST(TaskManager, WaitForResultTimesOut) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(mgr->WaitForResult(t.id, 30ms), errors::TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 30ms);
    EXPECT_EQ(mgr->GetTask(t.id).status, TaskStatus::Working);
}

TEST(TaskManager, WaiterReleasedWhenTaskDeleted) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("m");
    auto waiter = std::async(std::launch::async, [&] { return mgr->WaitForResult(t.id, 5s); });
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(mgr->DeleteTask(t.id));
    ASSERT_EQ(waiter.wait_for(2s), std::future_status::ready);
    EXPECT_THROW(waiter.get(), errors::TaskNotFoundError);
}

TEST(TaskManager, SweepRemovesExpiredRegardlessOfStatus) {
    TaskManagerOptions opts;
    opts.maxTtl = 24h;
    auto mgr = makeManager(opts);
    Task shortLived = mgr->CreateTask("m", std::nullopt, 20ms);
    Task finished = mgr->CreateTask("m", std::nullopt, 20ms);
    mgr->CompleteTask(finished.id, textResult("x"));
    Task longLived = mgr->CreateTask("m", std::nullopt, 1h);
    std::stop_token token = mgr->GetCancellationToken(shortLived.id);

    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(mgr->SweepExpired(), 2u);
    EXPECT_THROW(mgr->GetTask(shortLived.id), errors::TaskNotFoundError);
    EXPECT_THROW(mgr->GetTask(finished.id), errors::TaskNotFoundError);
    EXPECT_NO_THROW(mgr->GetTask(longLived.id));
    EXPECT_TRUE(token.stop_requested());

    auto page = mgr->ListTasks();
    ASSERT_EQ(page.tasks.size(), 1u);
    EXPECT_EQ(page.tasks[0].taskId, longLived.id);
}

TEST(TaskManager, BackgroundSweeperEvictsWithinOneInterval) {
    TaskManagerOptions opts;
    opts.sweepInterval = 20ms;
    auto mgr = makeManager(opts);
    mgr->Start();
    mgr->Start();
    Task t = mgr->CreateTask("m", std::nullopt, 30ms);

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (mgr->GetTaskCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(mgr->GetTaskCount(), 0u);
    EXPECT_THROW(mgr->GetTask(t.id), errors::TaskNotFoundError);
    mgr->Shutdown();
}

TEST(TaskManager, ShutdownCancelsAllAndReleasesAllWaiters) {
    auto mgr = makeManager();
    mgr->Start();
    constexpr int kTasks = 6;
    constexpr int kWaitersPerTask = 3;
    std::vector<std::string> ids;
    for (int i = 0; i < kTasks; ++i) {
        ids.push_back(mgr->CreateTask("m").id);
    }
    Task done = mgr->CreateTask("m");
    mgr->CompleteTask(done.id, textResult("kept"));

    std::atomic<int> canceled{0};
    std::vector<std::thread> waiters;
    for (const auto& id : ids) {
        for (int w = 0; w < kWaitersPerTask; ++w) {
            waiters.emplace_back([&, id]() {
                try {
                    mgr->WaitForResult(id, 30s);
                } catch (const errors::TaskManagerShutdownError&) {
                    ++canceled;
                }
            });
        }
    }
    std::this_thread::sleep_for(50ms);
    const auto start = std::chrono::steady_clock::now();
    mgr->Shutdown();
    for (auto& w : waiters) {
        w.join();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_EQ(canceled.load(), kTasks * kWaitersPerTask);

    for (const auto& id : ids) {
        Task t = mgr->GetTask(id);
        EXPECT_EQ(t.status, TaskStatus::Canceled);
        EXPECT_EQ(t.statusMessage, "Task canceled: task manager shutting down");
        EXPECT_TRUE(t.cancellation.stop_requested());
    }
    EXPECT_EQ(mgr->GetTask(done.id).status, TaskStatus::Completed);
    EXPECT_TRUE(mgr->IsShuttingDown());
    EXPECT_THROW(mgr->CreateTask("m"), errors::TaskManagerShutdownError);
    EXPECT_NO_THROW(mgr->Shutdown());
}

TEST(TaskManager, ListTasksPagesInCreationOrder) {
    auto mgr = makeManager();
    std::vector<std::string> ids;
    for (int i = 0; i < 7; ++i) {
        ids.push_back(mgr->CreateTask("m").id);
        std::this_thread::sleep_for(2ms);
    }
    std::vector<std::string> seen;
    std::optional<std::string> cursor;
    int pages = 0;
    do {
        TaskPage page = mgr->ListTasks(cursor, 3);
        for (const auto& m : page.tasks) seen.push_back(m.taskId);
        cursor = page.nextCursor;
        ++pages;
    } while (cursor.has_value() && pages < 10);
    EXPECT_EQ(pages, 3);
    EXPECT_EQ(seen, ids);

    EXPECT_TRUE(mgr->ListTasks(std::string("100")).tasks.empty());
    EXPECT_THROW(mgr->ListTasks(std::string("abc")), std::invalid_argument);
    EXPECT_THROW(mgr->ListTasks(std::string("-1")), std::invalid_argument);
}

TEST(TaskManager, StatsCountEachStatus) {
    auto mgr = makeManager();
    Task a = mgr->CreateTask("m");
    Task b = mgr->CreateTask("m");
    Task c = mgr->CreateTask("m");
    Task d = mgr->CreateTask("m");
    mgr->CreateTask("m");
    mgr->CompleteTask(a.id, textResult("a"));
    mgr->FailTask(b.id, errors::makeMcpError(-1, "b"));
    mgr->CancelTask(c.id);
    mgr->UpdateTaskStatus(d.id, TaskStatus::InputRequired);

    TaskStats s = mgr->GetTaskStats();
    EXPECT_EQ(s.total, 5u);
    EXPECT_EQ(s.completed, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.canceled, 1u);
    EXPECT_EQ(s.inputRequired, 1u);
    EXPECT_EQ(s.working, 1u);
}

TEST(TaskMetadata, JsonCarriesWireFields) {
    auto mgr = makeManager();
    Task t = mgr->CreateTask("tools/call", std::nullopt, 60000ms);
    TaskMetadata meta = mgr->GetMetadata(t.id);
    JSONValue json = TaskMetadataToJSON(meta);

    EXPECT_EQ(GetStringMember(json, "taskId").value_or(""), t.id);
    EXPECT_EQ(GetStringMember(json, "status").value_or(""), "working");
    EXPECT_EQ(GetIntMember(json, "ttl").value_or(0), 60000);
    EXPECT_EQ(GetIntMember(json, "pollInterval").value_or(0), 5000);
    const std::string created = GetStringMember(json, "createdAt").value_or("");
    ASSERT_EQ(created.size(), 20u);
    EXPECT_EQ(created.back(), 'Z');

    TaskMetadata back = TaskMetadataFromJSON(json);
    EXPECT_EQ(back.taskId, meta.taskId);
    EXPECT_EQ(back.status, meta.status);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(back.createdAt.time_since_epoch()),
              std::chrono::duration_cast<std::chrono::seconds>(meta.createdAt.time_since_epoch()));

    JSONValue::Object bad;
    bad["taskId"] = std::make_shared<JSONValue>("x");
    bad["status"] = std::make_shared<JSONValue>("finished");
    EXPECT_THROW(TaskMetadataFromJSON(JSONValue{bad}), std::invalid_argument);
}

TEST(TaskMetadata, OutOfRangeDurationsDecodeAsZero) {
    JSONValue doc = ParseJSON(
        R"({"taskId":"t1","status":"working","ttl":1e300,"pollInterval":-1e300})");
    TaskMetadata meta = TaskMetadataFromJSON(doc);
    EXPECT_EQ(meta.taskId, "t1");
    EXPECT_EQ(meta.ttl, 0ms);
    EXPECT_EQ(meta.pollInterval, 0ms);
}

TEST(TaskMetadata, Rfc3339Parsing) {
    auto tp = ParseRFC3339("2024-05-01T12:30:45Z");
    ASSERT_TRUE(tp.has_value());
    EXPECT_EQ(FormatRFC3339(tp.value()), "2024-05-01T12:30:45Z");
    auto frac = ParseRFC3339("2024-05-01T12:30:45.123Z");
    ASSERT_TRUE(frac.has_value());
    EXPECT_EQ(frac.value(), tp.value());
    EXPECT_FALSE(ParseRFC3339("2024-05-01T12:30:45+02:00").has_value());
    EXPECT_FALSE(ParseRFC3339("yesterday").has_value());
}
