//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskManager.h
// Purpose: Lifecycle, blocking waits, cancellation and TTL expiry for asynchronous tasks
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "mcpcore/JSONRPCTypes.h"
#include "mcpcore/errors/Errors.h"
#include "mcpcore/tasks/Task.h"

class Logger;

namespace mcpcore {
namespace tasks {

//==========================================================================================================
// TaskManagerOptions
// Fields:
//   defaultTtl: TTL for tasks created without one.
//   maxTtl: Upper clamp for requested TTLs.
//   pollInterval: Suggested client poll pacing, reported in metadata.
//   sweepInterval: Period of the background expiry sweep.
//   defaultPageSize: ListTasks page size when no limit is given.
//==========================================================================================================
struct TaskManagerOptions {
    std::chrono::milliseconds defaultTtl{std::chrono::hours(1)};
    std::chrono::milliseconds maxTtl{std::chrono::hours(24)};
    std::chrono::milliseconds pollInterval{5000};
    std::chrono::milliseconds sweepInterval{std::chrono::minutes(1)};
    std::size_t defaultPageSize{50};

    // Defaults overridden by MCPCORE_TASK_DEFAULT_TTL_MS, MCPCORE_TASK_MAX_TTL_MS,
    // MCPCORE_TASK_POLL_INTERVAL_MS and MCPCORE_TASK_SWEEP_INTERVAL_MS.
    static TaskManagerOptions FromEnvironment();
};

//==========================================================================================================
// TaskManager
// Purpose: Owns every task record. All state transitions happen under one lock, so observers never see
//          conflicting status for a task.
// Notes:
//   - Start() launches the expiry sweeper; Shutdown() stops and joins it, then forces every non-terminal
//     task to canceled and wakes every waiter. The destructor calls Shutdown().
//   - Cancellation is advisory: it signals the task's stop token and updates bookkeeping only.
//==========================================================================================================
class TaskManager {
public:
    TaskManager(TaskManagerOptions options, std::shared_ptr<Logger> logger);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Launches the background sweeper. Idempotent.
    void Start();

    // Broadcast cancellation and sweeper join. Idempotent.
    void Shutdown();

    bool IsShuttingDown() const;

    //==========================================================================================================
    // CreateTask
    // Args:
    //   method: Originating method name.
    //   params: Originating params, kept for the executor.
    //   requestedTtl: Clamped to maxTtl; defaultTtl when absent or not positive.
    // Returns:
    //   Copy of the new task, status working.
    // Throws:
    //   errors::TaskManagerShutdownError after Shutdown().
    //==========================================================================================================
    Task CreateTask(const std::string& method,
                    const std::optional<JSONValue>& params = std::nullopt,
                    std::optional<std::chrono::milliseconds> requestedTtl = std::nullopt);

    // Throws errors::TaskNotFoundError.
    Task GetTask(const std::string& taskId) const;
    TaskMetadata GetMetadata(const std::string& taskId) const;

    //==========================================================================================================
    // WaitForResult
    // Purpose: Blocks until the task is terminal, timeout elapses or the manager shuts down.
    // Returns:
    //   The result of a completed task.
    // Throws:
    //   errors::TaskFailedError for a failed task (carries the stored error).
    //   errors::TaskCanceledError for a canceled task; errors::TaskManagerShutdownError when the manager
    //   is shutting down.
    //   errors::TimeoutError("timeout waiting for task result").
    //   errors::TaskNotFoundError when the task is unknown or removed while waiting.
    //==========================================================================================================
    JSONValue WaitForResult(const std::string& taskId, std::chrono::milliseconds timeout);

    //==========================================================================================================
    // CancelTask
    // Purpose: Signals the task's stop token and transitions it to canceled.
    // Returns:
    //   Updated metadata.
    // Throws:
    //   errors::TaskTerminalError when the task already reached a terminal status.
    //   errors::TaskNotFoundError.
    //==========================================================================================================
    TaskMetadata CancelTask(const std::string& taskId);

    //==========================================================================================================
    // ListTasks
    // Args:
    //   cursor: Decimal offset from a previous page's nextCursor; absent for the first page.
    //   limit: Page size; 0 selects defaultPageSize.
    // Notes:
    //   Tasks are ordered by creation time, then id. Removal between pages may shift a boundary.
    // Throws:
    //   std::invalid_argument for a malformed cursor.
    //==========================================================================================================
    TaskPage ListTasks(const std::optional<std::string>& cursor = std::nullopt, std::size_t limit = 0) const;

    // Unconditional removal. Returns false when the task was not present.
    bool DeleteTask(const std::string& taskId);

    ////////////////////////////////////////// Producer side //////////////////////////////////////////
    // Store the result and transition to completed. Throws errors::TaskTerminalError / TaskNotFoundError.
    void CompleteTask(const std::string& taskId, JSONValue result);

    // Store the error and transition to failed. Throws errors::TaskTerminalError / TaskNotFoundError.
    void FailTask(const std::string& taskId, errors::McpError error);

    //==========================================================================================================
    // UpdateTaskStatus
    // Purpose: Moves a task along the state machine (e.g. working <-> input_required).
    // Throws:
    //   errors::InvalidTaskTransitionError for a transition the state machine forbids.
    //   errors::TaskNotFoundError.
    //==========================================================================================================
    TaskMetadata UpdateTaskStatus(const std::string& taskId, TaskStatus status,
                                  std::optional<std::string> statusMessage = std::nullopt);

    // Token the executor polls or registers a stop_callback on.
    std::stop_token GetCancellationToken(const std::string& taskId) const;

    ////////////////////////////////////////// Maintenance //////////////////////////////////////////
    // Removes every task whose expiry has passed, regardless of status. Returns the number removed.
    std::size_t SweepExpired();

    std::size_t GetTaskCount() const;
    TaskStats GetTaskStats() const;
    const TaskManagerOptions& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace tasks
} // namespace mcpcore
