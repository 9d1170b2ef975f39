//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Task record, status state machine and task metadata wire mapping
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpcore/JSONRPCTypes.h"
#include "mcpcore/errors/Errors.h"

namespace mcpcore {
namespace tasks {

using Clock = std::chrono::system_clock;

//==========================================================================================================
// TaskStatus
// Transitions:
//   Working       -> InputRequired | Completed | Failed | Canceled
//   InputRequired -> Working | Canceled
//   Completed, Failed and Canceled are terminal.
//==========================================================================================================
enum class TaskStatus {
    Working,
    InputRequired,
    Completed,
    Failed,
    Canceled
};

// Wire names: working, input_required, completed, failed, canceled.
const char* TaskStatusName(TaskStatus status);
std::optional<TaskStatus> TaskStatusFromString(const std::string& name);

bool IsTerminal(TaskStatus status);
bool IsValidTransition(TaskStatus from, TaskStatus to);

//==========================================================================================================
// Task
// Purpose: One asynchronous operation tracked by TaskManager.
// Notes:
//   TaskManager owns every Task; callers receive copies. The copied stop_source shares its stop state
//   with the managed record, so an executor holding a copy still observes cancellation.
//==========================================================================================================
struct Task {
    std::string id;
    std::string method;
    std::optional<JSONValue> params;
    TaskStatus status{TaskStatus::Working};
    std::string statusMessage;
    Clock::time_point createdAt;
    Clock::time_point lastUpdatedAt;
    Clock::time_point expiresAt;
    std::chrono::milliseconds ttl{0};
    std::stop_source cancellation;
    std::optional<JSONValue> result;
    std::optional<errors::McpError> error;

    bool IsTerminal() const { return tasks::IsTerminal(status); }
};

struct TaskMetadata {
    std::string taskId;
    TaskStatus status{TaskStatus::Working};
    std::optional<std::string> statusMessage;
    Clock::time_point createdAt;
    Clock::time_point lastUpdatedAt;
    std::chrono::milliseconds ttl{0};
    std::chrono::milliseconds pollInterval{0};
};

struct TaskPage {
    std::vector<TaskMetadata> tasks;
    std::optional<std::string> nextCursor;
};

struct TaskStats {
    std::size_t total{0};
    std::size_t working{0};
    std::size_t inputRequired{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t canceled{0};
};

////////////////////////////////////////// Time formatting //////////////////////////////////////////
// RFC 3339 UTC with second precision, e.g. 2025-01-31T12:00:00Z.
std::string FormatRFC3339(Clock::time_point tp);
std::optional<Clock::time_point> ParseRFC3339(const std::string& text);

////////////////////////////////////////// Wire mapping //////////////////////////////////////////
//==========================================================================================================
// TaskMetadataToJSON
// Purpose: { taskId, status, statusMessage?, createdAt, lastUpdatedAt, ttl, pollInterval }.
//          ttl and pollInterval are milliseconds.
//==========================================================================================================
JSONValue TaskMetadataToJSON(const TaskMetadata& meta);

// Throws std::invalid_argument when taskId or status is missing or status is unknown.
TaskMetadata TaskMetadataFromJSON(const JSONValue& value);

// { tasks: [...], nextCursor? }
JSONValue TaskPageToJSON(const TaskPage& page);
TaskPage TaskPageFromJSON(const JSONValue& value);

} // namespace tasks
} // namespace mcpcore
