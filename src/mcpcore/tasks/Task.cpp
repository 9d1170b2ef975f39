//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.cpp
// Purpose: Task status state machine, RFC 3339 timestamps and metadata JSON mapping
//==========================================================================================================

#include <ctime>
#include <stdexcept>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "mcpcore/tasks/Task.h"

namespace mcpcore {
namespace tasks {

const char* TaskStatusName(TaskStatus status) {
    switch (status) {
        case TaskStatus::Working: return "working";
        case TaskStatus::InputRequired: return "input_required";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Canceled: return "canceled";
    }
    return "unknown";
}

std::optional<TaskStatus> TaskStatusFromString(const std::string& name) {
    if (name == "working") return TaskStatus::Working;
    if (name == "input_required") return TaskStatus::InputRequired;
    if (name == "completed") return TaskStatus::Completed;
    if (name == "failed") return TaskStatus::Failed;
    if (name == "canceled") return TaskStatus::Canceled;
    return std::nullopt;
}

bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Canceled;
}

bool IsValidTransition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::Working:
            return to == TaskStatus::InputRequired || to == TaskStatus::Completed ||
                   to == TaskStatus::Failed || to == TaskStatus::Canceled;
        case TaskStatus::InputRequired:
            return to == TaskStatus::Working || to == TaskStatus::Canceled;
        default:
            return false;
    }
}

std::string FormatRFC3339(Clock::time_point tp) {
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(Clock::to_time_t(tp)));
}

std::optional<Clock::time_point> ParseRFC3339(const std::string& text) {
    std::tm tm{};
    const char* end = ::strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (end == nullptr) {
        return std::nullopt;
    }
    // Fractional seconds are dropped; only the UTC designator is accepted.
    if (*end == '.') {
        ++end;
        while (*end >= '0' && *end <= '9') ++end;
    }
    if (*end != 'Z' && *end != 'z') {
        return std::nullopt;
    }
    return Clock::from_time_t(::timegm(&tm));
}

JSONValue TaskMetadataToJSON(const TaskMetadata& meta) {
    JSONValue::Object obj;
    obj["taskId"] = std::make_shared<JSONValue>(meta.taskId);
    obj["status"] = std::make_shared<JSONValue>(TaskStatusName(meta.status));
    if (meta.statusMessage.has_value()) {
        obj["statusMessage"] = std::make_shared<JSONValue>(meta.statusMessage.value());
    }
    obj["createdAt"] = std::make_shared<JSONValue>(FormatRFC3339(meta.createdAt));
    obj["lastUpdatedAt"] = std::make_shared<JSONValue>(FormatRFC3339(meta.lastUpdatedAt));
    obj["ttl"] = std::make_shared<JSONValue>(static_cast<int64_t>(meta.ttl.count()));
    obj["pollInterval"] = std::make_shared<JSONValue>(static_cast<int64_t>(meta.pollInterval.count()));
    return JSONValue{obj};
}

TaskMetadata TaskMetadataFromJSON(const JSONValue& value) {
    auto taskId = GetStringMember(value, "taskId");
    if (!taskId.has_value()) {
        throw std::invalid_argument("task metadata requires a string taskId");
    }
    auto statusName = GetStringMember(value, "status");
    if (!statusName.has_value()) {
        throw std::invalid_argument("task metadata requires a string status");
    }
    auto status = TaskStatusFromString(statusName.value());
    if (!status.has_value()) {
        throw std::invalid_argument("unknown task status '" + statusName.value() + "'");
    }
    TaskMetadata meta;
    meta.taskId = taskId.value();
    meta.status = status.value();
    meta.statusMessage = GetStringMember(value, "statusMessage");
    if (auto created = GetStringMember(value, "createdAt")) {
        meta.createdAt = ParseRFC3339(created.value()).value_or(Clock::time_point{});
    }
    if (auto updated = GetStringMember(value, "lastUpdatedAt")) {
        meta.lastUpdatedAt = ParseRFC3339(updated.value()).value_or(Clock::time_point{});
    }
    meta.ttl = std::chrono::milliseconds(GetIntMember(value, "ttl").value_or(0));
    meta.pollInterval = std::chrono::milliseconds(GetIntMember(value, "pollInterval").value_or(0));
    return meta;
}

JSONValue TaskPageToJSON(const TaskPage& page) {
    JSONValue::Array arr;
    arr.reserve(page.tasks.size());
    for (const auto& meta : page.tasks) {
        arr.push_back(std::make_shared<JSONValue>(TaskMetadataToJSON(meta)));
    }
    JSONValue::Object obj;
    obj["tasks"] = std::make_shared<JSONValue>(arr);
    if (page.nextCursor.has_value()) {
        obj["nextCursor"] = std::make_shared<JSONValue>(page.nextCursor.value());
    }
    return JSONValue{obj};
}

TaskPage TaskPageFromJSON(const JSONValue& value) {
    TaskPage page;
    if (const JSONValue* arr = FindMember(value, "tasks")) {
        if (arr->isArray()) {
            for (const auto& item : std::get<JSONValue::Array>(arr->get())) {
                if (item) {
                    page.tasks.push_back(TaskMetadataFromJSON(*item));
                }
            }
        }
    }
    page.nextCursor = GetStringMember(value, "nextCursor");
    return page;
}

} // namespace tasks
} // namespace mcpcore
