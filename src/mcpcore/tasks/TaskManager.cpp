//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskManager.cpp
// Purpose: Lifecycle, blocking waits, cancellation and TTL expiry for asynchronous tasks
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>
#include <openssl/rand.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpcore/Deadline.h"
#include "mcpcore/tasks/TaskManager.h"

namespace mcpcore {
namespace tasks {

namespace {
constexpr const char* kWorkingMessage = "Task is being processed";
constexpr const char* kCompletedMessage = "Task completed successfully";
constexpr const char* kCanceledMessage = "Task was canceled";
constexpr const char* kShutdownMessage = "Task canceled: task manager shutting down";

// 128 random bits rendered as a version-4 UUID.
std::string generateTaskId() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("TaskManager: RAND_bytes failed");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out += fmt::format("{:02x}", bytes[i]);
    }
    return out;
}
} // namespace

TaskManagerOptions TaskManagerOptions::FromEnvironment() {
    TaskManagerOptions opts;
    opts.defaultTtl = GetEnvMillisOrDefault("MCPCORE_TASK_DEFAULT_TTL_MS", opts.defaultTtl);
    opts.maxTtl = GetEnvMillisOrDefault("MCPCORE_TASK_MAX_TTL_MS", opts.maxTtl);
    opts.pollInterval = GetEnvMillisOrDefault("MCPCORE_TASK_POLL_INTERVAL_MS", opts.pollInterval);
    opts.sweepInterval = GetEnvMillisOrDefault("MCPCORE_TASK_SWEEP_INTERVAL_MS", opts.sweepInterval);
    return opts;
}

class TaskManager::Impl {
public:
    TaskManagerOptions options;
    std::shared_ptr<Logger> logger;
    mutable std::mutex mutex;
    std::condition_variable stateChanged; // any transition, removal or shutdown
    std::unordered_map<std::string, Task> tasks;
    std::atomic<bool> shuttingDown{false};

    std::mutex sweeperMutex;
    std::condition_variable_any sweeperWake;
    std::jthread sweeper;

    Impl(TaskManagerOptions opts, std::shared_ptr<Logger> log)
        : options(std::move(opts)), logger(std::move(log)) {}

    // Caller holds mutex.
    Task& require(const std::string& taskId) {
        auto it = tasks.find(taskId);
        if (it == tasks.end()) {
            throw errors::TaskNotFoundError(taskId);
        }
        return it->second;
    }

    const Task& require(const std::string& taskId) const {
        auto it = tasks.find(taskId);
        if (it == tasks.end()) {
            throw errors::TaskNotFoundError(taskId);
        }
        return it->second;
    }

    TaskMetadata metadataOf(const Task& task) const {
        TaskMetadata meta;
        meta.taskId = task.id;
        meta.status = task.status;
        if (!task.statusMessage.empty()) {
            meta.statusMessage = task.statusMessage;
        }
        meta.createdAt = task.createdAt;
        meta.lastUpdatedAt = task.lastUpdatedAt;
        meta.ttl = task.ttl;
        meta.pollInterval = options.pollInterval;
        return meta;
    }

    // Caller holds mutex.
    void transition(Task& task, TaskStatus to, std::string message) {
        if (task.IsTerminal()) {
            throw errors::TaskTerminalError(fmt::format("task {} is already in terminal state {}",
                                                        task.id, TaskStatusName(task.status)));
        }
        if (!IsValidTransition(task.status, to)) {
            throw errors::InvalidTaskTransitionError(fmt::format("task {}: invalid transition {} -> {}",
                                                                 task.id, TaskStatusName(task.status),
                                                                 TaskStatusName(to)));
        }
        task.status = to;
        task.statusMessage = std::move(message);
        task.lastUpdatedAt = Clock::now();
        if (to == TaskStatus::Canceled) {
            task.cancellation.request_stop();
        }
    }

    void sweepLoop(std::stop_token stop) {
        while (!stop.stop_requested()) {
            {
                std::unique_lock<std::mutex> lock(sweeperMutex);
                sweeperWake.wait_for(lock, stop, options.sweepInterval, [] { return false; });
            }
            if (stop.stop_requested()) {
                break;
            }
            std::size_t removed = sweep();
            if (removed > 0) {
                LOG_DEBUG(logger, "TaskManager: sweep removed {} expired task(s)", removed);
            }
        }
    }

    std::size_t sweep() {
        std::size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            const auto now = Clock::now();
            for (auto it = tasks.begin(); it != tasks.end();) {
                if (it->second.expiresAt <= now) {
                    it->second.cancellation.request_stop();
                    it = tasks.erase(it);
                    ++removed;
                } else {
                    ++it;
                }
            }
        }
        if (removed > 0) {
            stateChanged.notify_all();
        }
        return removed;
    }
};

TaskManager::TaskManager(TaskManagerOptions options, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(logger))) {}

TaskManager::~TaskManager() {
    Shutdown();
}

void TaskManager::Start() {
    std::lock_guard<std::mutex> lock(pImpl->sweeperMutex);
    if (pImpl->sweeper.joinable() || pImpl->shuttingDown.load()) {
        return;
    }
    Impl* impl = pImpl.get();
    pImpl->sweeper = std::jthread([impl](std::stop_token stop) { impl->sweepLoop(stop); });
    LOG_DEBUG(pImpl->logger, "TaskManager: sweeper started (interval {} ms)", pImpl->options.sweepInterval.count());
}

void TaskManager::Shutdown() {
    if (pImpl->shuttingDown.exchange(true)) {
        return;
    }
    std::jthread sweeper;
    {
        std::lock_guard<std::mutex> lock(pImpl->sweeperMutex);
        sweeper = std::move(pImpl->sweeper);
    }
    if (sweeper.joinable()) {
        sweeper.request_stop();
        sweeper.join();
    }
    std::size_t canceled = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        const auto now = Clock::now();
        for (auto& [id, task] : pImpl->tasks) {
            if (!task.IsTerminal()) {
                task.status = TaskStatus::Canceled;
                task.statusMessage = kShutdownMessage;
                task.lastUpdatedAt = now;
                task.cancellation.request_stop();
                ++canceled;
            }
        }
    }
    pImpl->stateChanged.notify_all();
    LOG_INFO(pImpl->logger, "TaskManager: shut down, {} task(s) canceled", canceled);
}

bool TaskManager::IsShuttingDown() const {
    return pImpl->shuttingDown.load();
}

Task TaskManager::CreateTask(const std::string& method,
                             const std::optional<JSONValue>& params,
                             std::optional<std::chrono::milliseconds> requestedTtl) {
    if (pImpl->shuttingDown.load()) {
        throw errors::TaskManagerShutdownError();
    }
    std::chrono::milliseconds ttl = pImpl->options.defaultTtl;
    if (requestedTtl.has_value() && requestedTtl->count() > 0) {
        ttl = std::min(requestedTtl.value(), pImpl->options.maxTtl);
    }

    Task task;
    task.id = generateTaskId();
    task.method = method;
    task.params = params;
    task.status = TaskStatus::Working;
    task.statusMessage = kWorkingMessage;
    task.createdAt = Clock::now();
    task.lastUpdatedAt = task.createdAt;
    task.ttl = ttl;
    task.expiresAt = task.createdAt + ttl;

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->shuttingDown.load()) {
            throw errors::TaskManagerShutdownError();
        }
        pImpl->tasks.emplace(task.id, task);
    }
    LOG_DEBUG(pImpl->logger, "TaskManager: created task {} for {} (ttl {} ms)", task.id, method, ttl.count());
    return task;
}

Task TaskManager::GetTask(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->require(taskId);
}

TaskMetadata TaskManager::GetMetadata(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->metadataOf(pImpl->require(taskId));
}

JSONValue TaskManager::WaitForResult(const std::string& taskId, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    const auto deadline = DeadlineAfter(timeout);
    while (true) {
        auto it = pImpl->tasks.find(taskId);
        if (it == pImpl->tasks.end()) {
            throw errors::TaskNotFoundError(taskId);
        }
        const Task& task = it->second;
        if (task.IsTerminal()) {
            if (task.status == TaskStatus::Completed) {
                return task.result.value_or(JSONValue{});
            }
            if (task.status == TaskStatus::Failed) {
                throw errors::TaskFailedError(task.error.value_or(
                    errors::makeMcpError(JSONRPCErrorCodes::InternalError, "task failed")));
            }
            if (pImpl->shuttingDown.load()) {
                throw errors::TaskManagerShutdownError();
            }
            throw errors::TaskCanceledError(task.statusMessage.empty() ? kCanceledMessage : task.statusMessage);
        }
        if (pImpl->shuttingDown.load()) {
            throw errors::TaskManagerShutdownError();
        }
        if (pImpl->stateChanged.wait_until(lock, deadline) == std::cv_status::timeout) {
            // A transition may have landed together with the timeout; the loop re-checks once more.
            auto again = pImpl->tasks.find(taskId);
            if (again != pImpl->tasks.end() && !again->second.IsTerminal() && !pImpl->shuttingDown.load()) {
                throw errors::TimeoutError("timeout waiting for task result");
            }
        }
    }
}

TaskMetadata TaskManager::CancelTask(const std::string& taskId) {
    TaskMetadata meta;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        Task& task = pImpl->require(taskId);
        pImpl->transition(task, TaskStatus::Canceled, kCanceledMessage);
        meta = pImpl->metadataOf(task);
    }
    pImpl->stateChanged.notify_all();
    LOG_DEBUG(pImpl->logger, "TaskManager: canceled task {}", taskId);
    return meta;
}

TaskPage TaskManager::ListTasks(const std::optional<std::string>& cursor, std::size_t limit) const {
    std::size_t offset = 0;
    if (cursor.has_value() && !cursor->empty()) {
        const std::string& c = cursor.value();
        if (!std::all_of(c.begin(), c.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
            throw std::invalid_argument("invalid cursor '" + c + "'");
        }
        try {
            offset = static_cast<std::size_t>(std::stoull(c));
        } catch (const std::out_of_range&) {
            throw std::invalid_argument("invalid cursor '" + c + "'");
        }
    }
    if (limit == 0) {
        limit = pImpl->options.defaultPageSize;
    }

    std::vector<TaskMetadata> all;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        all.reserve(pImpl->tasks.size());
        for (const auto& [id, task] : pImpl->tasks) {
            all.push_back(pImpl->metadataOf(task));
        }
    }
    std::sort(all.begin(), all.end(), [](const TaskMetadata& a, const TaskMetadata& b) {
        if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
        return a.taskId < b.taskId;
    });

    TaskPage page;
    if (offset >= all.size()) {
        return page;
    }
    const std::size_t end = std::min(all.size(), offset + limit);
    page.tasks.assign(all.begin() + static_cast<std::ptrdiff_t>(offset), all.begin() + static_cast<std::ptrdiff_t>(end));
    if (end < all.size()) {
        page.nextCursor = std::to_string(end);
    }
    return page;
}

bool TaskManager::DeleteTask(const std::string& taskId) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        removed = pImpl->tasks.erase(taskId) > 0;
    }
    if (removed) {
        pImpl->stateChanged.notify_all();
    }
    return removed;
}

void TaskManager::CompleteTask(const std::string& taskId, JSONValue result) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        Task& task = pImpl->require(taskId);
        pImpl->transition(task, TaskStatus::Completed, kCompletedMessage);
        task.result = std::move(result);
    }
    pImpl->stateChanged.notify_all();
}

void TaskManager::FailTask(const std::string& taskId, errors::McpError error) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        Task& task = pImpl->require(taskId);
        std::string message = "Task failed: " + error.message;
        pImpl->transition(task, TaskStatus::Failed, std::move(message));
        task.error = std::move(error);
    }
    pImpl->stateChanged.notify_all();
}

TaskMetadata TaskManager::UpdateTaskStatus(const std::string& taskId, TaskStatus status,
                                           std::optional<std::string> statusMessage) {
    TaskMetadata meta;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        Task& task = pImpl->require(taskId);
        std::string message = statusMessage.value_or(status == TaskStatus::Working ? kWorkingMessage : "");
        pImpl->transition(task, status, std::move(message));
        meta = pImpl->metadataOf(task);
    }
    pImpl->stateChanged.notify_all();
    return meta;
}

std::stop_token TaskManager::GetCancellationToken(const std::string& taskId) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->require(taskId).cancellation.get_token();
}

std::size_t TaskManager::SweepExpired() {
    return pImpl->sweep();
}

std::size_t TaskManager::GetTaskCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->tasks.size();
}

TaskStats TaskManager::GetTaskStats() const {
    TaskStats stats;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    stats.total = pImpl->tasks.size();
    for (const auto& [id, task] : pImpl->tasks) {
        switch (task.status) {
            case TaskStatus::Working: ++stats.working; break;
            case TaskStatus::InputRequired: ++stats.inputRequired; break;
            case TaskStatus::Completed: ++stats.completed; break;
            case TaskStatus::Failed: ++stats.failed; break;
            case TaskStatus::Canceled: ++stats.canceled; break;
        }
    }
    return stats;
}

const TaskManagerOptions& TaskManager::GetOptions() const {
    return pImpl->options;
}

} // namespace tasks
} // namespace mcpcore
