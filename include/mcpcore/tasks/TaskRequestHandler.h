//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskRequestHandler.h
// Purpose: Serves inbound tasks/get, tasks/result, tasks/list and tasks/cancel requests from a TaskManager
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "mcpcore/JSONRPCTypes.h"
#include "mcpcore/tasks/TaskManager.h"

class Logger;

namespace mcpcore {
namespace tasks {

//==========================================================================================================
// TaskRequestHandler
// Purpose: Maps tasks/* requests onto TaskManager calls and builds the reply.
// Errors:
//   InvalidParams     missing or non-string taskId, malformed cursor
//   InvalidRequestId  unknown task
//   InvalidRequest    cancel of a terminal task
//   stored error      tasks/result on a failed task
//   InternalError     tasks/result on a canceled task, or when the wait times out
//   MethodNotFound    any other method
//==========================================================================================================
class TaskRequestHandler {
public:
    TaskRequestHandler(std::shared_ptr<TaskManager> manager, std::shared_ptr<Logger> logger,
                       std::chrono::milliseconds resultWaitTimeout = std::chrono::minutes(5));

    static bool Handles(const std::string& method);

    // Always returns a response or error response echoing request.id.
    JSONRPCMessage Handle(const JSONRPCMessage& request) const;

private:
    JSONRPCMessage handleGet(const JSONRPCMessage& request, const std::string& taskId) const;
    JSONRPCMessage handleResult(const JSONRPCMessage& request, const std::string& taskId) const;
    JSONRPCMessage handleList(const JSONRPCMessage& request) const;
    JSONRPCMessage handleCancel(const JSONRPCMessage& request, const std::string& taskId) const;

    std::shared_ptr<TaskManager> manager;
    std::shared_ptr<Logger> logger;
    std::chrono::milliseconds resultWaitTimeout;
};

} // namespace tasks
} // namespace mcpcore
