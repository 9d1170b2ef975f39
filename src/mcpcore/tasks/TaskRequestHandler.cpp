//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TaskRequestHandler.cpp
// Purpose: Serves inbound tasks/* requests from a TaskManager
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcpcore/Protocol.h"
#include "mcpcore/errors/Errors.h"
#include "mcpcore/tasks/TaskRequestHandler.h"

namespace mcpcore {
namespace tasks {

namespace {
JSONRPCMessage errorReply(const JSONRPCMessage& request, int code, const std::string& message) {
    return errors::makeErrorResponse(request.id, errors::makeMcpError(code, message));
}

std::optional<std::string> taskIdParam(const JSONRPCMessage& request) {
    if (!request.params.has_value()) {
        return std::nullopt;
    }
    return GetStringMember(request.params.value(), "taskId");
}
} // namespace

TaskRequestHandler::TaskRequestHandler(std::shared_ptr<TaskManager> manager, std::shared_ptr<Logger> logger,
                                       std::chrono::milliseconds resultWaitTimeout)
    : manager(std::move(manager)), logger(std::move(logger)), resultWaitTimeout(resultWaitTimeout) {
    if (!this->manager) {
        throw std::invalid_argument("TaskRequestHandler requires a TaskManager");
    }
}

bool TaskRequestHandler::Handles(const std::string& method) {
    return method == Methods::TasksGet || method == Methods::TasksResult ||
           method == Methods::TasksList || method == Methods::TasksCancel;
}

JSONRPCMessage TaskRequestHandler::Handle(const JSONRPCMessage& request) const {
    const std::string method = request.method.value_or("");
    if (!Handles(method)) {
        return errorReply(request, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method);
    }
    if (method == Methods::TasksList) {
        return handleList(request);
    }
    auto taskId = taskIdParam(request);
    if (!taskId.has_value()) {
        return errorReply(request, JSONRPCErrorCodes::InvalidParams, "Missing required parameter: taskId");
    }
    try {
        if (method == Methods::TasksGet) {
            return handleGet(request, taskId.value());
        }
        if (method == Methods::TasksResult) {
            return handleResult(request, taskId.value());
        }
        return handleCancel(request, taskId.value());
    } catch (const errors::TaskNotFoundError& e) {
        LOG_DEBUG(logger, "TaskRequestHandler: {} for unknown task {}", method, e.TaskId());
        return errorReply(request, JSONRPCErrorCodes::InvalidRequestId, e.what());
    }
}

JSONRPCMessage TaskRequestHandler::handleGet(const JSONRPCMessage& request, const std::string& taskId) const {
    return JSONRPCMessage::MakeResponse(request.id, TaskMetadataToJSON(manager->GetMetadata(taskId)));
}

JSONRPCMessage TaskRequestHandler::handleResult(const JSONRPCMessage& request, const std::string& taskId) const {
    try {
        return JSONRPCMessage::MakeResponse(request.id, manager->WaitForResult(taskId, resultWaitTimeout));
    } catch (const errors::TaskFailedError& e) {
        return errors::makeErrorResponse(request.id, e.GetError());
    } catch (const errors::TaskCanceledError& e) {
        return errorReply(request, JSONRPCErrorCodes::InternalError, e.what());
    } catch (const errors::TimeoutError& e) {
        LOG_WARN(logger, "TaskRequestHandler: tasks/result for {} gave up after {} ms", taskId, resultWaitTimeout.count());
        return errorReply(request, JSONRPCErrorCodes::InternalError, e.what());
    }
}

JSONRPCMessage TaskRequestHandler::handleList(const JSONRPCMessage& request) const {
    std::optional<std::string> cursor;
    if (request.params.has_value()) {
        cursor = GetStringMember(request.params.value(), "cursor");
    }
    try {
        return JSONRPCMessage::MakeResponse(request.id, TaskPageToJSON(manager->ListTasks(cursor)));
    } catch (const std::invalid_argument& e) {
        return errorReply(request, JSONRPCErrorCodes::InvalidParams, e.what());
    }
}

JSONRPCMessage TaskRequestHandler::handleCancel(const JSONRPCMessage& request, const std::string& taskId) const {
    try {
        return JSONRPCMessage::MakeResponse(request.id, TaskMetadataToJSON(manager->CancelTask(taskId)));
    } catch (const errors::TaskTerminalError& e) {
        return errorReply(request, JSONRPCErrorCodes::InvalidRequest, e.what());
    }
}

} // namespace tasks
} // namespace mcpcore
