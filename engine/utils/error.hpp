#pragma once

#include <cstdint>
#include <string>

namespace taskexec {

using ErrorCode = int32_t;

constexpr ErrorCode EXECUTOR_SUCCESS = 0;
constexpr ErrorCode EXECUTOR_ERROR_CODE_BASE = 60000;
constexpr ErrorCode WORKER_POOL_ERROR_CODE_BASE = 61000;

constexpr ErrorCode ToExecutorErrorCode(const int32_t error_code) {
  return EXECUTOR_ERROR_CODE_BASE + error_code;
}

constexpr ErrorCode ToWorkerPoolErrorCode(const int32_t error_code) {
  return WORKER_POOL_ERROR_CODE_BASE + error_code;
}

// executor error code
constexpr ErrorCode EXECUTOR_UNEXPECTED_ERROR = ToExecutorErrorCode(1);
constexpr ErrorCode POOL_NOT_FOUND = ToExecutorErrorCode(2);
constexpr ErrorCode POOL_OVERLOAD = ToExecutorErrorCode(3);
constexpr ErrorCode MANAGER_CLOSED = ToExecutorErrorCode(4);
constexpr ErrorCode INVALID_CONFIG = ToExecutorErrorCode(5);
constexpr ErrorCode SHUTDOWN_TIMEOUT = ToExecutorErrorCode(6);
constexpr ErrorCode CONFIG_LOAD_ERROR = ToExecutorErrorCode(7);

// worker pool (bounded primitive) error code
constexpr ErrorCode WORKER_POOL_OVERLOAD = ToWorkerPoolErrorCode(1);
constexpr ErrorCode WORKER_POOL_CLOSED = ToWorkerPoolErrorCode(2);
constexpr ErrorCode WORKER_POOL_START_FAILED = ToWorkerPoolErrorCode(3);
constexpr ErrorCode WORKER_POOL_INVALID_ARGUMENT = ToWorkerPoolErrorCode(4);

// Message templates shared by the execution layer.
constexpr const char* kErrMsgPoolNotFound = "pool not found: ";
constexpr const char* kErrMsgPoolOverload = "pool overloaded";
constexpr const char* kErrMsgManagerClosed = "manager is closed";
constexpr const char* kErrMsgInvalidConfig = "invalid config: ";
constexpr const char* kErrMsgReloadFailed = "failed to reload: ";
constexpr const char* kErrMsgShutdownTimeout = "shutdown timeout exceeded";

}  // namespace taskexec
