#pragma once

#include <exception>
#include <string>

#include "execution/executor_types.hpp"
#include "logger/logger.hpp"

namespace taskexec {
namespace engine {
namespace execution {

/**
 * @brief Observer for exceptions that escape submitted tasks
 *
 * HandlePanic runs synchronously on the worker thread that executed the
 * failing task. Implementations must not throw.
 */
class PanicHandler {
public:
    virtual ~PanicHandler() = default;
    virtual void HandlePanic(const PoolName& pool_name, std::exception_ptr recovered) = 0;
};

/**
 * @brief Reports task panics through the engine logger
 */
class LoggingPanicHandler : public PanicHandler {
public:
    void HandlePanic(const PoolName& pool_name, std::exception_ptr recovered) override;

private:
    Logger logger_;
};

// Human readable form of a captured exception, "unknown exception" when it
// does not derive from std::exception.
std::string DescribeException(std::exception_ptr recovered);

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
