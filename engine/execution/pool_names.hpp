#pragma once

#include "execution/executor_types.hpp"

namespace taskexec {
namespace engine {
namespace execution {

// Well-known pool names shared by services that route work by subsystem.
const PoolName PoolHTTP = "http";
const PoolName PoolDatabase = "database";
const PoolName PoolCache = "cache";
const PoolName PoolLogger = "logger";
const PoolName PoolBackground = "background";

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
