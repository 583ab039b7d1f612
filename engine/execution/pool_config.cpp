#include "execution/pool_config.hpp"

#include "logger/logger.hpp"

namespace taskexec {
namespace engine {
namespace execution {

Status PoolConfig::Validate() {
    if (name.empty()) {
        return Status(INVALID_CONFIG, std::string(kErrMsgInvalidConfig) + "pool name is empty");
    }

    Logger logger;
    if (size < MinPoolSize) {
        logger.Warning("Pool '" + name + "' size " + std::to_string(size) +
                       " below minimum, using " + std::to_string(MinPoolSize));
        size = MinPoolSize;
    }
    if (size > MaxPoolSize) {
        logger.Warning("Pool '" + name + "' size " + std::to_string(size) +
                       " above maximum, using " + std::to_string(MaxPoolSize));
        size = MaxPoolSize;
    }

    if (expiry.count() <= 0) {
        logger.Warning("Pool '" + name + "' has non-positive expiry, using default " +
                       std::to_string(DefaultWorkerExpiry.count()) + "ms");
        expiry = DefaultWorkerExpiry;
    }

    return Status::OK();
}

std::string PoolConfig::ToString() const {
    return "{name=" + name + ", size=" + std::to_string(size) +
           ", expiry=" + std::to_string(expiry.count()) + "ms" +
           ", non_blocking=" + (non_blocking ? "true" : "false") + "}";
}

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
