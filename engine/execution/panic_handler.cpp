#include "execution/panic_handler.hpp"

namespace taskexec {
namespace engine {
namespace execution {

std::string DescribeException(std::exception_ptr recovered) {
    if (!recovered) {
        return "no exception";
    }
    try {
        std::rethrow_exception(recovered);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s != nullptr ? std::string(s) : std::string("unknown exception");
    } catch (...) {
        return "unknown exception";
    }
}

void LoggingPanicHandler::HandlePanic(const PoolName& pool_name, std::exception_ptr recovered) {
    logger_.Error("Task panicked in pool '" + pool_name + "': " + DescribeException(recovered));
}

}  // namespace execution
}  // namespace engine
}  // namespace taskexec
