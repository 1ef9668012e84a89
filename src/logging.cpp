#include <fracindex-cpp/logging.hpp>

#include "logger.hpp"

namespace fracindex_cpp {

void set_up_logging() {
#ifdef NDEBUG
    spdlog::set_level(spdlog::level::info);
#else
    spdlog::set_level(spdlog::level::debug);
#endif
    spdlog::set_pattern("[Thread %t] %+ [+%omsec]");
}

}  // namespace fracindex_cpp
