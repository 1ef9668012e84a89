/// @file logging.hpp
/// @brief Logging setup for applications embedding fracindex-cpp.

#pragma once

namespace fracindex_cpp {

/// Configure spdlog's default logger the way the library expects to be read:
/// debug level in debug builds, info otherwise, thread id and timestamp in
/// every line. The library itself only emits debug-level messages (raised
/// errors, integer-range fallbacks) and never installs sinks on its own.
void set_up_logging();

}  // namespace fracindex_cpp
