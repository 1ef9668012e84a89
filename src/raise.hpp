#pragma once

// Single throw site for library errors so every failure is logged the same
// way before it propagates. Internal header — not installed.

#include "logger.hpp"

#include <fracindex-cpp/error.hpp>

#include <string>
#include <utility>

namespace fracindex_cpp::detail {

[[noreturn]] inline void raise(ErrorKind kind, std::string message) {
    SPDLOG_DEBUG("fracindex: {}: {}", to_string_view(kind), message);
    throw OrderKeyError{kind, std::move(message)};
}

}  // namespace fracindex_cpp::detail
