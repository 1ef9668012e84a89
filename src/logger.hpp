#pragma once

// spdlog configuration shared by every translation unit of the library.
// Include this before any other spdlog header so the compile-time level
// applies. Internal header — not installed.

#ifndef SPDLOG_ACTIVE_LEVEL
#ifdef NDEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#endif
#endif

#include <spdlog/spdlog.h>
