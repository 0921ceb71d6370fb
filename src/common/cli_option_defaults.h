#pragma once

#include "log.h"
#include "threads.h"

#include <cstddef>

// Defaults shared by every tool. The conversion defaults are added to this
// namespace by conversion_settings.h
namespace cli_option_defaults {
	constexpr developer_level developer = developer_level::disabled;
	constexpr bool info = true;
	constexpr bool log = true;
	constexpr std::ptrdiff_t numberOfThreads = -1;
	constexpr bool verbose = false;
	constexpr q_threadpriority threadPriority
		= q_threadpriority::eThreadPriorityNormal;
} // namespace cli_option_defaults
