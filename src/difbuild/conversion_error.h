#pragma once

#include "cmdlib.h"
#include "messages.h"

#include <string>

// A fatal condition, with enough context to find the offending input
struct conversion_error final {
	conversion_msg msg{ conversion_msg::first };
	std::u8string context;
};

conversion_error FORMAT_PRINTF(2, 3)
	make_conversion_error(conversion_msg msg, char const * context, ...);
