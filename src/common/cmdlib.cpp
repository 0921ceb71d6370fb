#include "cmdlib.h"

#include <cstdio>

bool FORMAT_PRINTF(3, 4) safe_snprintf(
	char* const dest, std::size_t const count, char const * const args, ...
) {
	if (count == 0) [[unlikely]] {
		return false;
	}

	va_list argptr;
	va_start(argptr, args);
	int const amt = vsnprintf(dest, count, args, argptr);
	va_end(argptr);

	// Truncated. vsnprintf has already null-terminated the buffer
	return amt >= 0 && std::size_t(amt) < count;
}
