#pragma once

#include <cstddef>
#include <stdarg.h>

#if defined(__GNUC__) || defined(__clang__)
#define FORMAT_PRINTF(STRING_INDEX, FIRST_TO_CHECK) \
	__attribute__((format(printf, STRING_INDEX, FIRST_TO_CHECK)))
#else
#define FORMAT_PRINTF(STRING_INDEX, FIRST_TO_CHECK)
#endif

extern bool FORMAT_PRINTF(3, 4) safe_snprintf(
	char* const dest, std::size_t const count, char const * const args, ...
);
