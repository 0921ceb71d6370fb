#include "conversion_error.h"

#include <cstdio>

conversion_error FORMAT_PRINTF(2, 3)
	make_conversion_error(conversion_msg msg, char const * context, ...) {
	char message[1024];

	va_list argptr;
	va_start(argptr, context);
	vsnprintf(message, sizeof(message), context, argptr);
	va_end(argptr);

	return conversion_error{
		.msg = msg, .context = std::u8string{ (char8_t const *) message }
	};
}
