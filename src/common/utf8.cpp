#include "utf8.h"

namespace utf8_internal {
	bool validate_utf8_continuing_code_units(
		unsigned char const *& it,
		unsigned char const * end,
		unsigned char firstCodeUnitInCodePoint
	) noexcept {
		std::size_t codeUnitsToCheck
			= std::countl_one(firstCodeUnitInCodePoint) - 1;
		std::size_t const unitsRemaining = end - it;

		bool invalid = codeUnitsToCheck == 0 || codeUnitsToCheck > 3;
		bool earlyEnd = unitsRemaining < codeUnitsToCheck;
		if (invalid || earlyEnd) [[unlikely]] {
			return false;
		}
		do {
			unsigned char const continuingCodeUnit = *it;
			if (continuingCodeUnit < 0b1000'0000
				|| continuingCodeUnit > 0b1011'1111) [[unlikely]] {
				return false;
			}
			++it;
		} while (--codeUnitsToCheck);
		return true;
	}
} // namespace utf8_internal

bool validate_utf8(std::u8string_view string) noexcept {
	unsigned char const * it = (unsigned char const *) string.data();
	unsigned char const * end = it + string.size();

	while (it != end) {
		unsigned char const firstCodeUnitInCodePoint = *it;
		++it;
		if (!is_ascii_code_unit(firstCodeUnitInCodePoint)) [[unlikely]] {
			if (!utf8_internal::validate_utf8_continuing_code_units(
					it, end, firstCodeUnitInCodePoint
				)) [[unlikely]] {
				return false;
			}
		}
	}
	return true;
}

bool append_code_point_as_utf8(std::u8string& out, char32_t codePoint) {
	bool const isSurrogate = codePoint >= 0xD800 && codePoint <= 0xDFFF;
	if (isSurrogate || codePoint > 0x10'FFFF) [[unlikely]] {
		return false;
	}

	if (codePoint < 0x80) {
		out += char8_t(codePoint);
	} else if (codePoint < 0x800) {
		out += char8_t(0xC0 | (codePoint >> 6));
		out += char8_t(0x80 | (codePoint & 0x3F));
	} else if (codePoint < 0x1'0000) {
		out += char8_t(0xE0 | (codePoint >> 12));
		out += char8_t(0x80 | ((codePoint >> 6) & 0x3F));
		out += char8_t(0x80 | (codePoint & 0x3F));
	} else {
		out += char8_t(0xF0 | (codePoint >> 18));
		out += char8_t(0x80 | ((codePoint >> 12) & 0x3F));
		out += char8_t(0x80 | ((codePoint >> 6) & 0x3F));
		out += char8_t(0x80 | (codePoint & 0x3F));
	}
	return true;
}
