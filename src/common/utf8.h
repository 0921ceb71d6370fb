#pragma once

#include <algorithm>
#include <bit>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

constexpr bool is_ascii_code_unit(char8_t codeUnit) noexcept {
	return codeUnit <= 0x7F;
}

namespace utf8_internal {
	bool validate_utf8_continuing_code_units(
		unsigned char const *& it,
		unsigned char const * end,
		unsigned char firstCodeUnitInCodePoint
	) noexcept;
} // namespace utf8_internal

bool validate_utf8(std::u8string_view string) noexcept;

// Appends the UTF-8 encoding of a code point. Returns false for code points
// that can not be encoded (surrogates and values above U+10FFFF)
bool append_code_point_as_utf8(std::u8string& out, char32_t codePoint);

constexpr std::u8string_view ascii_whitespace{ u8" \f\n\r\t\v" };

[[nodiscard]] constexpr char8_t ascii_character_to_lowercase(char8_t c
) noexcept {
	char8_t const add = (c >= u8'A' && c <= u8'Z') ? (u8'a' - u8'A')
												   : u8'\0';
	return c + add;
}

[[nodiscard]] constexpr auto
ascii_characters_to_lowercase_in_utf8_string_as_view(
	std::u8string_view input
) noexcept {
	return std::ranges::transform_view(input, ascii_character_to_lowercase);
}

constexpr bool strings_equal_with_ascii_case_insensitivity(
	std::u8string_view a, std::u8string_view b
) noexcept {
	return std::ranges::equal(
		ascii_characters_to_lowercase_in_utf8_string_as_view(a),
		ascii_characters_to_lowercase_in_utf8_string_as_view(b)
	);
}

inline bool strings_equal_with_ascii_case_insensitivity(
	std::string_view a, std::u8string_view b
) noexcept {
	return strings_equal_with_ascii_case_insensitivity(
		std::u8string_view(
			(char8_t const *) a.data(), (char8_t const *) a.data() + a.size()
		),
		b
	);
}

inline std::u8string_view to_u8string_view(char const * cString) noexcept {
	return std::u8string_view{ (char8_t const *) cString };
}

template <class Number, class Char = char8_t>
struct parse_number_result final {
	std::optional<Number> number;
	std::basic_string_view<Char> remainingText;
};

template <std::integral Number = std::int32_t>
constexpr parse_number_result<Number>
parse_number(std::u8string_view str) noexcept {
	Number number;
	char const * begin = (char const *) str.data();
	char const * end = begin + str.size();
	if (begin != end && *begin == '+') {
		++begin;
	}
	std::from_chars_result const fromCharsResult{
		std::from_chars(begin, end, number)
	};

	if (fromCharsResult.ec == std::errc{}) [[likely]] {
		return { .number = number,
				 .remainingText = str.substr(
					 fromCharsResult.ptr - (char const *) str.data()
				 ) };
	}
	return { .number = std::nullopt, .remainingText = str };
}

template <std::floating_point Number>
parse_number_result<Number> parse_number(std::u8string_view str) noexcept {
	constexpr std::u8string_view floatChars{ u8"+-.eE0123456789" };

	std::string zeroTerminatedCopy{
		(char const *) str.data(),
		std::min(str.size(), str.find_first_not_of(floatChars))
	};

	char* rest = zeroTerminatedCopy.data();
	Number const number{ Number(
		std::strtod(zeroTerminatedCopy.data(), &rest)
	) };
	std::size_t const numCharsParsed = rest - zeroTerminatedCopy.data();
	if (numCharsParsed == 0) [[unlikely]] {
		return { .number = std::nullopt, .remainingText = str };
	}
	return { .number = number, .remainingText = str.substr(numCharsParsed) };
}
