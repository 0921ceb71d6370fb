#pragma once

#include "utf8.h"

#include <string_view>

[[nodiscard]] constexpr std::u8string_view
skip_ascii_whitespace(std::u8string_view str) noexcept {
	std::size_t const skipTo{ str.find_first_not_of(ascii_whitespace) };
	if (skipTo == std::u8string_view::npos) {
		return {};
	}

	return str.substr(skipTo);
}

[[nodiscard]] constexpr std::u8string_view
trim_ascii_whitespace(std::u8string_view str) noexcept {
	str = skip_ascii_whitespace(str);
	std::size_t const last{ str.find_last_not_of(ascii_whitespace) };
	return str.substr(0, last + 1);
}

// Returns the next whitespace-delimited word and removes it from text
constexpr std::u8string_view next_word(std::u8string_view& text) noexcept {
	text = skip_ascii_whitespace(text);
	std::u8string_view const word = text.substr(
		0, text.find_first_of(ascii_whitespace)
	);
	text = text.substr(word.length());
	return word;
}

constexpr bool
try_to_skip_one(std::u8string_view& str, char8_t c) noexcept {
	bool const startsWithC = str.starts_with(c);
	str = str.substr((std::size_t) startsWithC);
	return startsWithC;
}

constexpr bool
try_to_skip(std::u8string_view& str, std::u8string_view prefix) noexcept {
	bool const startsWithPrefix = str.starts_with(prefix);
	if (startsWithPrefix) {
		str.remove_prefix(prefix.size());
	}
	return startsWithPrefix;
}
