#pragma once

#include "parsing.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::optional<std::int64_t> clamp_signed_integer_from_string(
	std::u8string_view valueString, std::int64_t min, std::int64_t max
) noexcept;

std::optional<std::uint64_t> clamp_unsigned_integer_from_string(
	std::u8string_view valueString, std::uint64_t min, std::uint64_t max
) noexcept;

// The whole string must be one number, surrounding whitespace aside
template <class Number>
std::optional<Number> number_from_string(std::u8string_view valueString) {
	valueString = trim_ascii_whitespace(valueString);
	parse_number_result<Number> const result = parse_number<Number>(
		valueString
	);
	if (!result.number || !result.remainingText.empty()) [[unlikely]] {
		return std::nullopt;
	}
	return result.number;
}

// Parses exactly N whitespace-separated numbers, such as "1 0.5 -3"
template <class Number, std::size_t N>
std::optional<std::array<Number, N>>
numbers_from_string(std::u8string_view valueString) {
	std::array<Number, N> result;
	for (std::size_t i = 0; i != N; ++i) {
		std::optional<Number> const maybeElement
			= number_from_string<Number>(next_word(valueString));
		if (!maybeElement) [[unlikely]] {
			return std::nullopt;
		}
		result[i] = maybeElement.value();
	}
	if (!skip_ascii_whitespace(valueString).empty()) [[unlikely]] {
		return std::nullopt;
	}
	return result;
}

// Parses any number of whitespace-separated numbers
template <class Number>
std::optional<std::vector<Number>>
number_list_from_string(std::u8string_view valueString) {
	std::vector<Number> result;
	for (std::u8string_view word = next_word(valueString); !word.empty();
		 word = next_word(valueString)) {
		std::optional<Number> const maybeElement
			= number_from_string<Number>(word);
		if (!maybeElement) [[unlikely]] {
			return std::nullopt;
		}
		result.push_back(maybeElement.value());
	}
	return result;
}
