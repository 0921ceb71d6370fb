#include "dif_stream.h"

#include "log.h"

#include <algorithm>

constexpr std::size_t max_string_length = 255;

void dif_stream::write_point(double3_array const & point) {
	for (double coordinate : point) {
		write_f32(float(coordinate));
	}
}

void dif_stream::write_string(std::u8string_view string) {
	if (string.size() > max_string_length) [[unlikely]] {
		Warning(
			"String \"%.32s...\" is %zu bytes long and was cut to %zu bytes",
			(char const *) string.data(),
			string.size(),
			max_string_length
		);
		string = string.substr(0, max_string_length);
	}
	write_u8(std::uint8_t(string.size()));
	for (char8_t c : string) {
		write_u8(std::uint8_t(c));
	}
}

void dif_stream::write_dictionary(std::span<csx_property const> properties) {
	write_u32(std::uint32_t(properties.size()));
	for (csx_property const & property : properties) {
		write_string(property.key);
		write_string(property.value);
	}
}

void dif_stream::write_u16_vector(std::span<std::uint16_t const> values) {
	write_u32(std::uint32_t(values.size()));
	std::ranges::for_each(values, [this](std::uint16_t v) { write_u16(v); });
}

void dif_stream::write_u32_vector(std::span<std::uint32_t const> values) {
	write_u32(std::uint32_t(values.size()));
	std::ranges::for_each(values, [this](std::uint32_t v) { write_u32(v); });
}
