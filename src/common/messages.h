#pragma once
#include <cstdint>
#include <string_view>

struct MessageTable_t final {
	std::u8string_view title;
	std::u8string_view text;
	std::u8string_view howto;
};

enum class conversion_msg : std::uint8_t {
	first = 0,

	// Recoverable, counted and logged
	degenerate_geometry,
	unbound_path_node,

	// Fatal
	capacity_exceeded,
	unsupported_version_combination,
	malformed_input,
	unreadable_input,
	output_write_failed,
	tool_cancelled,

	last
};

MessageTable_t const & get_message(conversion_msg id) noexcept;

// Short machine-friendly name, e.g. "CapacityExceeded"
std::u8string_view name_of_message(conversion_msg id) noexcept;
