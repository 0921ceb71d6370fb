#include "dif_format.h"

#include "utf8.h"

#include <array>
#include <utility>

using namespace std::literals;
constexpr std::array<std::u8string_view, 4> dif_engine_names{
	u8"mbg"sv, u8"tge"sv, u8"tgea"sv, u8"t3d"sv
};

// Newest interior version each engine reads
constexpr std::array<std::uint32_t, 4> max_interior_version{ 0, 0, 13, 14 };

std::optional<dif_engine> dif_engine_from_string(std::u8string_view name
) noexcept {
	for (std::size_t i = 0; i != dif_engine_names.size(); ++i) {
		if (strings_equal_with_ascii_case_insensitivity(
				name, dif_engine_names[i]
			)) {
			return dif_engine(i);
		}
	}
	return std::nullopt;
}

std::u8string_view name_of_dif_engine(dif_engine engine) noexcept {
	return dif_engine_names[std::to_underlying(engine)];
}

std::expected<dif_format, conversion_error>
make_dif_format(dif_engine engine, std::uint32_t version) {
	if (version > max_interior_version[std::to_underlying(engine)])
		[[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::unsupported_version_combination,
			"%s does not support interior version %u (supported: 0-%u)",
			(char const *) name_of_dif_engine(engine).data(),
			version,
			max_interior_version[std::to_underlying(engine)]
		));
	}
	return dif_format{ engine, version };
}
