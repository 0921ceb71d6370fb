#pragma once

#include "bsp_builder.h"
#include "conversion_error.h"
#include "conversion_settings.h"
#include "progress_channel.h"

#include <cstddef>
#include <expected>
#include <stop_token>
#include <string_view>
#include <vector>

struct conversion_output final {
	// The primary .dif first, then one file per extra capacity unit
	std::vector<std::vector<std::byte>> files;
	// One per interior when a BSP is built: the primary interior, the other
	// detail levels, the elevator sub-objects, then the extra units
	std::vector<bsp_report> reports;
	std::size_t degenerateFacesDropped{};
	std::size_t unboundPathNodesDropped{};
};

// The whole CSX to DIF job. The engine and version are checked before the
// input is parsed. progress may be null
std::expected<conversion_output, conversion_error> convert_csx_to_dif(
	std::u8string_view csxText,
	conversion_settings const & settings,
	progress_channel* progress = nullptr,
	std::stop_token stopToken = {}
);
