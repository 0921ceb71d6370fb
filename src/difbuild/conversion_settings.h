#pragma once

#include "bsp_builder.h"
#include "cli_option_defaults.h" // IWYU pragma: export
#include "dif_format.h"

#include <cstddef>
#include <cstdint>

namespace cli_option_defaults {
	constexpr dif_engine engine = dif_engine::mbg;
	constexpr std::uint32_t difVersion = 0;
	constexpr bool marbleBlastOptimized = true;
	constexpr bsp_strategy bspStrategy = bsp_strategy::exhaustive;
	constexpr double pointEpsilon = 1e-6;
	constexpr double planeEpsilon = 1e-5;
	constexpr bool silent = false;
} // namespace cli_option_defaults

struct conversion_settings final {
	dif_engine engine = cli_option_defaults::engine;
	std::uint32_t difVersion = cli_option_defaults::difVersion;
	// Leaves out the lists Marble Blast does not read
	bool marbleBlastOptimized = cli_option_defaults::marbleBlastOptimized;
	bsp_strategy bspStrategy = cli_option_defaults::bspStrategy;
	double pointEpsilon = cli_option_defaults::pointEpsilon;
	double planeEpsilon = cli_option_defaults::planeEpsilon;
	std::size_t numberOfThreads = 1;
};
