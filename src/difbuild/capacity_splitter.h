#pragma once

#include "conversion_error.h"
#include "dif_format.h"
#include "geometry.h"

#include <expected>
#include <span>
#include <vector>

// Renumbers the pools of the selected brushes into a self-contained set,
// in first-use order. Inverse plane links survive when both planes are kept
geometry_pools
extract_brushes(geometry_pools const & pools, std::span<std::size_t const> brushes);

// Groups whole brushes, in input order, into as few units as the limits
// allow. CapacityExceeded if a single brush does not fit an empty unit
std::expected<std::vector<geometry_pools>, conversion_error>
split_by_capacity(geometry_pools const & pools, capacity_limits const & limits);

// CapacityExceeded, naming what, unless everything fits one unit
std::expected<geometry_pools, conversion_error> fit_in_one_unit(
	geometry_pools const & pools,
	capacity_limits const & limits,
	char const * what
);
