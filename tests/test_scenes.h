#pragma once

#include "csx_document.h"
#include "geometry.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

struct test_entity final {
	std::int32_t id{};
	std::u8string classname;
	std::optional<double3_array> origin;
	std::vector<csx_property> properties;
};

// Axis-aligned box brush
struct test_brush final {
	std::int32_t id{};
	std::int32_t owner{};
	double3_array mins{};
	double3_array maxs{};
};

struct test_detail_level final {
	std::vector<test_entity> entities;
	std::vector<test_brush> brushes;
	std::uint32_t brushScale{ 32 };
	double3_array ambientColor{};
};

// A ConstructorScene document as Constructor writes it
std::u8string make_test_csx(std::span<test_detail_level const> detailLevels);
std::u8string make_test_csx(test_detail_level const & detailLevel);

// The brush parse_csx_document returns for a box
csx_brush make_box_brush(
	std::int32_t id, double3_array const & mins, double3_array const & maxs
);

// Ingests and deduplicates the boxes
geometry_pools pool_boxes(
	std::span<test_brush const> boxes,
	double pointEpsilon = 1e-6,
	double planeEpsilon = 1e-5
);

// Every distinct point index used by the surfaces
std::size_t count_used_points(geometry_pools const & pools);
