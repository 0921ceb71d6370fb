#pragma once

#include "csx_document.h"
#include "mathtypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using point_index = std::uint32_t;
using plane_index = std::uint32_t;
using surface_index = std::uint32_t;

// normal . x == dist
struct pooled_plane final {
	double3_array normal;
	double dist;
	// The pooled plane facing the opposite way, if there is one
	std::optional<plane_index> inverse;
};

// Carried from the CSX face to the DIF surface without being looked at
// by the geometry code
struct surface_attributes final {
	std::u8string material;
	csx_texgen texgen;
	std::array<std::int32_t, 2> texDiv{ 1, 1 };
	std::uint32_t brushScale{ 32 };
	double4x4_array brushTransform{ identity_matrix };
};

struct pooled_surface final {
	std::vector<point_index> points; // Winding order
	plane_index plane{};
	std::int32_t brushId{};
	std::int32_t faceId{};
	surface_attributes attributes;
};

// One convex hull of the output
struct pooled_brush final {
	std::int32_t id{};
	// Distinct points of the brush's surfaces, in first-use order
	std::vector<point_index> hullPoints;
	std::vector<surface_index> surfaces;
};

struct geometry_pools final {
	std::vector<double3_array> points;
	std::vector<pooled_plane> planes;
	std::vector<pooled_surface> surfaces;
	std::vector<pooled_brush> brushes;

	bool empty() const noexcept {
		return surfaces.empty();
	}
};
