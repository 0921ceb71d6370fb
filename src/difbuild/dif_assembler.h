#pragma once

#include "bsp_builder.h"
#include "conversion_error.h"
#include "dif_format.h"
#include "entity_binder.h"
#include "geometry.h"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

// u = planeX . p + planeX[3], v likewise, in world space
struct texgen_equation final {
	double4_array planeX;
	double4_array planeY;

	friend bool
	operator==(texgen_equation const &, texgen_equation const &) = default;
};

// Applies the face rotation, scale, texture divisor and brush scale, then
// moves the equation through the brush transform
texgen_equation make_texgen_equation(surface_attributes const & attributes);

struct interior_source final {
	geometry_pools const & pools;
	bsp_tree const & tree;
	std::uint32_t detailLevel{};
	double3_array ambientColor{};
	double3_array ambientColorEmergency{};
};

// Serializes one interior. sizeReduced leaves out the lists that only
// Torque's collision and lighting code reads (hull plane indices, emit
// strings, poly lists, secondary normals, ambient colours)
std::expected<std::vector<std::byte>, conversion_error> assemble_interior(
	dif_format const & format,
	bool sizeReduced,
	interior_source const & source
);

// Everything one .dif file holds
struct dif_contents final {
	std::vector<std::vector<std::byte>> detailLevels; // Serialized interiors
	std::vector<std::vector<std::byte>> subObjects;
	std::vector<dif_trigger> triggers;
	std::vector<dif_path_follower> pathFollowers;
	std::vector<dif_game_entity> gameEntities;
};

std::vector<std::byte> assemble_dif(dif_contents const & contents);
