#pragma once

#include "conversion_error.h"
#include "mathtypes.h"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Brush types written by Constructor
enum class csx_brush_type : std::int32_t {
	structural = 0,
	detail = 1,
	portal = 3,
	collision = 4,
	trigger = 999
};

// Key/value pair in input order
struct csx_property final {
	std::u8string key;
	std::u8string value;
};

struct csx_entity final {
	std::int32_t id{};
	std::u8string classname;
	std::u8string gametype;
	std::optional<double3_array> origin;
	std::vector<csx_property> properties;
	// Position of the entity in the whole document
	std::size_t inputOrder{};

	std::optional<std::u8string_view> property(std::u8string_view key
	) const noexcept;
};

// Texture projection of a face, as authored
struct csx_texgen final {
	double4_array planeX; // nx ny nz d
	double4_array planeY;
	double rotation{}; // Degrees
	std::array<double, 2> scale{ 1.0, 1.0 };
};

struct csx_face final {
	std::int32_t id{};
	// n . x + d = 0, as authored and before the brush transform
	double4_array plane{};
	std::u8string material;
	csx_texgen texgen;
	std::array<std::int32_t, 2> texDiv{ 1, 1 };
	std::vector<std::uint32_t> indices;
};

struct csx_brush final {
	std::int32_t id{};
	std::int32_t owner{};
	std::int32_t type{};
	double4x4_array transform{ identity_matrix };
	std::vector<double3_array> vertices;
	std::vector<csx_face> faces;
};

struct csx_detail_level final {
	std::uint32_t brushScale{ 32 };
	std::uint32_t lightScale{ 32 };
	double3_array ambientColor{};
	double3_array ambientColorEmergency{};
	std::vector<csx_entity> entities;
	std::vector<csx_brush> brushes;
};

struct csx_scene final {
	std::int32_t version{};
	std::u8string creator;
	std::vector<csx_detail_level> detailLevels;
};

std::expected<csx_scene, conversion_error>
parse_csx_document(std::u8string_view text);
