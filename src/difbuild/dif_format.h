#pragma once

#include "conversion_error.h"

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

enum class dif_engine : std::uint8_t { mbg, tge, tgea, t3d };

constexpr std::u8string_view dif_engine_options{ u8"mbg|tge|tgea|t3d" };

std::optional<dif_engine> dif_engine_from_string(std::u8string_view name
) noexcept;
std::u8string_view name_of_dif_engine(dif_engine engine) noexcept;

// Largest pools one interior can address
struct capacity_limits final {
	std::size_t maxPoints;
	std::size_t maxPlanes;
	std::size_t maxSurfaces;
};

// Every rule that depends on the engine or the interior version
class dif_format final {
  private:
	dif_engine targetEngine;
	std::uint32_t interiorVersion;

	constexpr dif_format(dif_engine engine, std::uint32_t version) noexcept :
		targetEngine(engine),
		interiorVersion(version) { }

	friend std::expected<dif_format, conversion_error>
	make_dif_format(dif_engine engine, std::uint32_t version);

  public:
	static constexpr std::uint32_t resource_file_version = 44;

	constexpr dif_engine engine() const noexcept {
		return targetEngine;
	}

	constexpr std::uint32_t version() const noexcept {
		return interiorVersion;
	}

	// 32-bit BSP child indices instead of 16-bit
	constexpr bool wide_bsp_indices() const noexcept {
		return interiorVersion >= 14;
	}

	// 32-bit lightmap sizes, winding counts and lightmap indices
	constexpr bool wide_lightmap_fields() const noexcept {
		return interiorVersion >= 13;
	}

	// Edges, zone static mesh lists and the hull static mesh flag
	constexpr bool has_edges() const noexcept {
		return interiorVersion >= 12;
	}

	constexpr bool has_texture_matrices() const noexcept {
		return interiorVersion >= 11;
	}

	constexpr bool has_static_meshes() const noexcept {
		return interiorVersion >= 10;
	}

	// Versions 2 to 5 carry a second edge list
	constexpr bool has_legacy_edges() const noexcept {
		return interiorVersion >= 2 && interiorVersion <= 5;
	}

	// Versions 4 and 5 carry secondary normals and a normal index list
	constexpr bool has_legacy_normals() const noexcept {
		return interiorVersion >= 4 && interiorVersion <= 5;
	}

	constexpr std::uint32_t bsp_leaf_flag() const noexcept {
		return wide_bsp_indices() ? 0x80000 : 0x8000;
	}

	constexpr std::uint32_t bsp_solid_flag() const noexcept {
		return wide_bsp_indices() ? 0x40000 : 0x4000;
	}

	constexpr capacity_limits limits() const noexcept {
		return capacity_limits{
			.maxPoints = interiorVersion >= 14 ? 0x7FFF'FFFFzu : 0xFFFFzu,
			.maxPlanes = 0x7FFFzu,
			.maxSurfaces = wide_bsp_indices() ? 0x3'FFFFzu : 0x3FFFzu
		};
	}
};

// UnsupportedVersionCombination unless the engine can load the version
std::expected<dif_format, conversion_error>
make_dif_format(dif_engine engine, std::uint32_t version);
