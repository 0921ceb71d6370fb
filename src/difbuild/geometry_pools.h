#pragma once

#include "brush_ingest.h"
#include "geometry.h"
#include "hashing.h"

#include <cstddef>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

// Points merged by distance. Lookups go through a uniform grid with cells
// as wide as epsilon, so only the 27 cells around a point are searched
class point_pool final {
  private:
	using cell_key = std::array<std::int64_t, 3>;

	double epsilon;
	double cellSize;
	std::vector<double3_array> points;
	std::unordered_map<cell_key, std::vector<point_index>, array_hash> grid;

	cell_key cell_of(double3_array const & point) const noexcept;

  public:
	explicit point_pool(double pointEpsilon);
	// Takes points that are already merged, keeping their indices
	point_pool(std::vector<double3_array> existingPoints, double pointEpsilon);

	// The nearest pooled point within epsilon, the lowest index on ties
	std::optional<point_index> find(double3_array const & point
	) const noexcept;
	point_index insert(double3_array const & point);

	std::span<double3_array const> pooled() const noexcept {
		return points;
	}

	std::vector<double3_array> take() && noexcept {
		return std::move(points);
	}
};

// Planes merged when every normal component and the distance are within
// epsilon. A plane and its negation stay separate entries that are linked
// through pooled_plane::inverse
class plane_pool final {
  private:
	using cell_key = std::array<std::int64_t, 4>;

	double epsilon;
	double cellSize;
	std::vector<pooled_plane> planes;
	std::unordered_map<cell_key, std::vector<plane_index>, array_hash> grid;

	cell_key cell_of(double3_array const & normal, double dist)
		const noexcept;
	std::optional<plane_index>
	find(double3_array const & normal, double dist) const noexcept;

  public:
	explicit plane_pool(double planeEpsilon);

	plane_index insert(double3_array const & normal, double dist);

	std::span<pooled_plane const> pooled() const noexcept {
		return planes;
	}

	std::vector<pooled_plane> take() && noexcept {
		return std::move(planes);
	}
};

struct deduplicated_geometry final {
	geometry_pools pools;
	std::size_t degenerateFaces{};
};

// Pools every face of the brushes, in input order. Consecutive points that
// snap together are collapsed; a face left with fewer than three points is
// dropped and counted as degenerate
deduplicated_geometry deduplicate(
	std::span<ingested_brush const> brushes,
	double pointEpsilon,
	double planeEpsilon
);
