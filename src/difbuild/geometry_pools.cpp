#include "geometry_pools.h"

#include "log.h"

#include <algorithm>
#include <cmath>

// Keeps grid coordinates far from the limits of std::int64_t
constexpr double max_cell_coordinate = 1e15;
constexpr double min_cell_size = 1e-12;

static std::int64_t grid_coordinate(double value, double cellSize) noexcept {
	return std::int64_t(std::clamp(
		std::floor(value / cellSize), -max_cell_coordinate, max_cell_coordinate
	));
}

point_pool::point_pool(double pointEpsilon) :
	epsilon(pointEpsilon),
	cellSize(std::max(pointEpsilon, min_cell_size)) { }

point_pool::point_pool(
	std::vector<double3_array> existingPoints, double pointEpsilon
) :
	point_pool(pointEpsilon) {
	points = std::move(existingPoints);
	for (point_index i = 0; i != points.size(); ++i) {
		grid[cell_of(points[i])].push_back(i);
	}
}

auto point_pool::cell_of(double3_array const & point) const noexcept
	-> cell_key {
	return { grid_coordinate(point[0], cellSize),
			 grid_coordinate(point[1], cellSize),
			 grid_coordinate(point[2], cellSize) };
}

std::optional<point_index>
point_pool::find(double3_array const & point) const noexcept {
	cell_key const center = cell_of(point);
	std::optional<point_index> best;
	double bestDistance = epsilon;

	for (std::int64_t dx = -1; dx <= 1; ++dx) {
		for (std::int64_t dy = -1; dy <= 1; ++dy) {
			for (std::int64_t dz = -1; dz <= 1; ++dz) {
				auto const it = grid.find(
					{ center[0] + dx, center[1] + dy, center[2] + dz }
				);
				if (it == grid.end()) {
					continue;
				}
				for (point_index candidate : it->second) {
					double const distance = vector_distance(
						points[candidate], point
					);
					if (distance > epsilon) {
						continue;
					}
					if (!best || distance < bestDistance
						|| (distance == bestDistance
							&& candidate < best.value())) {
						best = candidate;
						bestDistance = distance;
					}
				}
			}
		}
	}
	return best;
}

point_index point_pool::insert(double3_array const & point) {
	if (std::optional<point_index> const existing = find(point)) {
		return existing.value();
	}
	point_index const index = points.size();
	points.push_back(point);
	grid[cell_of(point)].push_back(index);
	return index;
}

////////

plane_pool::plane_pool(double planeEpsilon) :
	epsilon(planeEpsilon),
	cellSize(std::max(planeEpsilon, min_cell_size)) { }

auto plane_pool::cell_of(double3_array const & normal, double dist)
	const noexcept -> cell_key {
	return { grid_coordinate(normal[0], cellSize),
			 grid_coordinate(normal[1], cellSize),
			 grid_coordinate(normal[2], cellSize),
			 grid_coordinate(dist, cellSize) };
}

std::optional<plane_index>
plane_pool::find(double3_array const & normal, double dist) const noexcept {
	cell_key const center = cell_of(normal, dist);
	std::optional<plane_index> best;
	double bestDifference = epsilon;

	// 3^4 neighbouring cells
	for (std::size_t neighbour = 0; neighbour != 81; ++neighbour) {
		cell_key key = center;
		std::size_t offsets = neighbour;
		for (std::int64_t& coordinate : key) {
			coordinate += std::int64_t(offsets % 3) - 1;
			offsets /= 3;
		}

		auto const it = grid.find(key);
		if (it == grid.end()) {
			continue;
		}
		for (plane_index candidate : it->second) {
			pooled_plane const & p = planes[candidate];
			double const difference = std::max(
				{ std::fabs(p.normal[0] - normal[0]),
				  std::fabs(p.normal[1] - normal[1]),
				  std::fabs(p.normal[2] - normal[2]),
				  std::fabs(p.dist - dist) }
			);
			if (difference > epsilon) {
				continue;
			}
			if (!best || difference < bestDifference
				|| (difference == bestDifference && candidate < best.value()
				)) {
				best = candidate;
				bestDifference = difference;
			}
		}
	}
	return best;
}

plane_index plane_pool::insert(double3_array const & normal, double dist) {
	if (std::optional<plane_index> const existing = find(normal, dist)) {
		return existing.value();
	}

	plane_index const index = planes.size();
	std::optional<plane_index> const inverse = find(
		negate_vector(normal), -dist
	);
	planes.emplace_back(
		pooled_plane{ .normal = normal, .dist = dist, .inverse = std::nullopt }
	);
	if (inverse && !planes[inverse.value()].inverse) {
		planes[inverse.value()].inverse = index;
		planes[index].inverse = inverse;
	}
	grid[cell_of(normal, dist)].push_back(index);
	return index;
}

////////

deduplicated_geometry deduplicate(
	std::span<ingested_brush const> brushes,
	double pointEpsilon,
	double planeEpsilon
) {
	deduplicated_geometry result{};
	point_pool points{ pointEpsilon };
	plane_pool planes{ planeEpsilon };

	for (ingested_brush const & brush : brushes) {
		pooled_brush pooledBrush{};
		pooledBrush.id = brush.id;

		// The same vertex always snaps to the same point
		std::vector<std::optional<point_index>> vertexToPoint(
			brush.vertices.size()
		);

		for (ingested_face const & face : brush.faces) {
			std::vector<point_index> facePoints;
			facePoints.reserve(face.vertexIndices.size());
			for (std::uint32_t vertex : face.vertexIndices) {
				std::optional<point_index>& cached = vertexToPoint[vertex];
				if (!cached) {
					cached = points.insert(brush.vertices[vertex]);
				}
				if (facePoints.empty() || facePoints.back() != cached.value()) {
					facePoints.push_back(cached.value());
				}
			}
			while (facePoints.size() > 1
				   && facePoints.back() == facePoints.front()) {
				facePoints.pop_back();
			}

			if (facePoints.size() < 3) [[unlikely]] {
				Warning(
					"Brush %d face %d collapsed to %zu points when merging points and was dropped",
					brush.id,
					face.faceId,
					facePoints.size()
				);
				++result.degenerateFaces;
				continue;
			}

			for (point_index p : facePoints) {
				if (std::ranges::find(pooledBrush.hullPoints, p)
					== pooledBrush.hullPoints.end()) {
					pooledBrush.hullPoints.push_back(p);
				}
			}

			surface_index const surfaceIndex = result.pools.surfaces.size();
			result.pools.surfaces.emplace_back(pooled_surface{
				.points = std::move(facePoints),
				.plane = planes.insert(face.plane.normal, face.plane.dist),
				.brushId = brush.id,
				.faceId = face.faceId,
				.attributes = face.attributes });
			pooledBrush.surfaces.push_back(surfaceIndex);
		}

		if (!pooledBrush.surfaces.empty()) {
			result.pools.brushes.emplace_back(std::move(pooledBrush));
		}
	}

	result.pools.points = std::move(points).take();
	result.pools.planes = std::move(planes).take();
	return result;
}
