#include "capacity_splitter.h"

#include "log.h"

#include <unordered_map>
#include <unordered_set>

geometry_pools extract_brushes(
	geometry_pools const & pools, std::span<std::size_t const> brushes
) {
	geometry_pools unit{};
	std::unordered_map<point_index, point_index> pointMap;
	std::unordered_map<plane_index, plane_index> planeMap;

	auto const localPoint = [&](point_index global) {
		auto const [it, inserted] = pointMap.try_emplace(
			global, unit.points.size()
		);
		if (inserted) {
			unit.points.push_back(pools.points[global]);
		}
		return it->second;
	};
	auto const localPlane = [&](plane_index global) {
		auto const [it, inserted] = planeMap.try_emplace(
			global, unit.planes.size()
		);
		if (inserted) {
			pooled_plane plane = pools.planes[global];
			plane.inverse = std::nullopt;
			unit.planes.push_back(plane);
		}
		return it->second;
	};

	for (std::size_t brushNumber : brushes) {
		pooled_brush const & brush = pools.brushes[brushNumber];
		pooled_brush localBrush{};
		localBrush.id = brush.id;

		for (surface_index s : brush.surfaces) {
			pooled_surface surface = pools.surfaces[s];
			for (point_index& p : surface.points) {
				p = localPoint(p);
			}
			surface.plane = localPlane(surface.plane);
			localBrush.surfaces.push_back(unit.surfaces.size());
			unit.surfaces.emplace_back(std::move(surface));
		}
		for (point_index p : brush.hullPoints) {
			localBrush.hullPoints.push_back(localPoint(p));
		}
		unit.brushes.emplace_back(std::move(localBrush));
	}

	for (auto const & [global, local] : planeMap) {
		std::optional<plane_index> const inverse = pools.planes[global].inverse;
		if (!inverse) {
			continue;
		}
		auto const inverseIt = planeMap.find(inverse.value());
		if (inverseIt != planeMap.end()) {
			unit.planes[local].inverse = inverseIt->second;
		}
	}
	return unit;
}

namespace {
	// Distinct pooled entries used by the brushes placed so far
	struct unit_usage final {
		std::vector<std::size_t> brushes;
		std::unordered_set<point_index> points;
		std::unordered_set<plane_index> planes;
		std::size_t numSurfaces{};
	};

	struct brush_cost final {
		std::size_t newPoints{};
		std::size_t newPlanes{};
		std::size_t surfaces{};
	};
} // namespace

static brush_cost cost_of_adding(
	geometry_pools const & pools,
	pooled_brush const & brush,
	unit_usage const & usage
) {
	brush_cost cost{ .newPoints = 0,
					 .newPlanes = 0,
					 .surfaces = brush.surfaces.size() };
	std::unordered_set<point_index> seenPoints;
	std::unordered_set<plane_index> seenPlanes;
	for (surface_index s : brush.surfaces) {
		pooled_surface const & surface = pools.surfaces[s];
		for (point_index p : surface.points) {
			if (!usage.points.contains(p) && seenPoints.insert(p).second) {
				++cost.newPoints;
			}
		}
		if (!usage.planes.contains(surface.plane)
			&& seenPlanes.insert(surface.plane).second) {
			++cost.newPlanes;
		}
	}
	return cost;
}

static bool fits(
	unit_usage const & usage,
	brush_cost const & cost,
	capacity_limits const & limits
) noexcept {
	return usage.points.size() + cost.newPoints <= limits.maxPoints
		&& usage.planes.size() + cost.newPlanes <= limits.maxPlanes
		&& usage.numSurfaces + cost.surfaces <= limits.maxSurfaces;
}

std::expected<std::vector<geometry_pools>, conversion_error>
split_by_capacity(geometry_pools const & pools, capacity_limits const & limits) {
	std::vector<std::vector<std::size_t>> unitBrushes;
	unit_usage usage{};

	for (std::size_t brushNumber = 0; brushNumber != pools.brushes.size();
		 ++brushNumber) {
		pooled_brush const & brush = pools.brushes[brushNumber];
		brush_cost cost = cost_of_adding(pools, brush, usage);

		if (!fits(usage, cost, limits)) {
			if (!usage.brushes.empty()) {
				unitBrushes.emplace_back(std::move(usage.brushes));
				usage = unit_usage{};
				cost = cost_of_adding(pools, brush, usage);
			}
			if (!fits(usage, cost, limits)) [[unlikely]] {
				return std::unexpected(make_conversion_error(
					conversion_msg::capacity_exceeded,
					"brush %d needs %zu points, %zu planes and %zu surfaces; one interior holds at most %zu, %zu and %zu",
					brush.id,
					cost.newPoints,
					cost.newPlanes,
					cost.surfaces,
					limits.maxPoints,
					limits.maxPlanes,
					limits.maxSurfaces
				));
			}
		}

		usage.brushes.push_back(brushNumber);
		usage.numSurfaces += cost.surfaces;
		for (surface_index s : brush.surfaces) {
			pooled_surface const & surface = pools.surfaces[s];
			usage.points.insert(surface.points.begin(), surface.points.end());
			usage.planes.insert(surface.plane);
		}
	}
	if (!usage.brushes.empty() || unitBrushes.empty()) {
		unitBrushes.emplace_back(std::move(usage.brushes));
	}

	if (unitBrushes.size() > 1) {
		Developer(
			developer_level::message,
			"Split %zu brushes into %zu interiors\n",
			pools.brushes.size(),
			unitBrushes.size()
		);
	}

	std::vector<geometry_pools> units;
	units.reserve(unitBrushes.size());
	for (std::vector<std::size_t> const & brushes : unitBrushes) {
		units.emplace_back(extract_brushes(pools, brushes));
	}
	return units;
}

std::expected<geometry_pools, conversion_error> fit_in_one_unit(
	geometry_pools const & pools,
	capacity_limits const & limits,
	char const * what
) {
	std::expected<std::vector<geometry_pools>, conversion_error> units
		= split_by_capacity(pools, limits);
	if (!units) [[unlikely]] {
		return std::unexpected(std::move(units.error()));
	}
	if (units.value().size() != 1) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::capacity_exceeded,
			"%s needs %zu interiors but can not be split",
			what,
			units.value().size()
		));
	}
	return std::move(units.value().front());
}
