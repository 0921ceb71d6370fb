#include "dif_assembler.h"

#include "bounding_box.h"
#include "dif_stream.h"
#include "log.h"
#include "mathlib.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <optional>
#include <span>
#include <utility>

constexpr std::uint8_t surface_flag_outside_visible = 0x10;
constexpr std::uint16_t lightmap_size = 32;
constexpr std::uint32_t no_alarm_lightmap = 0xFFFF'FFFF;
constexpr std::uint32_t min_pixels = 250;
constexpr std::size_t num_coord_bins_per_axis = 16;
constexpr std::size_t max_poly_list_groups = 8;
constexpr std::uint8_t material_list_version = 1;
constexpr std::uint32_t game_entities_marker = 2;

texgen_equation make_texgen_equation(surface_attributes const & attributes) {
	csx_texgen const & authored = attributes.texgen;
	double3_array axisU{ authored.planeX[0],
						 authored.planeX[1],
						 authored.planeX[2] };
	double3_array axisV{ authored.planeY[0],
						 authored.planeY[1],
						 authored.planeY[2] };

	if (std::fmod(authored.rotation, 360.0) != 0.0) {
		double3_array up = cross_product(axisU, axisV);
		if (normalize_vector(up) != 0.0) {
			axisU = rotate_around_axis(axisU, up, authored.rotation);
			axisV = rotate_around_axis(axisV, up, authored.rotation);
		}
	}

	std::optional<double3x3_array> const normalTransform
		= linear_inverse_transpose(attributes.brushTransform);
	double3_array const translation = matrix_translation(
		attributes.brushTransform
	);

	auto const finishAxis = [&](double3_array const & axis,
								double dist,
								std::size_t index) -> double4_array {
		double const scale = authored.scale[index] == 0.0
			? 1.0
			: authored.scale[index];
		double const texDiv = double(attributes.texDiv[index]);
		double3_array normal = vector_scale(
			axis, (1.0 / scale) * (double(attributes.brushScale) / texDiv)
		);
		dist /= texDiv;

		// Keep u and v attached to the transformed brush: with
		// p' = L p + t, the equation becomes (L^-T a) . p' + d - a' . t
		if (normalTransform) {
			normal = multiply_3x3(normalTransform.value(), normal);
			dist -= dot_product(normal, translation);
		}
		return { normal[0], normal[1], normal[2], dist };
	};

	return texgen_equation{
		.planeX = finishAxis(axisU, authored.planeX[3], 0),
		.planeY = finishAxis(axisV, authored.planeY[3], 1)
	};
}

namespace {
	struct dif_bsp_node final {
		std::uint16_t planeIndex;
		std::uint32_t front;
		std::uint32_t back;
	};

	struct dif_solid_leaf final {
		std::uint32_t surfaceStart;
		std::uint16_t surfaceCount;
	};

	struct dif_surface final {
		std::uint32_t windingStart;
		std::uint32_t windingCount;
		std::uint16_t planeIndex;
		std::uint16_t textureIndex;
		std::uint32_t texgenIndex;
		std::uint32_t fanMask;
	};

	struct dif_convex_hull final {
		std::uint32_t hullStart;
		std::uint16_t hullCount;
		float3_array mins;
		float3_array maxs;
		std::uint32_t surfaceStart;
		std::uint16_t surfaceCount;
		std::uint32_t planeStart;
		std::uint32_t polyListPlaneStart{};
		std::uint32_t polyListPointStart{};
		std::uint32_t polyListStringStart{};
	};

	struct dif_coord_bin final {
		std::uint32_t binStart;
		std::uint32_t binCount;
	};

	// A hull surface in terms of hull-local point numbers
	struct hull_polygon final {
		std::vector<std::size_t> points;
		plane_index plane;
	};

	// Builds the lists of one interior, then writes them in file order
	class interior_assembler final {
	  private:
		dif_format const & format;
		bool sizeReduced;
		interior_source const & source;

		bounding_box bounds{ empty_bounding_box };

		std::vector<double3_array> normals;
		std::vector<std::uint16_t> planeNormalIndices;
		std::vector<texgen_equation> texgens;
		std::vector<std::u8string> materials;
		std::vector<std::uint32_t> windings;
		std::vector<dif_surface> surfaces;

		std::vector<dif_bsp_node> bspNodes;
		std::vector<dif_solid_leaf> solidLeaves;
		std::vector<std::uint32_t> solidLeafSurfaces;
		bool oversizedLeaf{ false };

		std::vector<dif_convex_hull> hulls;
		std::vector<std::uint8_t> emitStringCharacters;
		std::map<std::vector<std::uint8_t>, std::uint32_t> emitStringOffsets;
		std::vector<std::uint32_t> hullIndices;
		std::vector<std::uint16_t> hullPlaneIndices;
		std::vector<std::uint32_t> hullEmitStringIndices;
		std::vector<std::uint32_t> hullSurfaceIndices;
		std::vector<std::uint16_t> polyListPlanes;
		std::vector<std::uint32_t> polyListPoints;
		std::vector<std::uint8_t> polyListStrings;

		std::array<dif_coord_bin, 256> coordBins{};
		std::vector<std::uint16_t> coordBinIndices;

		std::expected<void, conversion_error> export_surfaces();
		std::expected<void, conversion_error> export_bsp();
		std::uint32_t
		export_bsp_leaf(std::vector<surface_index> const & leafSurfaces);
		std::expected<void, conversion_error> export_convex_hulls();
		std::uint32_t export_emit_string(std::vector<std::uint8_t> string);
		std::expected<void, conversion_error> export_poly_list(
			pooled_brush const & brush, dif_convex_hull& hull
		);
		void export_coord_bins();

		void write_ambient_color(dif_stream& out, double3_array const & color)
			const;

	  public:
		interior_assembler(
			dif_format const & f,
			bool reduceSize,
			interior_source const & interiorSource
		) :
			format(f),
			sizeReduced(reduceSize),
			source(interiorSource) { }

		std::expected<void, conversion_error> build();
		void write(dif_stream& out) const;
	};
} // namespace

static conversion_error
interior_limit_error(std::int32_t brushId, char const * what) {
	return make_conversion_error(
		conversion_msg::capacity_exceeded,
		"brush %d: %s does not fit the interior format",
		brushId,
		what
	);
}

std::expected<void, conversion_error> interior_assembler::build() {
	geometry_pools const & pools = source.pools;

	for (double3_array const & point : pools.points) {
		add_to_bounding_box(bounds, point);
	}
	if (pools.points.empty()) {
		bounds = bounding_box{};
	}

	std::map<double3_array, std::uint16_t> normalIndices;
	for (pooled_plane const & plane : pools.planes) {
		auto const [it, inserted] = normalIndices.try_emplace(
			plane.normal, std::uint16_t(normals.size())
		);
		if (inserted) {
			normals.push_back(plane.normal);
		}
		planeNormalIndices.push_back(it->second);
	}

	return export_surfaces()
		.and_then([this]() { return export_bsp(); })
		.and_then([this]() { return export_convex_hulls(); })
		.transform([this]() { export_coord_bins(); });
}

std::expected<void, conversion_error> interior_assembler::export_surfaces() {
	geometry_pools const & pools = source.pools;
	if (pools.surfaces.size() > 0xFFFF) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::capacity_exceeded,
			"%zu surfaces do not fit the zone surface list",
			pools.surfaces.size()
		));
	}

	for (pooled_surface const & surface : pools.surfaces) {
		std::size_t const n = surface.points.size();
		if (n > 0xFF && !format.wide_lightmap_fields()) [[unlikely]] {
			return std::unexpected(interior_limit_error(
				surface.brushId, "a face with more than 255 points"
			));
		}

		texgen_equation const texgen = make_texgen_equation(
			surface.attributes
		);
		auto texgenIt = std::ranges::find(texgens, texgen);
		std::uint32_t const texgenIndex = texgenIt - texgens.begin();
		if (texgenIt == texgens.end()) {
			texgens.push_back(texgen);
		}

		auto materialIt = std::ranges::find(
			materials, surface.attributes.material
		);
		std::uint16_t const textureIndex = materialIt - materials.begin();
		if (materialIt == materials.end()) {
			materials.push_back(surface.attributes.material);
		}

		// Triangle strip order: 0, 1, n-1, 2, n-2, 3...
		std::uint32_t const windingStart = windings.size();
		for (std::size_t i = 0; i != n; ++i) {
			std::size_t pointNumber;
			if (i < 2) {
				pointNumber = i;
			} else if (i % 2 == 0) {
				pointNumber = n - 1 - (i - 2) / 2;
			} else {
				pointNumber = (i + 1) / 2;
			}
			windings.push_back(surface.points[pointNumber]);
		}

		surfaces.emplace_back(dif_surface{
			.windingStart = windingStart,
			.windingCount = std::uint32_t(n),
			.planeIndex = std::uint16_t(surface.plane),
			.textureIndex = textureIndex,
			.texgenIndex = texgenIndex,
			.fanMask = n >= 32 ? 0xFFFF'FFFFu : (1u << n) - 1 });
	}
	if (materials.size() > 0xFFFF) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::capacity_exceeded,
			"%zu materials do not fit the material list",
			materials.size()
		));
	}
	return {};
}

std::uint32_t interior_assembler::export_bsp_leaf(
	std::vector<surface_index> const & leafSurfaces
) {
	if (leafSurfaces.empty()) {
		return format.bsp_leaf_flag();
	}
	if (leafSurfaces.size() > 0xFFFF) [[unlikely]] {
		oversizedLeaf = true;
	}
	std::uint32_t const leafIndex = solidLeaves.size();
	solidLeaves.emplace_back(dif_solid_leaf{
		.surfaceStart = std::uint32_t(solidLeafSurfaces.size()),
		.surfaceCount = std::uint16_t(leafSurfaces.size()) });
	solidLeafSurfaces.insert(
		solidLeafSurfaces.end(), leafSurfaces.begin(), leafSurfaces.end()
	);
	return format.bsp_leaf_flag() | format.bsp_solid_flag() | leafIndex;
}

static void append_distinct(
	std::vector<surface_index>& to, std::span<surface_index const> from
) {
	for (surface_index s : from) {
		if (!std::ranges::contains(to, s)) {
			to.push_back(s);
		}
	}
}

// Surfaces that lie on a node's plane are written into every solid leaf of
// the node's back subtree
std::expected<void, conversion_error> interior_assembler::export_bsp() {
	std::vector<bsp_node> const & nodes = source.tree.nodes;
	geometry_pools const & pools = source.pools;

	if (nodes.empty() || pools.planes.empty()) {
		return {};
	}

	if (nodes[0].isLeaf) {
		std::uint32_t const back = export_bsp_leaf(nodes[0].surfaces);
		bspNodes.emplace_back(dif_bsp_node{
			.planeIndex = 0, .front = format.bsp_leaf_flag(), .back = back });
		return {};
	}

	std::vector<std::uint32_t> difNodeIndex(nodes.size(), 0);
	std::uint32_t numInternal = 0;
	for (std::size_t i = 0; i != nodes.size(); ++i) {
		if (!nodes[i].isLeaf) {
			difNodeIndex[i] = numInternal++;
		}
	}
	if (numInternal >= format.bsp_solid_flag()) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::capacity_exceeded,
			"%u BSP nodes do not fit the BSP node indices",
			numInternal
		));
	}

	std::vector<std::vector<surface_index>> inherited(nodes.size());
	auto const childReference = [&](bsp_node_index child) -> std::uint32_t {
		bsp_node const & node = nodes[child];
		if (!node.isLeaf) {
			return difNodeIndex[child];
		}
		std::vector<surface_index> leafSurfaces = node.surfaces;
		append_distinct(leafSurfaces, inherited[child]);
		inherited[child].clear();
		return export_bsp_leaf(leafSurfaces);
	};

	for (std::size_t i = 0; i != nodes.size(); ++i) {
		bsp_node const & node = nodes[i];
		if (node.isLeaf) {
			continue;
		}
		inherited[node.front] = inherited[i];
		inherited[node.back] = std::move(inherited[i]);
		append_distinct(inherited[node.back], node.surfaces);
		inherited[i].clear();

		std::uint32_t const front = childReference(node.front);
		std::uint32_t const back = childReference(node.back);
		bspNodes.emplace_back(dif_bsp_node{
			.planeIndex = std::uint16_t(node.planeNumber),
			.front = front,
			.back = back });
	}

	if (solidLeaves.size() >= format.bsp_solid_flag()) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::capacity_exceeded,
			"%zu solid leaves do not fit the BSP leaf indices",
			solidLeaves.size()
		));
	}
	if (oversizedLeaf) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::capacity_exceeded,
			"a BSP leaf holds more than 65535 surfaces"
		));
	}
	return {};
}

std::uint32_t
interior_assembler::export_emit_string(std::vector<std::uint8_t> string) {
	auto const [it, inserted] = emitStringOffsets.try_emplace(
		string, std::uint32_t(emitStringCharacters.size())
	);
	if (inserted) {
		emitStringCharacters.insert(
			emitStringCharacters.end(), string.begin(), string.end()
		);
	}
	return it->second;
}

// Emit string of one hull point: the points, edges and polygons touching
// it, plus the polygons that share a plane with those. std::nullopt if any
// count does not fit a byte
static std::optional<std::vector<std::uint8_t>> make_emit_string(
	std::span<hull_polygon const> polygons, std::size_t hullPoint
) {
	std::vector<std::size_t> emitPolygons;
	for (std::size_t j = 0; j != polygons.size(); ++j) {
		if (std::ranges::contains(polygons[j].points, hullPoint)) {
			emitPolygons.push_back(j);
		}
	}
	std::size_t const numTouching = emitPolygons.size();
	for (std::size_t j = 0; j != polygons.size(); ++j) {
		if (std::ranges::contains(emitPolygons, j)) {
			continue;
		}
		for (std::size_t e = 0; e != numTouching; ++e) {
			if (polygons[emitPolygons[e]].plane == polygons[j].plane) {
				emitPolygons.push_back(j);
				break;
			}
		}
	}

	std::vector<std::size_t> emitPoints;
	std::vector<std::pair<std::size_t, std::size_t>> emitEdges;
	auto const offsetOf = [&emitPoints](std::size_t point) {
		return std::size_t(std::ranges::find(emitPoints, point)
						   - emitPoints.begin());
	};
	for (std::size_t j : emitPolygons) {
		for (std::size_t point : polygons[j].points) {
			if (!std::ranges::contains(emitPoints, point)) {
				emitPoints.push_back(point);
			}
		}
	}
	for (std::size_t j : emitPolygons) {
		std::vector<std::size_t> const & points = polygons[j].points;
		for (std::size_t k = 0; k != points.size(); ++k) {
			std::size_t const a = offsetOf(points[k]);
			std::size_t const b = offsetOf(points[(k + 1) % points.size()]);
			std::pair<std::size_t, std::size_t> const edge{ std::min(a, b),
															std::max(a, b) };
			if (!std::ranges::contains(emitEdges, edge)) {
				emitEdges.push_back(edge);
			}
		}
	}

	if (emitPoints.size() > 0xFF || emitEdges.size() > 0xFF
		|| emitPolygons.size() > 0xFF) {
		return std::nullopt;
	}

	std::vector<std::uint8_t> string;
	string.push_back(std::uint8_t(emitPoints.size()));
	for (std::size_t point : emitPoints) {
		string.push_back(std::uint8_t(point));
	}
	string.push_back(std::uint8_t(emitEdges.size()));
	for (auto const & [first, last] : emitEdges) {
		string.push_back(std::uint8_t(first));
		string.push_back(std::uint8_t(last));
	}
	string.push_back(std::uint8_t(emitPolygons.size()));
	for (std::size_t j : emitPolygons) {
		std::vector<std::size_t> const & points = polygons[j].points;
		if (points.size() > 0xFF || j > 0xFF) {
			return std::nullopt;
		}
		string.push_back(std::uint8_t(points.size()));
		string.push_back(std::uint8_t(j));
		for (std::size_t point : points) {
			string.push_back(std::uint8_t(offsetOf(point)));
		}
	}
	return string;
}

std::expected<void, conversion_error>
interior_assembler::export_convex_hulls() {
	geometry_pools const & pools = source.pools;
	for (pooled_brush const & brush : pools.brushes) {
		if (brush.hullPoints.size() > 0xFFFF
			|| brush.surfaces.size() > 0xFFFF) [[unlikely]] {
			return std::unexpected(
				interior_limit_error(brush.id, "the convex hull")
			);
		}

		bounding_box hullBounds{ empty_bounding_box };
		for (point_index p : brush.hullPoints) {
			add_to_bounding_box(hullBounds, pools.points[p]);
		}

		dif_convex_hull hull{
			.hullStart = std::uint32_t(hullIndices.size()),
			.hullCount = std::uint16_t(brush.hullPoints.size()),
			.mins = to_float3(hullBounds.mins),
			.maxs = to_float3(hullBounds.maxs),
			.surfaceStart = std::uint32_t(hullSurfaceIndices.size()),
			.surfaceCount = std::uint16_t(brush.surfaces.size()),
			.planeStart = std::uint32_t(hullPlaneIndices.size())
		};
		hullIndices.insert(
			hullIndices.end(), brush.hullPoints.begin(), brush.hullPoints.end()
		);
		hullSurfaceIndices.insert(
			hullSurfaceIndices.end(),
			brush.surfaces.begin(),
			brush.surfaces.end()
		);

		if (!sizeReduced) {
			std::vector<hull_polygon> polygons;
			for (surface_index s : brush.surfaces) {
				pooled_surface const & surface = pools.surfaces[s];
				hullPlaneIndices.push_back(std::uint16_t(surface.plane));

				hull_polygon polygon{ .points = {}, .plane = surface.plane };
				for (point_index p : surface.points) {
					polygon.points.push_back(std::size_t(
						std::ranges::find(brush.hullPoints, p)
						- brush.hullPoints.begin()
					));
				}
				polygons.push_back(std::move(polygon));
			}

			bool warned = false;
			for (std::size_t i = 0; i != brush.hullPoints.size(); ++i) {
				std::optional<std::vector<std::uint8_t>> string;
				if (brush.hullPoints.size() <= 0xFF) {
					string = make_emit_string(polygons, i);
				}
				if (!string) {
					if (!warned) {
						Warning(
							"Brush %d is too complex for collision emit strings, its hull will not collide",
							brush.id
						);
						warned = true;
					}
					string = std::vector<std::uint8_t>{ 0, 0, 0 };
				}
				hullEmitStringIndices.push_back(
					export_emit_string(std::move(string.value()))
				);
			}

			if (auto result = export_poly_list(brush, hull); !result)
				[[unlikely]] {
				return result;
			}
		}
		hulls.push_back(hull);
	}

	if (sizeReduced) {
		// Torque still expects one element in each of these lists
		polyListPlanes.push_back(0);
		polyListPoints.push_back(0);
		polyListStrings.push_back(0);
		hullPlaneIndices.push_back(0);
		hullEmitStringIndices.push_back(0);
		emitStringCharacters.push_back(0);
	}
	return {};
}

// Groups the hull's planes into at most 8 masks, merging the groups whose
// normals are the furthest apart, and writes the poly list string
std::expected<void, conversion_error> interior_assembler::export_poly_list(
	pooled_brush const & brush, dif_convex_hull& hull
) {
	geometry_pools const & pools = source.pools;

	struct poly_list_surface final {
		plane_index plane;
		std::vector<std::size_t> points; // Offsets into pointIndices
		std::uint8_t mask{};
	};

	std::vector<plane_index> planeIndices;
	std::vector<point_index> pointIndices;
	std::vector<poly_list_surface> polySurfaces;
	for (surface_index s : brush.surfaces) {
		pooled_surface const & surface = pools.surfaces[s];
		if (!std::ranges::contains(planeIndices, surface.plane)) {
			planeIndices.push_back(surface.plane);
		}
		poly_list_surface polySurface{ .plane = surface.plane, .points = {} };
		for (point_index p : surface.points) {
			auto it = std::ranges::find(pointIndices, p);
			polySurface.points.push_back(std::size_t(it - pointIndices.begin())
			);
			if (it == pointIndices.end()) {
				pointIndices.push_back(p);
			}
		}
		polySurfaces.push_back(std::move(polySurface));
	}

	if (planeIndices.size() >= 256 || pointIndices.size() >= 65536
		|| polySurfaces.size() >= 256) [[unlikely]] {
		return std::unexpected(
			interior_limit_error(brush.id, "the collision poly list")
		);
	}

	std::vector<std::vector<plane_index>> groups;
	for (plane_index p : planeIndices) {
		groups.push_back({ p });
	}
	while (groups.size() > max_poly_list_groups) {
		double closestDot = 2.0;
		std::size_t first = 0;
		std::size_t second = 1;
		for (std::size_t j = 0; j != groups.size(); ++j) {
			for (std::size_t k = j + 1; k != groups.size(); ++k) {
				double maxDot = -2.0;
				for (plane_index a : groups[j]) {
					for (plane_index b : groups[k]) {
						maxDot = std::max(
							maxDot,
							dot_product(
								pools.planes[a].normal, pools.planes[b].normal
							)
						);
					}
				}
				if (maxDot < closestDot) {
					closestDot = maxDot;
					first = j;
					second = k;
				}
			}
		}
		groups[first].insert(
			groups[first].end(), groups[second].begin(), groups[second].end()
		);
		groups.erase(groups.begin() + second);
	}

	auto const maskOf = [&groups](plane_index plane) -> std::uint8_t {
		for (std::size_t j = 0; j != groups.size(); ++j) {
			if (std::ranges::contains(groups[j], plane)) {
				return std::uint8_t(1u << j);
			}
		}
		return 0;
	};

	std::vector<std::uint8_t> pointMasks(pointIndices.size(), 0);
	for (poly_list_surface& surface : polySurfaces) {
		surface.mask = maskOf(surface.plane);
		for (std::size_t point : surface.points) {
			pointMasks[point] |= surface.mask;
		}
	}

	hull.polyListPlaneStart = polyListPlanes.size();
	for (plane_index p : planeIndices) {
		polyListPlanes.push_back(std::uint16_t(p));
	}
	hull.polyListPointStart = polyListPoints.size();
	polyListPoints.insert(
		polyListPoints.end(), pointIndices.begin(), pointIndices.end()
	);

	// NumPlanes (PlaneMask)*NumPlanes
	// NumPointsHi NumPointsLo (PointMask)*NumPoints
	// NumSurfaces (NumPoints Mask PlaneOffset (OffsetHi OffsetLo)*NumPoints)*
	hull.polyListStringStart = polyListStrings.size();
	polyListStrings.push_back(std::uint8_t(planeIndices.size()));
	for (plane_index p : planeIndices) {
		polyListStrings.push_back(maskOf(p));
	}
	polyListStrings.push_back(std::uint8_t(pointIndices.size() >> 8));
	polyListStrings.push_back(std::uint8_t(pointIndices.size() & 0xFF));
	polyListStrings.insert(
		polyListStrings.end(), pointMasks.begin(), pointMasks.end()
	);
	polyListStrings.push_back(std::uint8_t(polySurfaces.size()));
	for (poly_list_surface const & surface : polySurfaces) {
		polyListStrings.push_back(std::uint8_t(surface.points.size()));
		polyListStrings.push_back(surface.mask);
		polyListStrings.push_back(std::uint8_t(
			std::ranges::find(planeIndices, surface.plane)
			- planeIndices.begin()
		));
		for (std::size_t point : surface.points) {
			polyListStrings.push_back(std::uint8_t(point >> 8));
			polyListStrings.push_back(std::uint8_t(point & 0xFF));
		}
	}
	return {};
}

// 16x16 bins over the XY extent of the interior, each listing the hulls
// that overlap it
void interior_assembler::export_coord_bins() {
	float3_array const mins = to_float3(bounds.mins);
	float3_array const extent = to_float3(bounding_box_extent(bounds));
	float const binsPerAxis = float(num_coord_bins_per_axis);

	for (std::size_t i = 0; i != num_coord_bins_per_axis; ++i) {
		float const minX = mins[0] + float(i) * extent[0] / binsPerAxis;
		float const maxX = mins[0] + float(i + 1) * extent[0] / binsPerAxis;
		for (std::size_t j = 0; j != num_coord_bins_per_axis; ++j) {
			float const minY = mins[1] + float(j) * extent[1] / binsPerAxis;
			float const maxY = mins[1]
				+ float(j + 1) * extent[1] / binsPerAxis;

			dif_coord_bin& bin = coordBins[i * num_coord_bins_per_axis + j];
			bin.binStart = coordBinIndices.size();
			for (std::size_t k = 0; k != hulls.size(); ++k) {
				dif_convex_hull const & hull = hulls[k];
				if (!(minX > hull.maxs[0] || maxX < hull.mins[0]
					  || minY > hull.maxs[1] || maxY < hull.mins[1])) {
					coordBinIndices.push_back(std::uint16_t(k));
				}
			}
			bin.binCount = coordBinIndices.size() - bin.binStart;
		}
	}
}

void interior_assembler::write_ambient_color(
	dif_stream& out, double3_array const & color
) const {
	for (std::size_t i = 0; i != 3; ++i) {
		out.write_u8(
			sizeReduced ? 0 : std::uint8_t(std::clamp(color[i], 0.0, 255.0))
		);
	}
	out.write_u8(255);
}

void interior_assembler::write(dif_stream& out) const {
	geometry_pools const & pools = source.pools;
	bool const wideFields = format.wide_lightmap_fields();
	auto const writeWideOrByte = [&out, wideFields](std::uint32_t value) {
		if (wideFields) {
			out.write_u32(value);
		} else {
			out.write_u8(std::uint8_t(value));
		}
	};

	out.write_u32(format.version());
	out.write_u32(source.detailLevel);
	out.write_u32(min_pixels);
	float3_array const mins = to_float3(bounds.mins);
	float3_array const maxs = to_float3(bounds.maxs);
	for (float f : mins) {
		out.write_f32(f);
	}
	for (float f : maxs) {
		out.write_f32(f);
	}
	out.write_point(bounding_box_center(bounds));
	out.write_f32(float(bounding_box_radius(bounds)));
	out.write_u8(0); // No alarm state
	out.write_u32(0); // Light state entries

	out.write_u32(normals.size());
	for (double3_array const & normal : normals) {
		out.write_point(normal);
	}
	out.write_u32(pools.planes.size());
	for (std::size_t i = 0; i != pools.planes.size(); ++i) {
		out.write_u16(planeNormalIndices[i]);
		// Torque planes are n . p + d == 0
		out.write_f32(float(-pools.planes[i].dist));
	}
	out.write_u32(pools.points.size());
	for (double3_array const & point : pools.points) {
		out.write_point(point);
	}
	out.write_u32(pools.points.size());
	for (std::size_t i = 0; i != pools.points.size(); ++i) {
		out.write_u8(0xFF);
	}

	out.write_u32(texgens.size());
	for (texgen_equation const & texgen : texgens) {
		for (double v : texgen.planeX) {
			out.write_f32(float(v));
		}
		for (double v : texgen.planeY) {
			out.write_f32(float(v));
		}
	}

	out.write_u32(bspNodes.size());
	for (dif_bsp_node const & node : bspNodes) {
		out.write_u16(node.planeIndex);
		if (format.wide_bsp_indices()) {
			out.write_u32(node.front);
			out.write_u32(node.back);
		} else {
			out.write_u16(std::uint16_t(node.front));
			out.write_u16(std::uint16_t(node.back));
		}
	}
	out.write_u32(solidLeaves.size());
	for (dif_solid_leaf const & leaf : solidLeaves) {
		out.write_u32(leaf.surfaceStart);
		out.write_u16(leaf.surfaceCount);
	}

	out.write_u8(material_list_version);
	out.write_u32(materials.size());
	for (std::u8string const & material : materials) {
		out.write_string(material);
	}

	out.write_u32_vector(windings);
	out.write_u32(0); // Winding indices
	if (format.has_edges()) {
		out.write_u32(0);
	}

	// A single zone holding every surface
	out.write_u32(1);
	out.write_u16(0);
	out.write_u16(0);
	out.write_u32(0);
	out.write_u32(surfaces.size());
	if (format.has_edges()) {
		out.write_u32(0);
		out.write_u32(0);
	}
	out.write_u16(0);

	out.write_u32(surfaces.size());
	for (std::size_t i = 0; i != surfaces.size(); ++i) {
		out.write_u16(std::uint16_t(i));
	}
	if (format.has_edges()) {
		out.write_u32(0); // Zone static meshes
	}
	out.write_u32(0); // Zone portal list
	out.write_u32(0); // Portals

	out.write_u32(surfaces.size());
	for (dif_surface const & surface : surfaces) {
		out.write_u32(surface.windingStart);
		writeWideOrByte(surface.windingCount);
		out.write_u16(surface.planeIndex);
		out.write_u16(surface.textureIndex);
		out.write_u32(surface.texgenIndex);
		out.write_u8(surface_flag_outside_visible);
		out.write_u32(surface.fanMask);
		out.write_u16(0); // Lightmap final word
		out.write_f32(0.0f);
		out.write_f32(0.0f);
		out.write_u16(0); // Light count
		out.write_u32(0); // Light state info start
		writeWideOrByte(0);
		writeWideOrByte(0);
		writeWideOrByte(lightmap_size);
		writeWideOrByte(lightmap_size);
	}

	if (format.has_legacy_edges()) {
		out.write_u32(0);
	}
	if (format.has_legacy_normals()) {
		if (sizeReduced) {
			out.write_u32(0);
		} else {
			out.write_vector(
				std::span<double3_array const>{ normals },
				[](dif_stream& o, double3_array const & normal) {
					o.write_point(normal);
				}
			);
		}
		out.write_u32(0); // Normal indices
	}

	out.write_u32(surfaces.size());
	for (std::size_t i = 0; i != surfaces.size(); ++i) {
		writeWideOrByte(0);
	}
	out.write_u32(surfaces.size());
	for (std::size_t i = 0; i != surfaces.size(); ++i) {
		writeWideOrByte(no_alarm_lightmap);
	}
	out.write_u32(0); // Null surfaces
	out.write_u32(0); // Lightmaps

	out.write_u32_vector(solidLeafSurfaces);

	out.write_u32(0); // Animated lights
	out.write_u32(0); // Light states
	out.write_u32(0); // State datas
	out.write_u32(0); // State data buffers
	out.write_u32(0); // State data flags
	out.write_u32(0); // Name buffer
	out.write_u32(0); // Sub-objects

	out.write_u32(hulls.size());
	for (dif_convex_hull const & hull : hulls) {
		out.write_u32(hull.hullStart);
		out.write_u16(hull.hullCount);
		for (std::size_t axis = 0; axis != 3; ++axis) {
			out.write_f32(hull.mins[axis]);
			out.write_f32(hull.maxs[axis]);
		}
		out.write_u32(hull.surfaceStart);
		out.write_u16(hull.surfaceCount);
		out.write_u32(hull.planeStart);
		out.write_u32(hull.polyListPlaneStart);
		out.write_u32(hull.polyListPointStart);
		out.write_u32(hull.polyListStringStart);
		if (format.has_edges()) {
			out.write_u8(0); // Not a static mesh
		}
	}

	out.write_u32(emitStringCharacters.size());
	for (std::uint8_t c : emitStringCharacters) {
		out.write_u8(c);
	}
	out.write_u32_vector(hullIndices);
	out.write_u16_vector(hullPlaneIndices);
	out.write_u32_vector(hullEmitStringIndices);
	out.write_u32_vector(hullSurfaceIndices);
	out.write_u16_vector(polyListPlanes);
	out.write_u32_vector(polyListPoints);
	out.write_u32(polyListStrings.size());
	for (std::uint8_t c : polyListStrings) {
		out.write_u8(c);
	}

	for (dif_coord_bin const & bin : coordBins) {
		out.write_u32(bin.binStart);
		out.write_u32(bin.binCount);
	}
	out.write_u16_vector(coordBinIndices);
	out.write_u32(0); // Coord bin mode

	write_ambient_color(out, source.ambientColor);
	write_ambient_color(out, source.ambientColorEmergency);

	if (format.has_static_meshes()) {
		out.write_u32(0);
	}
	if (format.has_texture_matrices()) {
		out.write_u32(0); // Texture normals
		out.write_u32(0); // Texture matrices
		out.write_u32(0); // Texture matrix indices
	}
	out.write_u32(0); // No extended lightmap data
}

std::expected<std::vector<std::byte>, conversion_error> assemble_interior(
	dif_format const & format,
	bool sizeReduced,
	interior_source const & source
) {
	interior_assembler assembler{ format, sizeReduced, source };
	return assembler.build().transform([&assembler]() {
		dif_stream out;
		assembler.write(out);
		return std::move(out).take();
	});
}

// An axis-aligned box in Torque's polyhedron layout
static void write_box_polyhedron(dif_stream& out, bounding_box const & box) {
	double3_array const & lo = box.mins;
	double3_array const & hi = box.maxs;
	std::array<double3_array, 8> const points{
		double3_array{ lo[0], lo[1], hi[2] }, double3_array{ lo[0], hi[1], hi[2] },
		double3_array{ hi[0], hi[1], hi[2] }, double3_array{ hi[0], lo[1], hi[2] },
		double3_array{ lo[0], lo[1], lo[2] }, double3_array{ lo[0], hi[1], lo[2] },
		double3_array{ hi[0], hi[1], lo[2] }, double3_array{ hi[0], lo[1], lo[2] }
	};
	// -x, +y, +x, -y, +z, -z as n . p + d == 0
	std::array<std::pair<double3_array, double>, 6> const planes{
		std::pair{ double3_array{ -1.0, 0.0, 0.0 }, lo[0] },
		std::pair{ double3_array{ 0.0, 1.0, 0.0 }, -hi[1] },
		std::pair{ double3_array{ 1.0, 0.0, 0.0 }, -hi[0] },
		std::pair{ double3_array{ 0.0, -1.0, 0.0 }, lo[1] },
		std::pair{ double3_array{ 0.0, 0.0, 1.0 }, -hi[2] },
		std::pair{ double3_array{ 0.0, 0.0, -1.0 }, lo[2] }
	};
	// face0, face1, vertex0, vertex1
	constexpr std::array<std::array<std::uint32_t, 4>, 12> edges{ {
		{ 0, 4, 0, 1 },
		{ 5, 0, 4, 5 },
		{ 3, 0, 0, 4 },
		{ 1, 4, 1, 2 },
		{ 5, 1, 5, 6 },
		{ 0, 1, 1, 5 },
		{ 2, 4, 2, 3 },
		{ 5, 2, 6, 7 },
		{ 1, 2, 2, 6 },
		{ 3, 4, 3, 0 },
		{ 5, 3, 7, 4 },
		{ 2, 3, 3, 7 },
	} };

	out.write_u32(points.size());
	for (double3_array const & point : points) {
		out.write_point(point);
	}
	out.write_u32(planes.size());
	for (auto const & [normal, dist] : planes) {
		out.write_point(normal);
		out.write_f32(float(dist));
	}
	out.write_u32(edges.size());
	for (std::array<std::uint32_t, 4> const & edge : edges) {
		for (std::uint32_t v : edge) {
			out.write_u32(v);
		}
	}
}

static void write_trigger(dif_stream& out, dif_trigger const & trigger) {
	out.write_string(trigger.name);
	out.write_string(trigger.datablock);
	out.write_dictionary(trigger.properties);
	write_box_polyhedron(out, trigger.bounds);
	out.write_point(double3_array{}); // Offset
}

static void
write_path_follower(dif_stream& out, dif_path_follower const & follower) {
	out.write_string(follower.name);
	out.write_string(follower.datablock);
	out.write_u32(follower.interiorResIndex);
	out.write_point(follower.offset);
	out.write_dictionary(follower.properties);
	out.write_u32_vector(follower.triggerIds);
	out.write_u32(follower.waypoints.size());
	for (path_waypoint const & waypoint : follower.waypoints) {
		out.write_point(waypoint.position);
		// Identity rotation, x y z w
		out.write_f32(0.0f);
		out.write_f32(0.0f);
		out.write_f32(0.0f);
		out.write_f32(1.0f);
		out.write_u32(waypoint.msToNext);
		out.write_u32(waypoint.smoothing);
	}
	out.write_u32(follower.totalMs);
}

static void write_game_entity(dif_stream& out, dif_game_entity const & entity) {
	out.write_string(entity.datablock);
	out.write_string(entity.gameClass);
	out.write_point(entity.position);
	out.write_dictionary(entity.properties);
}

std::vector<std::byte> assemble_dif(dif_contents const & contents) {
	dif_stream out;
	out.write_u32(dif_format::resource_file_version);
	out.write_u8(0); // No preview bitmap

	auto const writeInteriors = [&out](
									std::vector<std::vector<std::byte>> const &
										interiors
								) {
		out.write_u32(interiors.size());
		for (std::vector<std::byte> const & interior : interiors) {
			out.append(interior);
		}
	};
	writeInteriors(contents.detailLevels);
	writeInteriors(contents.subObjects);

	out.write_vector(std::span{ contents.triggers }, write_trigger);
	out.write_vector(std::span{ contents.pathFollowers }, write_path_follower);
	out.write_u32(0); // Force fields
	out.write_u32(0); // AI special nodes
	out.write_u32(0); // No vehicle collision

	if (contents.gameEntities.empty()) {
		out.write_u32(0);
	} else {
		out.write_u32(game_entities_marker);
		out.write_vector(
			std::span{ contents.gameEntities }, write_game_entity
		);
	}
	out.write_u32(0);
	return std::move(out).take();
}
