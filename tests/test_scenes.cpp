#include "test_scenes.h"

#include "brush_ingest.h"
#include "geometry_pools.h"

#include <array>
#include <format>
#include <set>

namespace {
	struct box_face final {
		std::array<std::uint32_t, 4> indices;
		double3_array normal;
	};

	// Counter-clockwise seen from outside the box
	constexpr std::array<box_face, 6> box_faces{
		box_face{ { 0, 3, 2, 1 }, { 0, 0, -1 } },
		box_face{ { 4, 5, 6, 7 }, { 0, 0, 1 } },
		box_face{ { 0, 1, 5, 4 }, { 0, -1, 0 } },
		box_face{ { 3, 7, 6, 2 }, { 0, 1, 0 } },
		box_face{ { 0, 4, 7, 3 }, { -1, 0, 0 } },
		box_face{ { 1, 2, 6, 5 }, { 1, 0, 0 } }
	};
} // namespace

static std::array<double3_array, 8>
box_vertices(double3_array const & mins, double3_array const & maxs) {
	return { double3_array{ mins[0], mins[1], mins[2] },
			 double3_array{ maxs[0], mins[1], mins[2] },
			 double3_array{ maxs[0], maxs[1], mins[2] },
			 double3_array{ mins[0], maxs[1], mins[2] },
			 double3_array{ mins[0], mins[1], maxs[2] },
			 double3_array{ maxs[0], mins[1], maxs[2] },
			 double3_array{ maxs[0], maxs[1], maxs[2] },
			 double3_array{ mins[0], maxs[1], maxs[2] } };
}

static double face_distance(
	box_face const & face, std::array<double3_array, 8> const & vertices
) {
	double3_array const & p = vertices[face.indices[0]];
	return -(face.normal[0] * p[0] + face.normal[1] * p[1]
			 + face.normal[2] * p[2]);
}

static std::string to_narrow(std::u8string_view s) {
	return std::string{ s.begin(), s.end() };
}

static std::string entity_xml(test_entity const & entity) {
	std::string xml = std::format(
		"        <Entity id=\"{}\" classname=\"{}\" gametype=\"Torque\"",
		entity.id,
		to_narrow(entity.classname)
	);
	if (entity.origin) {
		double3_array const & o = entity.origin.value();
		xml += std::format(" origin=\"{} {} {}\"", o[0], o[1], o[2]);
	}
	xml += ">\n          <Properties";
	for (csx_property const & p : entity.properties) {
		xml += std::format(
			" {}=\"{}\"", to_narrow(p.key), to_narrow(p.value)
		);
	}
	xml += " />\n        </Entity>\n";
	return xml;
}

static std::string brush_xml(test_brush const & brush) {
	std::array<double3_array, 8> const vertices = box_vertices(
		brush.mins, brush.maxs
	);
	std::string xml = std::format(
		"        <Brush id=\"{}\" owner=\"{}\" type=\"0\" pos=\"0 0 0\" rot=\"1 0 0 0\" "
		"transform=\"1 0 0 0 0 1 0 0 0 0 1 0 0 0 0 1\" group=\"-1\" locked=\"0\">\n"
		"          <Vertices>\n",
		brush.id,
		brush.owner
	);
	for (double3_array const & v : vertices) {
		xml += std::format(
			"            <Vertex pos=\"{} {} {}\" />\n", v[0], v[1], v[2]
		);
	}
	xml += "          </Vertices>\n";
	for (std::size_t i = 0; i != box_faces.size(); ++i) {
		box_face const & face = box_faces[i];
		xml += std::format(
			"          <Face id=\"{}\" plane=\"{} {} {} {}\" album=\"\" material=\"grid_warm\" "
			"texgens=\"1 0 0 0 0 1 0 0 0 1 1\" texRot=\"0\" texScale=\"1 1\" texDiv=\"16 16\">\n"
			"            <Indices indices=\" {} {} {} {}\" />\n"
			"          </Face>\n",
			i,
			face.normal[0],
			face.normal[1],
			face.normal[2],
			face_distance(face, vertices),
			face.indices[0],
			face.indices[1],
			face.indices[2],
			face.indices[3]
		);
	}
	xml += "        </Brush>\n";
	return xml;
}

std::u8string make_test_csx(std::span<test_detail_level const> detailLevels) {
	std::string xml
		= "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
		  "<ConstructorScene version=\"4\" creator=\"Torque Constructor\" date=\"2026/10/17 12:00:00\">\n"
		  "  <Sunlight azimuth=\"180\" elevation=\"35\" color=\"255 255 255\" ambient=\"64 64 64\" />\n"
		  "  <LightingOptions lightingSystem=\"\" ineditor_defaultLightmapSize=\"256\" />\n"
		  "  <GameTypes>\n    <GameType name=\"Torque\" />\n  </GameTypes>\n"
		  "  <DetailLevels>\n";
	for (test_detail_level const & detailLevel : detailLevels) {
		double3_array const & ambient = detailLevel.ambientColor;
		xml += std::format(
			"    <DetailLevel>\n"
			"      <InteriorMap brushScale=\"{}\" lightScale=\"32\" ambientColor=\"{} {} {}\" ambientColorEmerg=\"0 0 0\">\n"
			"        <Entities>\n",
			detailLevel.brushScale,
			ambient[0],
			ambient[1],
			ambient[2]
		);
		for (test_entity const & entity : detailLevel.entities) {
			xml += entity_xml(entity);
		}
		xml += "        </Entities>\n        <Brushes>\n";
		for (test_brush const & brush : detailLevel.brushes) {
			xml += brush_xml(brush);
		}
		xml += "        </Brushes>\n      </InteriorMap>\n    </DetailLevel>\n";
	}
	xml += "  </DetailLevels>\n</ConstructorScene>\n";
	return std::u8string{ xml.begin(), xml.end() };
}

std::u8string make_test_csx(test_detail_level const & detailLevel) {
	return make_test_csx(std::span{ &detailLevel, 1 });
}

csx_brush make_box_brush(
	std::int32_t id, double3_array const & mins, double3_array const & maxs
) {
	std::array<double3_array, 8> const vertices = box_vertices(mins, maxs);
	csx_brush brush{};
	brush.id = id;
	brush.vertices.assign(vertices.begin(), vertices.end());
	for (std::size_t i = 0; i != box_faces.size(); ++i) {
		box_face const & face = box_faces[i];
		csx_face csxFace{};
		csxFace.id = std::int32_t(i);
		csxFace.plane = { face.normal[0],
						  face.normal[1],
						  face.normal[2],
						  face_distance(face, vertices) };
		csxFace.material = u8"grid_warm";
		csxFace.texgen = csx_texgen{ .planeX = { 1, 0, 0, 0 },
									 .planeY = { 0, 1, 0, 0 },
									 .rotation = 0,
									 .scale = { 1, 1 } };
		csxFace.texDiv = { 16, 16 };
		csxFace.indices.assign(face.indices.begin(), face.indices.end());
		brush.faces.emplace_back(std::move(csxFace));
	}
	return brush;
}

geometry_pools pool_boxes(
	std::span<test_brush const> boxes, double pointEpsilon, double planeEpsilon
) {
	std::size_t degenerateFaces = 0;
	std::vector<ingested_brush> ingested;
	for (test_brush const & box : boxes) {
		ingested.emplace_back(ingest_brush(
			make_box_brush(box.id, box.mins, box.maxs), 32, degenerateFaces
		));
	}
	return deduplicate(ingested, pointEpsilon, planeEpsilon).pools;
}

std::size_t count_used_points(geometry_pools const & pools) {
	std::set<point_index> used;
	for (pooled_surface const & surface : pools.surfaces) {
		used.insert(surface.points.begin(), surface.points.end());
	}
	return used.size();
}
