#pragma once

#include "csx_document.h"
#include "geometry.h"
#include "winding.h"

#include <cstddef>
#include <vector>

struct ingested_face final {
	// Into ingested_brush::vertices, in winding order
	std::vector<std::uint32_t> vertexIndices;
	winding_plane<double> plane;
	std::int32_t faceId{};
	surface_attributes attributes;
};

struct ingested_brush final {
	std::int32_t id{};
	// With the brush transform applied
	std::vector<double3_array> vertices;
	std::vector<ingested_face> faces;
};

// Applies the brush transform and fits a plane through every face. Faces
// without three non-collinear points are dropped with a warning and
// counted in degenerateFaces
ingested_brush ingest_brush(
	csx_brush const & brush,
	std::uint32_t brushScale,
	std::size_t& degenerateFaces
);
