#include "brush_ingest.h"

#include "log.h"

ingested_brush ingest_brush(
	csx_brush const & brush,
	std::uint32_t brushScale,
	std::size_t& degenerateFaces
) {
	ingested_brush result{};
	result.id = brush.id;
	result.vertices.reserve(brush.vertices.size());
	for (double3_array const & vertex : brush.vertices) {
		result.vertices.push_back(transform_point(brush.transform, vertex));
	}

	std::optional<double3x3_array> const normalTransform
		= linear_inverse_transpose(brush.transform);

	result.faces.reserve(brush.faces.size());
	for (csx_face const & face : brush.faces) {
		accurate_winding winding{};
		for (std::uint32_t index : face.indices) {
			winding.push_point(result.vertices[index]);
		}

		std::optional<winding_plane<double>> maybePlane = winding.getPlane();
		if (!maybePlane) [[unlikely]] {
			Warning(
				"Brush %d face %d has no three non-collinear points and was dropped",
				brush.id,
				face.id
			);
			++degenerateFaces;
			continue;
		}

		// Keep the winding's own orientation unless Constructor says
		// the face points the other way
		winding_plane<double> plane = maybePlane.value();
		double3_array authoredNormal{ face.plane[0],
									  face.plane[1],
									  face.plane[2] };
		if (normalTransform) {
			authoredNormal = multiply_3x3(
				normalTransform.value(), authoredNormal
			);
		}
		if (dot_product(authoredNormal, plane.normal) < 0) {
			plane.normal = negate_vector(plane.normal);
			plane.dist = -plane.dist;
		}

		result.faces.emplace_back(ingested_face{
			.vertexIndices = face.indices,
			.plane = plane,
			.faceId = face.id,
			.attributes = surface_attributes{
				.material = face.material,
				.texgen = face.texgen,
				.texDiv = face.texDiv,
				.brushScale = brushScale,
				.brushTransform = brush.transform } });
	}
	return result;
}
