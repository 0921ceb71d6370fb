#include "csx_document.h"

#include "numeric_string_conversions.h"
#include "xml_reader.h"

#include <utility>

std::optional<std::u8string_view>
csx_entity::property(std::u8string_view key) const noexcept {
	for (csx_property const & p : properties) {
		if (p.key == key) {
			return p.value;
		}
	}
	return std::nullopt;
}

static conversion_error malformed(xml_element const & element, char const * what) {
	return make_conversion_error(
		conversion_msg::malformed_input,
		"line %zu: <%s> %s",
		element.line,
		(char const *) element.name.c_str(),
		what
	);
}

static conversion_error
missing_attribute(xml_element const & element, char const * attributeName) {
	return make_conversion_error(
		conversion_msg::malformed_input,
		"line %zu: <%s> is missing the attribute \"%s\"",
		element.line,
		(char const *) element.name.c_str(),
		attributeName
	);
}

static conversion_error
bad_attribute(xml_element const & element, char const * attributeName) {
	return make_conversion_error(
		conversion_msg::malformed_input,
		"line %zu: <%s> has an invalid \"%s\" value",
		element.line,
		(char const *) element.name.c_str(),
		attributeName
	);
}

template <class Number>
static std::expected<Number, conversion_error> required_number(
	xml_element const & element, char const * attributeName
) {
	std::optional<std::u8string_view> const maybeValue = element.attribute(
		to_u8string_view(attributeName)
	);
	if (!maybeValue) [[unlikely]] {
		return std::unexpected(missing_attribute(element, attributeName));
	}
	std::optional<Number> const maybeNumber = number_from_string<Number>(
		maybeValue.value()
	);
	if (!maybeNumber) [[unlikely]] {
		return std::unexpected(bad_attribute(element, attributeName));
	}
	return maybeNumber.value();
}

template <class Number, std::size_t N>
static std::expected<std::array<Number, N>, conversion_error> required_numbers(
	xml_element const & element, char const * attributeName
) {
	std::optional<std::u8string_view> const maybeValue = element.attribute(
		to_u8string_view(attributeName)
	);
	if (!maybeValue) [[unlikely]] {
		return std::unexpected(missing_attribute(element, attributeName));
	}
	std::optional<std::array<Number, N>> const maybeNumbers
		= numbers_from_string<Number, N>(maybeValue.value());
	if (!maybeNumbers) [[unlikely]] {
		return std::unexpected(bad_attribute(element, attributeName));
	}
	return maybeNumbers.value();
}

static std::expected<std::u8string, conversion_error>
required_string(xml_element const & element, char const * attributeName) {
	std::optional<std::u8string_view> const maybeValue = element.attribute(
		to_u8string_view(attributeName)
	);
	if (!maybeValue) [[unlikely]] {
		return std::unexpected(missing_attribute(element, attributeName));
	}
	return std::u8string{ maybeValue.value() };
}

static std::expected<csx_entity, conversion_error>
parse_entity(xml_element const & element, std::size_t inputOrder) {
	csx_entity entity{};
	entity.inputOrder = inputOrder;

	auto id = required_number<std::int32_t>(element, "id");
	if (!id) [[unlikely]] {
		return std::unexpected(std::move(id.error()));
	}
	entity.id = id.value();

	auto classname = required_string(element, "classname");
	if (!classname) [[unlikely]] {
		return std::unexpected(std::move(classname.error()));
	}
	entity.classname = std::move(classname.value());
	entity.gametype = element.attribute(u8"gametype").value_or(u8"");

	// An empty origin is the same as none
	std::optional<std::u8string_view> const origin = element.attribute(
		u8"origin"
	);
	if (origin && !skip_ascii_whitespace(origin.value()).empty()) {
		entity.origin = numbers_from_string<double, 3>(origin.value());
		if (!entity.origin) [[unlikely]] {
			return std::unexpected(bad_attribute(element, "origin"));
		}
	}

	if (xml_element const * properties = element.first_child(u8"Properties"
		)) {
		for (xml_attribute const & a : properties->attributes) {
			entity.properties.emplace_back(
				csx_property{ .key = a.name, .value = a.value }
			);
		}
	}
	return entity;
}

static std::expected<csx_face, conversion_error> parse_face(
	xml_element const & element, csx_brush const & brush
) {
	csx_face face{};

	auto id = required_number<std::int32_t>(element, "id");
	if (!id) [[unlikely]] {
		return std::unexpected(std::move(id.error()));
	}
	face.id = id.value();

	auto plane = required_numbers<double, 4>(element, "plane");
	if (!plane) [[unlikely]] {
		return std::unexpected(std::move(plane.error()));
	}
	face.plane = plane.value();

	auto material = required_string(element, "material");
	if (!material) [[unlikely]] {
		return std::unexpected(std::move(material.error()));
	}
	face.material = std::move(material.value());

	auto texgens = required_numbers<double, 11>(element, "texgens");
	if (!texgens) [[unlikely]] {
		return std::unexpected(std::move(texgens.error()));
	}
	std::array<double, 11> const & t = texgens.value();
	face.texgen = csx_texgen{ .planeX = { t[0], t[1], t[2], t[3] },
							  .planeY = { t[4], t[5], t[6], t[7] },
							  .rotation = t[8],
							  .scale = { t[9], t[10] } };

	auto texDiv = required_numbers<std::int32_t, 2>(element, "texDiv");
	if (!texDiv) [[unlikely]] {
		return std::unexpected(std::move(texDiv.error()));
	}
	if (texDiv.value()[0] <= 0 || texDiv.value()[1] <= 0) [[unlikely]] {
		return std::unexpected(bad_attribute(element, "texDiv"));
	}
	face.texDiv = texDiv.value();

	xml_element const * indices = element.first_child(u8"Indices");
	if (!indices) [[unlikely]] {
		return std::unexpected(malformed(element, "has no <Indices>"));
	}
	std::optional<std::u8string_view> const indexList = indices->attribute(
		u8"indices"
	);
	if (!indexList) [[unlikely]] {
		return std::unexpected(missing_attribute(*indices, "indices"));
	}
	std::optional<std::vector<std::uint32_t>> maybeIndices
		= number_list_from_string<std::uint32_t>(indexList.value());
	if (!maybeIndices) [[unlikely]] {
		return std::unexpected(bad_attribute(*indices, "indices"));
	}
	face.indices = std::move(maybeIndices.value());

	for (std::uint32_t index : face.indices) {
		if (index >= brush.vertices.size()) [[unlikely]] {
			return std::unexpected(make_conversion_error(
				conversion_msg::malformed_input,
				"line %zu: brush %d face %d refers to vertex %u but the brush has %zu vertices",
				indices->line,
				brush.id,
				face.id,
				index,
				brush.vertices.size()
			));
		}
	}
	return face;
}

static std::expected<csx_brush, conversion_error>
parse_brush(xml_element const & element) {
	csx_brush brush{};

	auto id = required_number<std::int32_t>(element, "id");
	if (!id) [[unlikely]] {
		return std::unexpected(std::move(id.error()));
	}
	brush.id = id.value();

	auto owner = required_number<std::int32_t>(element, "owner");
	if (!owner) [[unlikely]] {
		return std::unexpected(std::move(owner.error()));
	}
	brush.owner = owner.value();

	auto type = required_number<std::int32_t>(element, "type");
	if (!type) [[unlikely]] {
		return std::unexpected(std::move(type.error()));
	}
	brush.type = type.value();

	auto transform = required_numbers<double, 16>(element, "transform");
	if (!transform) [[unlikely]] {
		return std::unexpected(std::move(transform.error()));
	}
	brush.transform = transform.value();

	if (xml_element const * vertices = element.first_child(u8"Vertices")) {
		for (xml_element const * vertex : vertices->children_named(u8"Vertex"
			 )) {
			auto pos = required_numbers<double, 3>(*vertex, "pos");
			if (!pos) [[unlikely]] {
				return std::unexpected(std::move(pos.error()));
			}
			brush.vertices.push_back(pos.value());
		}
	}

	for (xml_element const * faceElement : element.children_named(u8"Face")) {
		auto face = parse_face(*faceElement, brush);
		if (!face) [[unlikely]] {
			return std::unexpected(std::move(face.error()));
		}
		brush.faces.emplace_back(std::move(face.value()));
	}
	return brush;
}

static std::expected<csx_detail_level, conversion_error> parse_detail_level(
	xml_element const & element, std::size_t& entityInputOrder
) {
	xml_element const * map = element.first_child(u8"InteriorMap");
	if (!map) [[unlikely]] {
		return std::unexpected(malformed(element, "has no <InteriorMap>"));
	}

	csx_detail_level detailLevel{};
	auto brushScale = required_number<std::uint32_t>(*map, "brushScale");
	if (!brushScale) [[unlikely]] {
		return std::unexpected(std::move(brushScale.error()));
	}
	detailLevel.brushScale = brushScale.value();

	auto lightScale = required_number<std::uint32_t>(*map, "lightScale");
	if (!lightScale) [[unlikely]] {
		return std::unexpected(std::move(lightScale.error()));
	}
	detailLevel.lightScale = lightScale.value();

	if (map->attribute(u8"ambientColor")) {
		auto ambient = required_numbers<double, 3>(*map, "ambientColor");
		if (!ambient) [[unlikely]] {
			return std::unexpected(std::move(ambient.error()));
		}
		detailLevel.ambientColor = ambient.value();
	}
	if (map->attribute(u8"ambientColorEmerg")) {
		auto ambient = required_numbers<double, 3>(
			*map, "ambientColorEmerg"
		);
		if (!ambient) [[unlikely]] {
			return std::unexpected(std::move(ambient.error()));
		}
		detailLevel.ambientColorEmergency = ambient.value();
	}

	if (xml_element const * entities = map->first_child(u8"Entities")) {
		for (xml_element const * entityElement :
			 entities->children_named(u8"Entity")) {
			auto entity = parse_entity(*entityElement, entityInputOrder++);
			if (!entity) [[unlikely]] {
				return std::unexpected(std::move(entity.error()));
			}
			detailLevel.entities.emplace_back(std::move(entity.value()));
		}
	}

	if (xml_element const * brushes = map->first_child(u8"Brushes")) {
		for (xml_element const * brushElement :
			 brushes->children_named(u8"Brush")) {
			auto brush = parse_brush(*brushElement);
			if (!brush) [[unlikely]] {
				return std::unexpected(std::move(brush.error()));
			}
			detailLevel.brushes.emplace_back(std::move(brush.value()));
		}
	}
	return detailLevel;
}

std::expected<csx_scene, conversion_error>
parse_csx_document(std::u8string_view text) {
	if (!validate_utf8(text)) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::malformed_input, "The document is not valid UTF-8"
		));
	}

	std::expected<xml_element, xml_parse_error> root = parse_xml_document(
		text
	);
	if (!root) [[unlikely]] {
		return std::unexpected(make_conversion_error(
			conversion_msg::malformed_input,
			"line %zu: %s",
			root.error().line,
			(char const *) root.error().message.c_str()
		));
	}

	xml_element const & sceneElement = root.value();
	if (sceneElement.name != u8"ConstructorScene") [[unlikely]] {
		return std::unexpected(
			malformed(sceneElement, "is not a ConstructorScene")
		);
	}

	csx_scene scene{};
	scene.version = sceneElement.attribute(u8"version")
						.and_then([](std::u8string_view v) {
							return number_from_string<std::int32_t>(v);
						})
						.value_or(0);
	scene.creator = sceneElement.attribute(u8"creator").value_or(u8"");

	xml_element const * detailLevels = sceneElement.first_child(
		u8"DetailLevels"
	);
	if (!detailLevels) [[unlikely]] {
		return std::unexpected(malformed(sceneElement, "has no <DetailLevels>")
		);
	}

	std::size_t entityInputOrder = 0;
	for (xml_element const * detailLevelElement :
		 detailLevels->children_named(u8"DetailLevel")) {
		auto detailLevel = parse_detail_level(
			*detailLevelElement, entityInputOrder
		);
		if (!detailLevel) [[unlikely]] {
			return std::unexpected(std::move(detailLevel.error()));
		}
		scene.detailLevels.emplace_back(std::move(detailLevel.value()));
	}

	if (scene.detailLevels.empty()) [[unlikely]] {
		return std::unexpected(malformed(*detailLevels, "has no <DetailLevel>")
		);
	}
	return scene;
}
