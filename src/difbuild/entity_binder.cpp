#include "entity_binder.h"

#include "log.h"
#include "numeric_string_conversions.h"

#include <algorithm>
#include <initializer_list>

entity_bindings bind_entities(std::span<csx_entity const> entities) {
	entity_bindings result{};

	for (csx_entity const & entity : entities) {
		bool const isPathNode = entity.classname == path_node_classname;
		bool const isTrigger = entity.classname == trigger_classname;

		if (entity.classname == elevator_classname) {
			result.elevators.emplace_back(
				elevator_binding{ .elevator = entity,
								  .pathNodes = {},
								  .triggers = {} }
			);
		} else if (isPathNode || isTrigger) {
			if (result.elevators.empty()) [[unlikely]] {
				Warning(
					"%s %d comes before any %s and was dropped",
					(char const *) entity.classname.c_str(),
					entity.id,
					(char const *) elevator_classname.data()
				);
				++result.unboundDropped;
				continue;
			}
			elevator_binding& current = result.elevators.back();
			(isPathNode ? current.pathNodes : current.triggers)
				.push_back(entity);
		} else {
			result.others.push_back(entity);
		}
	}
	return result;
}

static std::uint32_t
unsigned_property(csx_entity const & entity, std::u8string_view key) {
	return entity.property(key)
		.and_then([](std::u8string_view value) {
			return number_from_string<std::uint32_t>(value);
		})
		.value_or(0);
}

static std::vector<csx_property> properties_without(
	std::span<csx_property const> properties,
	std::initializer_list<std::u8string_view> excludedKeys
) {
	std::vector<csx_property> result;
	for (csx_property const & p : properties) {
		if (std::ranges::find(excludedKeys, std::u8string_view{ p.key })
			== excludedKeys.end()) {
			result.push_back(p);
		}
	}
	return result;
}

dif_path_follower make_path_follower(
	elevator_binding const & binding,
	std::uint32_t interiorResIndex,
	std::uint32_t firstTriggerId
) {
	csx_entity const & elevator = binding.elevator;

	dif_path_follower follower{};
	follower.datablock = elevator.property(u8"datablock")
							 .value_or(u8"PathedDefault");
	follower.interiorResIndex = interiorResIndex;
	follower.offset = elevator.origin.value_or(double3_array{});
	follower.properties = properties_without(
		elevator.properties, { u8"datablock" }
	);

	for (std::size_t i = 0; i != binding.triggers.size(); ++i) {
		follower.triggerIds.push_back(std::uint32_t(firstTriggerId + i));
	}

	for (csx_entity const & node : binding.pathNodes) {
		path_waypoint const waypoint{
			.position = node.origin.value_or(double3_array{}),
			.msToNext = unsigned_property(node, u8"next_time"),
			.smoothing = unsigned_property(node, u8"smoothing")
		};
		follower.totalMs += waypoint.msToNext;
		follower.waypoints.push_back(waypoint);
	}
	return follower;
}

dif_trigger
make_trigger(csx_entity const & trigger, bounding_box const & bounds) {
	return dif_trigger{
		.name = u8"MustChange",
		.datablock = std::u8string{
			trigger.property(u8"datablock").value_or(u8"DefaultTrigger") },
		.properties = properties_without(trigger.properties, { u8"datablock" }),
		.bounds = bounds
	};
}

std::vector<dif_game_entity>
collect_game_entities(std::span<csx_entity const> others) {
	std::vector<dif_game_entity> result;
	for (csx_entity const & entity : others) {
		if (entity.classname == u8"worldspawn"
			|| entity.classname.starts_with(u8"light_")) {
			continue;
		}
		std::optional<std::u8string_view> const gameClass = entity.property(
			u8"game_class"
		);
		if (!gameClass) {
			continue;
		}

		result.emplace_back(dif_game_entity{
			.datablock = std::u8string{
				entity.property(u8"datablock").value_or(entity.classname) },
			.gameClass = std::u8string{ gameClass.value() },
			.position = entity.origin.value_or(double3_array{}),
			.properties = properties_without(
				entity.properties, { u8"datablock", u8"game_class" }
			) });
	}
	return result;
}
