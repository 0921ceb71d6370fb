#pragma once

#include "bounding_box.h"
#include "csx_document.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

constexpr std::u8string_view elevator_classname{ u8"Door_Elevator" };
constexpr std::u8string_view path_node_classname{ u8"path_node" };
constexpr std::u8string_view trigger_classname{ u8"trigger" };

struct elevator_binding final {
	csx_entity elevator;
	std::vector<csx_entity> pathNodes; // Encounter order
	std::vector<csx_entity> triggers;
};

struct entity_bindings final {
	std::vector<elevator_binding> elevators; // Input order
	// Entities that are not elevators, path nodes or triggers
	std::vector<csx_entity> others;
	// Path nodes and triggers that appear before any elevator
	std::size_t unboundDropped{};
};

// Every path node and trigger belongs to the most recent elevator before it
entity_bindings bind_entities(std::span<csx_entity const> entities);

struct path_waypoint final {
	double3_array position{};
	std::uint32_t msToNext{};
	std::uint32_t smoothing{};
};

struct dif_path_follower final {
	std::u8string name{ u8"MustChange" };
	std::u8string datablock;
	std::uint32_t interiorResIndex{};
	double3_array offset{};
	std::vector<csx_property> properties;
	std::vector<std::uint32_t> triggerIds;
	std::vector<path_waypoint> waypoints;
	std::uint32_t totalMs{};
};

struct dif_trigger final {
	std::u8string name{ u8"MustChange" };
	std::u8string datablock;
	std::vector<csx_property> properties;
	bounding_box bounds{};
};

struct dif_game_entity final {
	std::u8string datablock;
	std::u8string gameClass;
	double3_array position{};
	std::vector<csx_property> properties;
};

// firstTriggerId is the index the elevator's first trigger will get in the
// output's trigger list
dif_path_follower make_path_follower(
	elevator_binding const & binding,
	std::uint32_t interiorResIndex,
	std::uint32_t firstTriggerId
);

dif_trigger
make_trigger(csx_entity const & trigger, bounding_box const & bounds);

// Entities with a game_class, other than worldspawn and lights
std::vector<dif_game_entity>
collect_game_entities(std::span<csx_entity const> others);
