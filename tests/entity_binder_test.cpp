#include "entity_binder.h"

#include <gtest/gtest.h>

static csx_entity make_entity(
	std::int32_t id,
	std::u8string_view classname,
	std::vector<csx_property> properties = {},
	std::optional<double3_array> origin = std::nullopt
) {
	csx_entity entity{};
	entity.id = id;
	entity.classname = classname;
	entity.properties = std::move(properties);
	entity.origin = origin;
	entity.inputOrder = std::size_t(id);
	return entity;
}

TEST(BindEntities, PathNodesFollowTheMostRecentElevator) {
	std::array<csx_entity, 5> const entities{
		make_entity(0, elevator_classname),
		make_entity(1, path_node_classname),
		make_entity(2, path_node_classname),
		make_entity(3, elevator_classname),
		make_entity(4, path_node_classname)
	};
	entity_bindings const bindings = bind_entities(entities);

	ASSERT_EQ(bindings.elevators.size(), 2);
	ASSERT_EQ(bindings.elevators[0].pathNodes.size(), 2);
	EXPECT_EQ(bindings.elevators[0].pathNodes[0].id, 1);
	EXPECT_EQ(bindings.elevators[0].pathNodes[1].id, 2);
	ASSERT_EQ(bindings.elevators[1].pathNodes.size(), 1);
	EXPECT_EQ(bindings.elevators[1].pathNodes[0].id, 4);
	EXPECT_EQ(bindings.unboundDropped, 0);
	EXPECT_TRUE(bindings.others.empty());
}

TEST(BindEntities, DropsPathNodesAndTriggersBeforeAnyElevator) {
	std::array<csx_entity, 5> const entities{
		make_entity(0, path_node_classname),
		make_entity(1, trigger_classname),
		make_entity(2, u8"worldspawn"),
		make_entity(3, elevator_classname),
		make_entity(4, trigger_classname)
	};
	entity_bindings const bindings = bind_entities(entities);

	EXPECT_EQ(bindings.unboundDropped, 2);
	ASSERT_EQ(bindings.elevators.size(), 1);
	EXPECT_TRUE(bindings.elevators[0].pathNodes.empty());
	ASSERT_EQ(bindings.elevators[0].triggers.size(), 1);
	EXPECT_EQ(bindings.elevators[0].triggers[0].id, 4);
	ASSERT_EQ(bindings.others.size(), 1);
	EXPECT_EQ(bindings.others[0].classname, u8"worldspawn");
}

TEST(MakePathFollower, SumsTheWaypointTimes) {
	elevator_binding const binding{
		.elevator = make_entity(
			0,
			elevator_classname,
			{ { u8"datablock", u8"PathedDoor" }, { u8"speed", u8"2" } },
			double3_array{ 1, 2, 3 }
		),
		.pathNodes = { make_entity(
						   1,
						   path_node_classname,
						   { { u8"next_time", u8"1500" } },
						   double3_array{ 0, 0, 0 }
					   ),
					   make_entity(
						   2,
						   path_node_classname,
						   { { u8"next_time", u8"500" },
							 { u8"smoothing", u8"1" } },
						   double3_array{ 0, 0, 5 }
					   ) },
		.triggers = { make_entity(3, trigger_classname),
					  make_entity(4, trigger_classname) }
	};

	dif_path_follower const follower = make_path_follower(binding, 2, 7);
	EXPECT_EQ(follower.name, u8"MustChange");
	EXPECT_EQ(follower.datablock, u8"PathedDoor");
	EXPECT_EQ(follower.interiorResIndex, 2);
	EXPECT_EQ(follower.offset, (double3_array{ 1, 2, 3 }));
	ASSERT_EQ(follower.properties.size(), 1);
	EXPECT_EQ(follower.properties[0].key, u8"speed");
	EXPECT_EQ(follower.triggerIds, (std::vector<std::uint32_t>{ 7, 8 }));

	ASSERT_EQ(follower.waypoints.size(), 2);
	EXPECT_EQ(follower.waypoints[0].msToNext, 1500);
	EXPECT_EQ(follower.waypoints[1].smoothing, 1);
	EXPECT_EQ(follower.waypoints[1].position, (double3_array{ 0, 0, 5 }));
	EXPECT_EQ(follower.totalMs, 2000);
}

TEST(MakeTrigger, DefaultsTheDatablock) {
	bounding_box const bounds{ .mins = { 0, 0, 0 }, .maxs = { 1, 2, 3 } };
	dif_trigger const plain = make_trigger(
		make_entity(5, trigger_classname), bounds
	);
	EXPECT_EQ(plain.datablock, u8"DefaultTrigger");
	EXPECT_EQ(plain.bounds.maxs, bounds.maxs);

	dif_trigger const named = make_trigger(
		make_entity(
			6,
			trigger_classname,
			{ { u8"datablock", u8"SpawnTrigger" }, { u8"target", u8"a" } }
		),
		bounds
	);
	EXPECT_EQ(named.datablock, u8"SpawnTrigger");
	ASSERT_EQ(named.properties.size(), 1);
	EXPECT_EQ(named.properties[0].value, u8"a");
}

TEST(CollectGameEntities, KeepsOnlyEntitiesWithAGameClass) {
	std::array<csx_entity, 4> const others{
		make_entity(0, u8"worldspawn", { { u8"game_class", u8"Nope" } }),
		make_entity(1, u8"light_omni", { { u8"game_class", u8"Nope" } }),
		make_entity(2, u8"sign"),
		make_entity(
			3,
			u8"GemItem",
			{ { u8"game_class", u8"Item" }, { u8"skin", u8"red" } },
			double3_array{ 4, 5, 6 }
		)
	};
	std::vector<dif_game_entity> const entities = collect_game_entities(
		others
	);
	ASSERT_EQ(entities.size(), 1);
	EXPECT_EQ(entities[0].gameClass, u8"Item");
	EXPECT_EQ(entities[0].datablock, u8"GemItem");
	EXPECT_EQ(entities[0].position, (double3_array{ 4, 5, 6 }));
	ASSERT_EQ(entities[0].properties.size(), 1);
	EXPECT_EQ(entities[0].properties[0].key, u8"skin");
}
