#include "conversion.h"
#include "test_scenes.h"

#include <gtest/gtest.h>

#include <array>
#include <map>

static test_entity worldspawn() {
	return test_entity{ .id = 1,
						.classname = u8"worldspawn",
						.origin = std::nullopt,
						.properties = { { u8"detail_number", u8"0" } } };
}

static test_detail_level cube_level() {
	return test_detail_level{
		.entities = { worldspawn() },
		.brushes = { test_brush{
			.id = 0, .owner = 0, .mins = { 0, 0, 0 }, .maxs = { 1, 1, 1 } } },
		.brushScale = 32,
		.ambientColor = {} };
}

static std::uint32_t
read_u32(std::vector<std::byte> const & bytes, std::size_t offset) {
	std::uint32_t value = 0;
	for (std::size_t i = 0; i != 4; ++i) {
		value |= std::uint32_t(bytes.at(offset + i)) << (i * 8);
	}
	return value;
}

TEST(ConvertCsxToDif, ACubeBecomesOneInterior) {
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(make_test_csx(cube_level()), conversion_settings{});
	ASSERT_TRUE(output.has_value()) << (char const *) output.error()
										   .context.c_str();

	ASSERT_EQ(output->files.size(), 1);
	std::vector<std::byte> const & file = output->files[0];
	EXPECT_EQ(read_u32(file, 0), 44);
	EXPECT_EQ(file.at(4), std::byte{ 0 });
	// One detail level
	EXPECT_EQ(read_u32(file, 5), 1);

	ASSERT_EQ(output->reports.size(), 1);
	bsp_report const & report = output->reports[0];
	EXPECT_EQ(report.hit, 6);
	EXPECT_EQ(report.total, 6);
	EXPECT_DOUBLE_EQ(report.hitAreaPercentage, 100.0);
	EXPECT_DOUBLE_EQ(report.balanceFactor, 0.0);
	EXPECT_EQ(output->degenerateFacesDropped, 0);
	EXPECT_EQ(output->unboundPathNodesDropped, 0);
}

TEST(ConvertCsxToDif, ChecksTheVersionBeforeReadingTheInput) {
	conversion_settings settings{};
	settings.engine = dif_engine::mbg;
	settings.difVersion = 3;
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(u8"not a csx file", settings);
	ASSERT_FALSE(output.has_value());
	EXPECT_EQ(
		output.error().msg, conversion_msg::unsupported_version_combination
	);
}

TEST(ConvertCsxToDif, RejectsMalformedInput) {
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(u8"<ConstructorScene", conversion_settings{});
	ASSERT_FALSE(output.has_value());
	EXPECT_EQ(output.error().msg, conversion_msg::malformed_input);
}

TEST(ConvertCsxToDif, StopsWhenCancelled) {
	std::stop_source stopSource;
	stopSource.request_stop();
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(
			make_test_csx(cube_level()),
			conversion_settings{},
			nullptr,
			stopSource.get_token()
		);
	ASSERT_FALSE(output.has_value());
	EXPECT_EQ(output.error().msg, conversion_msg::tool_cancelled);
}

TEST(ConvertCsxToDif, EveryDetailLevelGetsAnInterior) {
	test_detail_level lower = cube_level();
	lower.entities.clear();
	lower.brushes[0].maxs = { 2, 2, 2 };
	std::array<test_detail_level, 2> const levels{ cube_level(), lower };

	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(make_test_csx(levels), conversion_settings{});
	ASSERT_TRUE(output.has_value());
	ASSERT_EQ(output->files.size(), 1);
	EXPECT_EQ(output->reports.size(), 2);
	EXPECT_EQ(read_u32(output->files[0], 5), 2);
}

TEST(ConvertCsxToDif, ElevatorsBecomeSubObjects) {
	test_detail_level level = cube_level();
	level.entities.push_back(test_entity{
		.id = 2,
		.classname = u8"Door_Elevator",
		.origin = double3_array{ 5, 0, 0 },
		.properties = { { u8"datablock", u8"PathedDefault" } } });
	level.entities.push_back(test_entity{
		.id = 3,
		.classname = u8"path_node",
		.origin = double3_array{ 5, 0, 0 },
		.properties = { { u8"next_time", u8"1000" } } });
	level.entities.push_back(test_entity{
		.id = 4,
		.classname = u8"path_node",
		.origin = double3_array{ 5, 0, 4 },
		.properties = { { u8"next_time", u8"1000" } } });
	level.entities.push_back(test_entity{ .id = 5,
										  .classname = u8"trigger",
										  .origin = std::nullopt,
										  .properties = {} });
	level.brushes.push_back(test_brush{
		.id = 1, .owner = 2, .mins = { 4, 0, 0 }, .maxs = { 6, 1, 1 } });
	level.brushes.push_back(test_brush{
		.id = 2, .owner = 5, .mins = { 4, 0, 1 }, .maxs = { 6, 1, 3 } });

	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(make_test_csx(level), conversion_settings{});
	ASSERT_TRUE(output.has_value());
	ASSERT_EQ(output->files.size(), 1);
	// The world and the elevator
	ASSERT_EQ(output->reports.size(), 2);
	EXPECT_EQ(output->reports[0].total, 6);
	EXPECT_EQ(output->reports[1].total, 6);

	// The trigger's brush is not world geometry either
	std::vector<std::byte> const & file = output->files[0];
	EXPECT_EQ(read_u32(file, 5), 1);
}

TEST(ConvertCsxToDif, CountsPathNodesWithoutAnElevator) {
	test_detail_level level = cube_level();
	level.entities.insert(
		level.entities.begin(),
		test_entity{ .id = 9,
					 .classname = u8"path_node",
					 .origin = double3_array{ 0, 0, 0 },
					 .properties = {} }
	);
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(make_test_csx(level), conversion_settings{});
	ASSERT_TRUE(output.has_value());
	EXPECT_EQ(output->unboundPathNodesDropped, 1);
}

TEST(ConvertCsxToDif, NoReportWithoutABsp) {
	conversion_settings settings{};
	settings.bspStrategy = bsp_strategy::none;
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(make_test_csx(cube_level()), settings);
	ASSERT_TRUE(output.has_value());
	EXPECT_EQ(output->files.size(), 1);
	EXPECT_TRUE(output->reports.empty());
}

// A grid of separate boxes, so nothing is shared but the planes
static std::vector<test_brush>
box_grid(std::size_t count, std::int32_t owner = 0, double y = 0) {
	std::vector<test_brush> boxes;
	for (std::size_t i = 0; i != count; ++i) {
		double const x = 2.0 * double(i % 70);
		double const z = 2.0 * double(i / 70);
		boxes.push_back(test_brush{
			.id = std::int32_t(i),
			.owner = owner,
			.mins = { x, y, z },
			.maxs = { x + 1, y + 1 + 0.1 * double(i % 7), z + 1 } });
	}
	return boxes;
}

// Two detail levels, and an elevator with a trigger in the first
static std::array<test_detail_level, 2> scene_with_three_interiors() {
	test_detail_level level = cube_level();
	level.brushes = box_grid(40);
	level.entities.push_back(test_entity{
		.id = 2,
		.classname = u8"Door_Elevator",
		.origin = double3_array{ 5, 10, 0 },
		.properties = {} });
	level.entities.push_back(test_entity{
		.id = 3,
		.classname = u8"path_node",
		.origin = double3_array{ 5, 10, 0 },
		.properties = { { u8"next_time", u8"500" } } });
	level.entities.push_back(test_entity{ .id = 4,
										  .classname = u8"trigger",
										  .origin = std::nullopt,
										  .properties = {} });
	for (test_brush box : box_grid(12, 2, 10)) {
		box.id += 100;
		level.brushes.push_back(box);
	}
	level.brushes.push_back(test_brush{
		.id = 200, .owner = 4, .mins = { 0, 10, 5 }, .maxs = { 3, 12, 6 } });

	test_detail_level lower = cube_level();
	lower.entities.clear();
	lower.brushes = box_grid(9);
	return { level, lower };
}

TEST(ConvertCsxToDif, OutputDoesNotDependOnTheThreadCount) {
	std::u8string const csx = make_test_csx(scene_with_three_interiors());

	for (bsp_strategy strategy :
		 { bsp_strategy::exhaustive, bsp_strategy::sampling }) {
		conversion_settings settings{};
		settings.engine = dif_engine::t3d;
		settings.difVersion = 14;
		settings.bspStrategy = strategy;
		settings.numberOfThreads = 1;
		std::expected<conversion_output, conversion_error> const serial
			= convert_csx_to_dif(csx, settings);
		settings.numberOfThreads = 6;
		std::expected<conversion_output, conversion_error> const parallel
			= convert_csx_to_dif(csx, settings);

		ASSERT_TRUE(serial.has_value());
		ASSERT_TRUE(parallel.has_value());
		EXPECT_EQ(serial->files, parallel->files);

		// Two detail levels and the elevator
		ASSERT_EQ(serial->reports.size(), 3);
		ASSERT_EQ(parallel->reports.size(), 3);
		for (std::size_t i = 0; i != serial->reports.size(); ++i) {
			bsp_report const & a = serial->reports[i];
			bsp_report const & b = parallel->reports[i];
			EXPECT_EQ(a.hit, b.hit) << "report " << i;
			EXPECT_EQ(a.total, b.total) << "report " << i;
			EXPECT_EQ(a.hitAreaPercentage, b.hitAreaPercentage)
				<< "report " << i;
			EXPECT_EQ(a.balanceFactor, b.balanceFactor) << "report " << i;
			EXPECT_EQ(a.nodeCount, b.nodeCount) << "report " << i;
			EXPECT_EQ(a.leafCount, b.leafCount) << "report " << i;
			EXPECT_EQ(a.maxDepth, b.maxDepth) << "report " << i;
			EXPECT_EQ(a.depthLimitedLeaves, b.depthLimitedLeaves)
				<< "report " << i;
			EXPECT_EQ(a.hit, a.total) << "report " << i;
		}
		EXPECT_EQ(serial->reports[0].total, 40 * 6);
		EXPECT_EQ(serial->reports[1].total, 9 * 6);
		EXPECT_EQ(serial->reports[2].total, 12 * 6);
	}
}

TEST(ConvertCsxToDif, ProgressNeverGoesBackwardsWithinAPhase) {
	std::u8string const csx = make_test_csx(scene_with_three_interiors());
	for (std::size_t numThreads : { 1zu, 4zu }) {
		conversion_settings settings{};
		settings.numberOfThreads = numThreads;
		progress_channel channel;
		ASSERT_TRUE(convert_csx_to_dif(csx, settings, &channel).has_value());

		std::map<std::u8string, std::uint32_t> lastCurrent;
		std::map<std::u8string, std::uint32_t> totals;
		while (std::optional<progress_event> event = channel.try_receive()) {
			if (event->total == 0) {
				continue;
			}
			auto const it = totals.emplace(event->phase, event->total).first;
			EXPECT_EQ(it->second, event->total);
			std::uint32_t& last = lastCurrent[event->phase];
			EXPECT_GE(event->current, last)
				<< (char const *) event->phase.c_str();
			last = event->current;
		}
		// One phase per interior, each run to the end
		EXPECT_EQ(totals.size(), 3);
		for (auto const & [phase, total] : totals) {
			EXPECT_EQ(lastCurrent[phase], total);
		}
	}
}

TEST(ConvertCsxToDif, SplitsWorldGeometryOverSeveralFiles) {
	// 2800 boxes have 16800 surfaces, more than one mbg interior holds
	test_detail_level level = cube_level();
	level.brushes = box_grid(2800);

	conversion_settings settings{};
	settings.engine = dif_engine::mbg;
	settings.difVersion = 0;
	settings.bspStrategy = bsp_strategy::none;
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(make_test_csx(level), settings);
	ASSERT_TRUE(output.has_value()) << (char const *) output.error()
										   .context.c_str();

	ASSERT_EQ(output->files.size(), 2);
	for (std::vector<std::byte> const & file : output->files) {
		EXPECT_EQ(read_u32(file, 0), 44);
		// One detail level each
		EXPECT_EQ(read_u32(file, 5), 1);
	}
	EXPECT_TRUE(output->reports.empty());
}

TEST(ConvertCsxToDif, PostsTheParseStatusFirst) {
	progress_channel channel;
	std::expected<conversion_output, conversion_error> const output
		= convert_csx_to_dif(
			make_test_csx(cube_level()), conversion_settings{}, &channel
		);
	ASSERT_TRUE(output.has_value());

	std::optional<progress_event> const first = channel.try_receive();
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(first->phase, u8"Parsing CSX");
	EXPECT_EQ(first->total, 0);
}
