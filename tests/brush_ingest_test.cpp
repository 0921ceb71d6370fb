#include "brush_ingest.h"
#include "test_scenes.h"

#include <gtest/gtest.h>

#include <algorithm>

TEST(BrushIngest, AppliesTheTransformAndOrientsFacesOutward) {
	csx_brush brush = make_box_brush(4, { 0, 0, 0 }, { 1, 1, 1 });
	// Move by (10, 0, 0)
	brush.transform[3] = 10.0;

	std::size_t degenerateFaces = 0;
	ingested_brush const ingested = ingest_brush(brush, 32, degenerateFaces);
	EXPECT_EQ(degenerateFaces, 0);
	EXPECT_EQ(ingested.id, 4);
	EXPECT_EQ(ingested.vertices[6], (double3_array{ 11, 1, 1 }));

	ASSERT_EQ(ingested.faces.size(), 6);
	winding_plane<double> const & right = ingested.faces[5].plane;
	EXPECT_DOUBLE_EQ(right.normal[0], 1.0);
	EXPECT_DOUBLE_EQ(right.dist, 11.0);
	EXPECT_EQ(ingested.faces[5].attributes.brushScale, 32);
	EXPECT_EQ(ingested.faces[5].attributes.brushTransform, brush.transform);
}

TEST(BrushIngest, FollowsTheAuthoredNormalWhenTheWindingIsReversed) {
	csx_brush brush = make_box_brush(1, { 0, 0, 0 }, { 1, 1, 1 });
	std::ranges::reverse(brush.faces[1].indices);

	std::size_t degenerateFaces = 0;
	ingested_brush const ingested = ingest_brush(brush, 32, degenerateFaces);
	ASSERT_EQ(ingested.faces.size(), 6);
	EXPECT_DOUBLE_EQ(ingested.faces[1].plane.normal[2], 1.0);
	EXPECT_DOUBLE_EQ(ingested.faces[1].plane.dist, 1.0);
}

TEST(BrushIngest, DropsAndCountsDegenerateFaces) {
	csx_brush brush = make_box_brush(2, { 0, 0, 0 }, { 1, 1, 1 });
	csx_face collinear = brush.faces[0];
	collinear.id = 6;
	collinear.indices = { 0, 1, 1 };
	brush.faces.push_back(collinear);

	std::size_t degenerateFaces = 0;
	ingested_brush const ingested = ingest_brush(brush, 32, degenerateFaces);
	EXPECT_EQ(degenerateFaces, 1);
	EXPECT_EQ(ingested.faces.size(), 6);
}
