#include "dif_format.h"

#include <gtest/gtest.h>

#include <utility>

TEST(DifFormat, AcceptsTheVersionsEachEngineReads) {
	EXPECT_TRUE(make_dif_format(dif_engine::mbg, 0).has_value());
	EXPECT_TRUE(make_dif_format(dif_engine::tge, 0).has_value());
	EXPECT_TRUE(make_dif_format(dif_engine::tgea, 13).has_value());
	EXPECT_TRUE(make_dif_format(dif_engine::t3d, 14).has_value());

	for (auto const [engine, version] :
		 { std::pair{ dif_engine::mbg, 1u },
		   std::pair{ dif_engine::tge, 5u },
		   std::pair{ dif_engine::tgea, 14u },
		   std::pair{ dif_engine::t3d, 15u } }) {
		std::expected<dif_format, conversion_error> const format
			= make_dif_format(engine, version);
		ASSERT_FALSE(format.has_value());
		EXPECT_EQ(
			format.error().msg, conversion_msg::unsupported_version_combination
		);
	}
}

TEST(DifFormat, WidensFieldsWithTheVersion) {
	dif_format const v0 = make_dif_format(dif_engine::t3d, 0).value();
	EXPECT_FALSE(v0.wide_bsp_indices());
	EXPECT_FALSE(v0.has_edges());
	EXPECT_EQ(v0.bsp_leaf_flag(), 0x8000);
	EXPECT_EQ(v0.limits().maxPoints, 0xFFFF);
	EXPECT_EQ(v0.limits().maxSurfaces, 0x3FFF);

	dif_format const v4 = make_dif_format(dif_engine::t3d, 4).value();
	EXPECT_TRUE(v4.has_legacy_edges());
	EXPECT_TRUE(v4.has_legacy_normals());

	dif_format const v14 = make_dif_format(dif_engine::t3d, 14).value();
	EXPECT_TRUE(v14.wide_bsp_indices());
	EXPECT_TRUE(v14.wide_lightmap_fields());
	EXPECT_TRUE(v14.has_edges());
	EXPECT_FALSE(v14.has_legacy_edges());
	EXPECT_EQ(v14.bsp_leaf_flag(), 0x80000);
	EXPECT_EQ(v14.bsp_solid_flag(), 0x40000);
	EXPECT_EQ(v14.limits().maxSurfaces, 0x3FFFF);
}

TEST(DifFormat, EngineNames) {
	EXPECT_EQ(dif_engine_from_string(u8"TGEA"), dif_engine::tgea);
	EXPECT_FALSE(dif_engine_from_string(u8"unity").has_value());
	EXPECT_EQ(name_of_dif_engine(dif_engine::t3d), u8"t3d");
}
