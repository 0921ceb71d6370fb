#include "dif_assembler.h"
#include "test_scenes.h"

#include <gtest/gtest.h>

#include <bit>
#include <cmath>
#include <numbers>

namespace {
	// Reads back what dif_stream wrote
	class byte_reader final {
	  private:
		std::span<std::byte const> bytes;
		std::size_t offset{ 0 };

	  public:
		explicit byte_reader(std::span<std::byte const> data) : bytes(data) { }

		std::uint8_t u8() {
			return std::uint8_t(bytes[offset++]);
		}

		std::uint16_t u16() {
			std::uint16_t const lo = u8();
			return std::uint16_t(lo | (std::uint16_t(u8()) << 8));
		}

		std::uint32_t u32() {
			std::uint32_t value = 0;
			for (std::size_t i = 0; i != 4; ++i) {
				value |= std::uint32_t(u8()) << (i * 8);
			}
			return value;
		}

		float f32() {
			return std::bit_cast<float>(u32());
		}

		double3_array point() {
			double const x = f32();
			double const y = f32();
			return { x, y, double(f32()) };
		}

		std::u8string string() {
			std::size_t const length = u8();
			std::u8string s;
			for (std::size_t i = 0; i != length; ++i) {
				s.push_back(char8_t(u8()));
			}
			return s;
		}

		std::size_t remaining() const noexcept {
			return bytes.size() - offset;
		}
	};
} // namespace

static geometry_pools unit_cube() {
	std::array<test_brush, 1> const cube{ test_brush{
		.id = 0, .owner = 0, .mins = { 0, 0, 0 }, .maxs = { 1, 1, 1 } } };
	return pool_boxes(cube);
}

TEST(TexgenEquation, ScalesByBrushScaleOverTextureDivisor) {
	surface_attributes attributes{};
	attributes.texgen = csx_texgen{ .planeX = { 1, 0, 0, 8 },
									.planeY = { 0, 1, 0, 0 },
									.rotation = 0,
									.scale = { 0, 2 } };
	attributes.texDiv = { 16, 16 };
	attributes.brushScale = 32;

	texgen_equation const texgen = make_texgen_equation(attributes);
	// A zero scale counts as one
	EXPECT_DOUBLE_EQ(texgen.planeX[0], 2.0);
	EXPECT_DOUBLE_EQ(texgen.planeX[3], 0.5);
	EXPECT_DOUBLE_EQ(texgen.planeY[1], 1.0);
}

TEST(TexgenEquation, RotatesAroundTheTextureNormal) {
	surface_attributes attributes{};
	attributes.texgen = csx_texgen{ .planeX = { 1, 0, 0, 0 },
									.planeY = { 0, 1, 0, 0 },
									.rotation = 90,
									.scale = { 1, 1 } };
	attributes.texDiv = { 32, 32 };
	attributes.brushScale = 32;

	texgen_equation const texgen = make_texgen_equation(attributes);
	EXPECT_NEAR(texgen.planeX[0], 0.0, 1e-12);
	EXPECT_NEAR(texgen.planeX[1], 1.0, 1e-12);
	EXPECT_NEAR(texgen.planeY[0], -1.0, 1e-12);
	EXPECT_NEAR(texgen.planeY[1], 0.0, 1e-12);

	attributes.texgen.rotation = 360;
	EXPECT_EQ(
		make_texgen_equation(attributes).planeX,
		(double4_array{ 1, 0, 0, 0 })
	);
}

TEST(TexgenEquation, FollowsTheBrushTransform) {
	surface_attributes attributes{};
	attributes.texgen = csx_texgen{ .planeX = { 1, 0, 0, 0 },
									.planeY = { 0, 1, 0, 0 },
									.rotation = 0,
									.scale = { 1, 1 } };
	attributes.texDiv = { 32, 32 };
	attributes.brushScale = 32;
	// Scale x by 2, then move by (10, 0, 0)
	attributes.brushTransform = identity_matrix;
	attributes.brushTransform[0] = 2.0;
	attributes.brushTransform[3] = 10.0;

	texgen_equation const texgen = make_texgen_equation(attributes);
	// u must be the same on a point before and after the transform
	double3_array const local{ 3, 4, 5 };
	double3_array const world{ 16, 4, 5 };
	double const u = texgen.planeX[0] * world[0] + texgen.planeX[1] * world[1]
		+ texgen.planeX[2] * world[2] + texgen.planeX[3];
	EXPECT_NEAR(u, local[0], 1e-12);
	EXPECT_NEAR(texgen.planeY[3], 0.0, 1e-12);
}

TEST(AssembleInterior, StartsWithTheVersionAndBounds) {
	geometry_pools const pools = unit_cube();
	bsp_tree const tree = build_bsp_tree(
		pools, bsp_strategy::exhaustive, 1e-6, 1
	);
	interior_source const source{ .pools = pools,
								  .tree = tree,
								  .detailLevel = 2,
								  .ambientColor = {},
								  .ambientColorEmergency = {} };
	dif_format const format = make_dif_format(dif_engine::mbg, 0).value();
	std::expected<std::vector<std::byte>, conversion_error> const bytes
		= assemble_interior(format, false, source);
	ASSERT_TRUE(bytes.has_value());

	byte_reader in{ bytes.value() };
	EXPECT_EQ(in.u32(), 0);
	EXPECT_EQ(in.u32(), 2);
	EXPECT_EQ(in.u32(), 250);
	EXPECT_EQ(in.point(), (double3_array{ 0, 0, 0 }));
	EXPECT_EQ(in.point(), (double3_array{ 1, 1, 1 }));
	EXPECT_EQ(in.point(), (double3_array{ 0.5, 0.5, 0.5 }));
	EXPECT_NEAR(in.f32(), std::sqrt(0.75), 1e-6);
	EXPECT_EQ(in.u8(), 0);
	EXPECT_EQ(in.u32(), 0);

	std::uint32_t const numNormals = in.u32();
	ASSERT_EQ(numNormals, 6);
	std::vector<double3_array> normals;
	for (std::uint32_t i = 0; i != numNormals; ++i) {
		normals.push_back(in.point());
	}

	// Every corner is on or behind every plane: n . p + d <= 0
	ASSERT_EQ(in.u32(), 6);
	for (std::size_t i = 0; i != 6; ++i) {
		double3_array const & n = normals.at(in.u16());
		double const d = in.f32();
		std::size_t onPlane = 0;
		for (double3_array const & p : pools.points) {
			double const value = n[0] * p[0] + n[1] * p[1] + n[2] * p[2] + d;
			EXPECT_LE(value, 1e-6);
			onPlane += std::fabs(value) <= 1e-6 ? 1 : 0;
		}
		EXPECT_EQ(onPlane, 4);
	}

	ASSERT_EQ(in.u32(), 8);
	for (double3_array const & p : pools.points) {
		EXPECT_EQ(in.point(), p);
	}
}

TEST(AssembleInterior, SizeReductionShrinksTheOutput) {
	geometry_pools const pools = unit_cube();
	bsp_tree const tree = build_bsp_tree(
		pools, bsp_strategy::exhaustive, 1e-6, 1
	);
	interior_source const source{ .pools = pools,
								  .tree = tree,
								  .detailLevel = 0,
								  .ambientColor = { 10, 20, 30 },
								  .ambientColorEmergency = {} };
	dif_format const format = make_dif_format(dif_engine::t3d, 14).value();
	std::expected<std::vector<std::byte>, conversion_error> const full
		= assemble_interior(format, false, source);
	std::expected<std::vector<std::byte>, conversion_error> const reduced
		= assemble_interior(format, true, source);
	ASSERT_TRUE(full.has_value());
	ASSERT_TRUE(reduced.has_value());
	EXPECT_LT(reduced->size(), full->size());
}

TEST(AssembleInterior, OldVersionsRejectFacesWithManyPoints) {
	geometry_pools pools{};
	pooled_surface surface{};
	pooled_brush brush{ .id = 42, .hullPoints = {}, .surfaces = { 0 } };
	for (std::uint32_t i = 0; i != 300; ++i) {
		double const angle = 2.0 * std::numbers::pi * double(i) / 300.0;
		pools.points.push_back({ std::cos(angle), std::sin(angle), 0.0 });
		surface.points.push_back(i);
		brush.hullPoints.push_back(i);
	}
	pools.planes.push_back(pooled_plane{
		.normal = { 0, 0, 1 }, .dist = 0, .inverse = std::nullopt });
	surface.plane = 0;
	surface.brushId = 42;
	pools.surfaces.push_back(surface);
	pools.brushes.push_back(brush);

	bsp_tree const tree = build_bsp_tree(pools, bsp_strategy::none, 1e-6, 1);
	interior_source const source{ .pools = pools,
								  .tree = tree,
								  .detailLevel = 0,
								  .ambientColor = {},
								  .ambientColorEmergency = {} };
	std::expected<std::vector<std::byte>, conversion_error> const bytes
		= assemble_interior(
			make_dif_format(dif_engine::tge, 0).value(), false, source
		);
	ASSERT_FALSE(bytes.has_value());
	EXPECT_EQ(bytes.error().msg, conversion_msg::capacity_exceeded);
	EXPECT_TRUE(bytes.error().context.starts_with(u8"brush 42:"));
}

TEST(AssembleDif, EmptyContainer) {
	std::vector<std::byte> const bytes = assemble_dif(dif_contents{});
	byte_reader in{ bytes };
	EXPECT_EQ(in.u32(), 44);
	EXPECT_EQ(in.u8(), 0);
	for (std::size_t i = 0; i != 9; ++i) {
		EXPECT_EQ(in.u32(), 0);
	}
	EXPECT_EQ(in.remaining(), 0);
}

TEST(AssembleDif, TriggerPolyhedronEnclosesItsBox) {
	dif_contents contents{};
	contents.triggers.push_back(dif_trigger{
		.name = u8"MustChange",
		.datablock = u8"InBoundsTrigger",
		.properties = { { u8"target", u8"start" } },
		.bounds = bounding_box{ .mins = { -1, 2, 0 }, .maxs = { 3, 4, 8 } } }
	);
	std::vector<std::byte> const bytes = assemble_dif(contents);

	byte_reader in{ bytes };
	EXPECT_EQ(in.u32(), 44);
	EXPECT_EQ(in.u8(), 0);
	EXPECT_EQ(in.u32(), 0); // Detail levels
	EXPECT_EQ(in.u32(), 0); // Sub-objects
	ASSERT_EQ(in.u32(), 1);
	EXPECT_EQ(in.string(), u8"MustChange");
	EXPECT_EQ(in.string(), u8"InBoundsTrigger");
	ASSERT_EQ(in.u32(), 1);
	EXPECT_EQ(in.string(), u8"target");
	EXPECT_EQ(in.string(), u8"start");

	ASSERT_EQ(in.u32(), 8);
	std::vector<double3_array> points;
	for (std::size_t i = 0; i != 8; ++i) {
		points.push_back(in.point());
	}
	ASSERT_EQ(in.u32(), 6);
	std::vector<std::pair<double3_array, double>> planes;
	for (std::size_t i = 0; i != 6; ++i) {
		double3_array const normal = in.point();
		planes.emplace_back(normal, double(in.f32()));
	}
	for (auto const & [n, d] : planes) {
		std::size_t onPlane = 0;
		for (double3_array const & p : points) {
			double const value = n[0] * p[0] + n[1] * p[1] + n[2] * p[2] + d;
			EXPECT_LE(value, 1e-6);
			onPlane += std::fabs(value) <= 1e-6 ? 1 : 0;
		}
		EXPECT_EQ(onPlane, 4);
	}

	// Both points of every edge lie on both of its planes
	ASSERT_EQ(in.u32(), 12);
	for (std::size_t i = 0; i != 12; ++i) {
		std::array<std::uint32_t, 4> const edge{
			in.u32(), in.u32(), in.u32(), in.u32()
		};
		for (std::size_t f = 0; f != 2; ++f) {
			auto const & [n, d] = planes.at(edge[f]);
			for (std::size_t v = 2; v != 4; ++v) {
				double3_array const & p = points.at(edge[v]);
				EXPECT_NEAR(n[0] * p[0] + n[1] * p[1] + n[2] * p[2] + d, 0.0, 1e-6)
					<< "edge " << i;
			}
		}
	}
	EXPECT_EQ(in.point(), (double3_array{ 0, 0, 0 }));
}
