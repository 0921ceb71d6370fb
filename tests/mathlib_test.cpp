#include "mathlib.h"

#include <gtest/gtest.h>

TEST(NormalizeVector, TinyVectorsBecomeZero) {
	double3_array v{ 3, 0, 4 };
	EXPECT_DOUBLE_EQ(normalize_vector(v), 5.0);
	EXPECT_DOUBLE_EQ(v[0], 0.6);
	EXPECT_DOUBLE_EQ(v[2], 0.8);

	double3_array tiny{ NORMAL_EPSILON / 4, 0, 0 };
	EXPECT_EQ(normalize_vector(tiny), 0.0);
	EXPECT_EQ(tiny, (double3_array{ 0, 0, 0 }));
}

TEST(LinearInverseTranspose, ScalesNormalsInverselyAndRejectsFlatMatrices) {
	double4x4_array scale{ identity_matrix };
	scale[0] = 2.0;
	scale[3] = 7.0; // Translation has no effect
	std::optional<double3x3_array> const inverse = linear_inverse_transpose(
		scale
	);
	ASSERT_TRUE(inverse.has_value());
	EXPECT_EQ(
		multiply_3x3(inverse.value(), { 1, 1, 1 }),
		(double3_array{ 0.5, 1, 1 })
	);

	double4x4_array flat{ identity_matrix };
	flat[10] = 0.0;
	EXPECT_FALSE(linear_inverse_transpose(flat).has_value());
	flat[10] = NORMAL_EPSILON * NORMAL_EPSILON / 2;
	EXPECT_FALSE(linear_inverse_transpose(flat).has_value());
}
