#pragma once

#include "mathtypes.h"

#include <cmath>
#include <numbers>
#include <optional>

constexpr double NORMAL_EPSILON{ 0.00001 };
// Two edges with a sine of the angle between them below this are collinear
constexpr double COLLINEAR_EPSILON{ 1e-9 };

//
// Vector Math
//

constexpr auto
dot_product(any_vec3 auto const & a, any_vec3 auto const & b) noexcept {
	return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

template <any_vec3 VecA, any_vec3 VecB>
constexpr largest_vec3<VecA, VecB>
cross_product(VecA const & a, VecB const & b) noexcept {
	return { a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2],
			 a[0] * b[1] - a[1] * b[0] };
}

template <any_vec3 VecA, any_vec3 VecB>
constexpr largest_vec3<VecA, VecB>
vector_add(VecA const & a, VecB const & b) noexcept {
	return { a[0] + b[0], a[1] + b[1], a[2] + b[2] };
}

template <any_vec3 VecA, any_vec3 VecB>
constexpr largest_vec3<VecA, VecB>
vector_subtract(VecA const & a, VecB const & b) noexcept {
	return { a[0] - b[0], a[1] - b[1], a[2] - b[2] };
}

template <any_vec3 Vec3>
constexpr Vec3
vector_scale(Vec3 const & v, typename Vec3::value_type scale) noexcept {
	return Vec3{ v[0] * scale, v[1] * scale, v[2] * scale };
}

// a + scale * b
template <any_vec3 Vec3>
constexpr Vec3 vector_fma(
	Vec3 const & a, typename Vec3::value_type scale, Vec3 const & b
) noexcept {
	return Vec3{ a[0] + scale * b[0], a[1] + scale * b[1], a[2] + scale * b[2] };
}

template <any_vec3 T>
constexpr T::value_type vector_length(T const & v) noexcept {
	return std::hypot(v[0], v[1], v[2]);
}

template <any_vec3 T>
constexpr T::value_type vector_distance(T const & a, T const & b) noexcept {
	return vector_length(vector_subtract(a, b));
}

template <any_vec_element T>
constexpr T normalize_vector(std::array<T, 3>& v) {
	T length = vector_length(v);
	if (length < NORMAL_EPSILON) {
		v = {};
		return 0.0;
	}

	v[0] /= length;
	v[1] /= length;
	v[2] /= length;
	return length;
}

template <any_vec_element T>
[[nodiscard]] constexpr std::array<T, 3>
negate_vector(std::array<T, 3> const & v) noexcept {
	// We do 0 - x instead of just -x, so we don't unnecessarily
	// introduce signed zeroes (-0.0)
	return { T(0.0) - v[0], T(0.0) - v[1], T(0.0) - v[2] };
}

constexpr double3_array transform_point(
	double4x4_array const & m, double3_array const & p
) noexcept {
	return { m[0] * p[0] + m[1] * p[1] + m[2] * p[2] + m[3],
			 m[4] * p[0] + m[5] * p[1] + m[6] * p[2] + m[7],
			 m[8] * p[0] + m[9] * p[1] + m[10] * p[2] + m[11] };
}

constexpr double3_array
multiply_3x3(double3x3_array const & m, double3_array const & v) noexcept {
	return { m[0] * v[0] + m[1] * v[1] + m[2] * v[2],
			 m[3] * v[0] + m[4] * v[1] + m[5] * v[2],
			 m[6] * v[0] + m[7] * v[1] + m[8] * v[2] };
}

// Inverse transpose of the linear (upper-left 3x3) part of the matrix, for
// transforming plane normals. std::nullopt if that part is singular
constexpr std::optional<double3x3_array>
linear_inverse_transpose(double4x4_array const & m) noexcept {
	// Cofactors of the 3x3 part
	double3x3_array const cofactors{
		m[5] * m[10] - m[6] * m[9], m[6] * m[8] - m[4] * m[10],
		m[4] * m[9] - m[5] * m[8],	m[2] * m[9] - m[1] * m[10],
		m[0] * m[10] - m[2] * m[8], m[1] * m[8] - m[0] * m[9],
		m[1] * m[6] - m[2] * m[5],	m[2] * m[4] - m[0] * m[6],
		m[0] * m[5] - m[1] * m[4]
	};
	double const determinant = m[0] * cofactors[0] + m[1] * cofactors[1]
		+ m[2] * cofactors[2];
	if (std::fabs(determinant) < NORMAL_EPSILON * NORMAL_EPSILON) {
		return std::nullopt;
	}

	double3x3_array result;
	for (std::size_t i = 0; i != result.size(); ++i) {
		result[i] = cofactors[i] / determinant;
	}
	return result;
}

constexpr double3_array matrix_translation(double4x4_array const & m
) noexcept {
	return { m[3], m[7], m[11] };
}

// Rotates v around the unit-length axis (Rodrigues' rotation formula)
inline double3_array rotate_around_axis(
	double3_array const & v, double3_array const & axis, double degrees
) noexcept {
	double const radians = degrees * (std::numbers::pi / 180.0);
	double const c = std::cos(radians);
	double const s = std::sin(radians);
	double3_array const axisCrossV = cross_product(axis, v);
	double const axisDotV = dot_product(axis, v);
	return { v[0] * c + axisCrossV[0] * s + axis[0] * axisDotV * (1.0 - c),
			 v[1] * c + axisCrossV[1] * s + axis[1] * axisDotV * (1.0 - c),
			 v[2] * c + axisCrossV[2] * s + axis[2] * axisDotV * (1.0 - c) };
}
