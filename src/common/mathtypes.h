#pragma once

#include <array>
#include <concepts>
#include <type_traits>

using float3_array = std::array<float, 3>;	 // x, y, z
using double3_array = std::array<double, 3>; // x, y, z
using double4_array = std::array<double, 4>; // x, y, z, w
// Row-major 3x3 matrix
using double3x3_array = std::array<double, 9>;
// Row-major 4x4 matrix, the translation is in elements 3, 7 and 11
using double4x4_array = std::array<double, 16>;

template <class T>
concept any_vec_element = std::floating_point<T>;

template <class T>
concept any_vec3 = std::floating_point<typename T::value_type>
	&& std::same_as<T, std::array<typename T::value_type, 3>>;

template <any_vec3 FirstVec3, any_vec3... Rest>
struct largest_vec3_helper final {
	using type = std::conditional_t<
		std::is_same_v<FirstVec3, double3_array>,
		double3_array,
		typename largest_vec3_helper<Rest...>::type>;
};

template <any_vec3 FirstVec3>
struct largest_vec3_helper<FirstVec3> final {
	using type = FirstVec3;
};

template <any_vec3 FirstVec3, any_vec3... Rest>
using largest_vec3 = largest_vec3_helper<FirstVec3, Rest...>::type;

constexpr float3_array to_float3(double3_array const & input) noexcept {
	return { (float) input[0], (float) input[1], (float) input[2] };
}

constexpr double3_array to_double3(float3_array const & input) noexcept {
	return { (double) input[0], (double) input[1], (double) input[2] };
}

constexpr double4x4_array identity_matrix{ 1.0, 0.0, 0.0, 0.0, 0.0, 1.0,
										   0.0, 0.0, 0.0, 0.0, 1.0, 0.0,
										   0.0, 0.0, 0.0, 1.0 };
