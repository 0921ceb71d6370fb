#pragma once

#include "mathtypes.h"

struct bounding_box final {
	double3_array mins;
	double3_array maxs;
};

constexpr bounding_box empty_bounding_box{
	.mins = double3_array{ 999999999.999, 999999999.999, 999999999.999 },
	.maxs = double3_array{ -999999999.999, -999999999.999, -999999999.999 }
};

bool is_empty(bounding_box const & box) noexcept;

double3_array bounding_box_center(bounding_box const & box) noexcept;
double3_array bounding_box_extent(bounding_box const & box) noexcept;
// Radius of the sphere around the center that encloses the box
double bounding_box_radius(bounding_box const & box) noexcept;

void add_to_bounding_box(bounding_box& thisBox, double3_array const & point)
	noexcept;
void add_to_bounding_box(bounding_box& thisBox, float3_array const & point)
	noexcept;
