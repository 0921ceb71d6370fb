#include "bounding_box.h"

#include "mathlib.h"

#include <algorithm>

bool is_empty(bounding_box const & box) noexcept {
	return box.mins[0] > box.maxs[0] || box.mins[1] > box.maxs[1]
		|| box.mins[2] > box.maxs[2];
}

double3_array bounding_box_center(bounding_box const & box) noexcept {
	if (is_empty(box)) {
		return {};
	}
	return vector_scale(vector_add(box.mins, box.maxs), 0.5);
}

double3_array bounding_box_extent(bounding_box const & box) noexcept {
	if (is_empty(box)) {
		return {};
	}
	return vector_subtract(box.maxs, box.mins);
}

double bounding_box_radius(bounding_box const & box) noexcept {
	return vector_length(bounding_box_extent(box)) * 0.5;
}

void add_to_bounding_box(bounding_box& thisBox, double3_array const & point)
	noexcept {
	thisBox.mins[0] = std::min(thisBox.mins[0], point[0]);
	thisBox.maxs[0] = std::max(thisBox.maxs[0], point[0]);
	thisBox.mins[1] = std::min(thisBox.mins[1], point[1]);
	thisBox.maxs[1] = std::max(thisBox.maxs[1], point[1]);
	thisBox.mins[2] = std::min(thisBox.mins[2], point[2]);
	thisBox.maxs[2] = std::max(thisBox.maxs[2], point[2]);
}

void add_to_bounding_box(bounding_box& thisBox, float3_array const & point)
	noexcept {
	add_to_bounding_box(thisBox, to_double3(point));
}
