#include "winding.h"

#include <algorithm>

template <std::floating_point VecElement>
winding_base<VecElement>::winding_base(std::span<vec3 const> points) :
	m_Points(points.begin(), points.end()) { }

template <std::floating_point VecElement>
auto winding_base<VecElement>::getArea() const -> vec_element {
	if (size() < 3) {
		return 0.0;
	}

	vec_element total = 0.0;
	for (std::size_t i = 2; i < size(); ++i) {
		vec3 const cross = cross_product(
			vector_subtract(m_Points[i - 1], m_Points[0]),
			vector_subtract(m_Points[i], m_Points[0])
		);
		total += 0.5 * vector_length(cross);
	}
	return total;
}

template <std::floating_point VecElement>
bounding_box winding_base<VecElement>::getBounds() const {
	bounding_box bounds = empty_bounding_box;
	for (vec3 const & point : m_Points) {
		add_to_bounding_box(bounds, point);
	}
	return bounds;
}

template <std::floating_point VecElement>
auto winding_base<VecElement>::getCenter() const noexcept -> vec3 {
	vec3 center{};

	for (vec3 const & point : m_Points) {
		center = vector_add(point, center);
	}

	vec_element const scale = vec_element(1.0) / std::max(1UZ, size());
	return vector_scale(center, scale);
}

template <std::floating_point VecElement>
auto winding_base<VecElement>::getPlane() const -> std::optional<plane> {
	if (size() < 3) {
		return std::nullopt;
	}

	vec3 const & p0 = m_Points[0];
	for (std::size_t i = 1; i + 1 < size(); ++i) {
		vec3 const edge1 = vector_subtract(m_Points[i], p0);
		vec_element const edge1Length = vector_length(edge1);
		if (edge1Length == 0) {
			continue;
		}
		for (std::size_t j = i + 1; j < size(); ++j) {
			vec3 const edge2 = vector_subtract(m_Points[j], p0);
			vec3 normal = cross_product(edge1, edge2);
			vec_element const crossLength = vector_length(normal);
			if (crossLength
				<= COLLINEAR_EPSILON * edge1Length * vector_length(edge2)) {
				continue;
			}
			normal = vector_scale(normal, vec_element(1.0) / crossLength);
			return plane{ .normal = normal,
						  .dist = dot_product(p0, normal) };
		}
	}
	return std::nullopt;
}

// Remove the colinear point of any three points that form a triangle which
// is thinner than epsilon
template <std::floating_point VecElement>
void winding_base<VecElement>::RemoveColinearPoints(vec_element epsilon) {
	for (std::size_t i = 0; i < size() && size() > 2; ++i) {
		vec3 const & p1 = m_Points[(i + size() - 1) % size()];
		vec3 const & p2 = m_Points[i];
		vec3 const & p3 = m_Points[(i + 1) % size()];
		vec3 const v1 = vector_subtract(p2, p1);
		vec3 const v2 = vector_subtract(p3, p2);
		// v1 or v2 might be close to 0
		if (dot_product(v1, v2) * dot_product(v1, v2)
			>= dot_product(v1, v1) * dot_product(v2, v2)
				- epsilon * epsilon
					* (dot_product(v1, v1) + dot_product(v2, v2)
					   + epsilon * epsilon)) {
			m_Points.erase(m_Points.begin() + i);
			i = -1;
		}
	}
}

template <std::floating_point VecElement>
void winding_base<VecElement>::Clip(
	vec3 const & normal,
	vec_element dist,
	winding_base& front,
	winding_base& back,
	vec_element epsilon
) const {
	std::vector<vec_element> dists(size() + 1);
	std::vector<face_side> sides(size() + 1);
	std::array<std::size_t, 3> counts{};

	// determine sides for each point
	for (std::size_t i = 0; i < size(); i++) {
		vec_element const dot = dot_product(m_Points[i], normal) - dist;
		dists[i] = dot;
		if (dot > epsilon) {
			sides[i] = face_side::front;
		} else if (dot < -epsilon) {
			sides[i] = face_side::back;
		} else {
			sides[i] = face_side::on;
		}
		counts[(std::size_t) sides[i]]++;
	}
	sides[size()] = sides[0];
	dists[size()] = dists[0];

	front.m_Points.clear();
	back.m_Points.clear();
	if (!counts[(std::size_t) face_side::front]) {
		back = *this;
		return;
	}
	if (!counts[(std::size_t) face_side::back]) {
		front = *this;
		return;
	}

	front.m_Points.reserve(size() + 4);
	back.m_Points.reserve(size() + 4);

	for (std::size_t i = 0; i < size(); ++i) {
		vec3 const & p1 = m_Points[i];

		if (sides[i] == face_side::on) {
			front.m_Points.emplace_back(p1);
			back.m_Points.emplace_back(p1);
			continue;
		} else if (sides[i] == face_side::front) {
			front.m_Points.emplace_back(p1);
		} else if (sides[i] == face_side::back) {
			back.m_Points.emplace_back(p1);
		}

		if ((sides[i + 1] == face_side::on)
			| (sides[i + 1] == sides[i]
			)) // | instead of || for branch optimization
		{
			continue;
		}

		// generate a split point
		vec3 mid;
		vec3 const & p2 = m_Points[(i + 1) % size()];
		vec_element const dot = dists[i] / (dists[i] - dists[i + 1]);

		for (std::size_t j = 0; j < 3; j++) {
			// avoid round off error when possible
			if (normal[j] == 1) {
				mid[j] = dist;
			} else if (normal[j] == -1) {
				mid[j] = -dist;
			} else {
				mid[j] = p1[j] + dot * (p2[j] - p1[j]);
			}
		}

		front.m_Points.emplace_back(mid);
		back.m_Points.emplace_back(mid);
	}

	front.RemoveColinearPoints(epsilon);
	back.RemoveColinearPoints(epsilon);
}

template <std::floating_point VecElement>
face_side winding_base<VecElement>::WindingOnPlaneSide(
	vec3 const & normal, vec_element const dist, vec_element epsilon
) const noexcept {
	bool front = false;
	bool back = false;
	for (vec3 const & point : m_Points) {
		vec_element const d = dot_product(point, normal) - dist;
		if (d < -epsilon) {
			if (front) {
				return face_side::cross;
			}
			back = true;
			continue;
		}
		if (d > epsilon) {
			if (back) {
				return face_side::cross;
			}
			front = true;
			continue;
		}
	}

	if (back) {
		return face_side::back;
	}
	if (front) {
		return face_side::front;
	}
	return face_side::on;
}

template class winding_base<double>;
