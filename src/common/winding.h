#pragma once

#include "bounding_box.h"
#include "mathlib.h"

#include <optional>
#include <span>
#include <vector>

enum class face_side {
	front = 0,
	back = 1,
	on = 2,
	cross = 3
};

template <std::floating_point VecElement>
struct winding_plane final {
	std::array<VecElement, 3> normal;
	VecElement dist; // normal . x == dist for every point x on the plane
};

// Ordered convex polygon
template <std::floating_point VecElement>
class winding_base final {
  public:
	using vec_element = VecElement;
	using vec3 = std::array<vec_element, 3>;
	using plane = winding_plane<vec_element>;

  private:
	std::vector<vec3> m_Points;

  public:
	winding_base() = default;
	explicit winding_base(std::span<vec3 const> points);

	vec_element getArea() const;
	bounding_box getBounds() const;
	// Average of the points
	vec3 getCenter() const noexcept;

	// Plane through the first three points that are not collinear,
	// oriented by the winding order (counter-clockwise seen from the
	// front). std::nullopt if every point is collinear with the first
	std::optional<plane> getPlane() const;

	bool empty() const noexcept {
		return m_Points.empty();
	}

	void RemoveColinearPoints(vec_element epsilon);

	// Splits the winding by the plane. Points within epsilon of the plane
	// go to both sides; a winding entirely on one side is copied to it
	// and the other output is left empty
	void Clip(
		vec3 const & normal,
		vec_element planeDist,
		winding_base& front,
		winding_base& back,
		vec_element epsilon
	) const;

	face_side WindingOnPlaneSide(
		vec3 const & normal, vec_element planeDist, vec_element epsilon
	) const noexcept;

	inline std::span<vec3 const> points() const noexcept {
		return { m_Points };
	}

	inline std::size_t size() const noexcept {
		return m_Points.size();
	}

	// Precondition: index < size()
	inline vec3 const & point(std::size_t index) const noexcept {
		return m_Points[index];
	}

	// Precondition: index < size()
	inline vec3&
	replace_point(std::size_t index, vec3 const & newPoint) noexcept {
		m_Points[index] = newPoint;
		return m_Points[index];
	}

	inline vec3& push_point(vec3 const & newPoint) {
		return m_Points.emplace_back(newPoint);
	}

	friend inline void swap(winding_base& a, winding_base& b) noexcept {
		using std::swap;
		swap(a.m_Points, b.m_Points);
	}
};

using accurate_winding = winding_base<double>;
