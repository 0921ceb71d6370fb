#include "bsp_builder.h"

#include "geometry_pools.h"
#include "hashing.h"
#include "log.h"
#include "threads.h"
#include "utf8.h"
#include "winding.h"

#include <algorithm>
#include <array>
#include <iterator>
#include <random>
#include <utility>

using namespace std::literals;
constexpr std::array<std::u8string_view, 3> bsp_strategy_names{
	u8"exhaustive"sv, u8"sampling"sv, u8"none"sv
};

std::optional<bsp_strategy> bsp_strategy_from_string(std::u8string_view name
) noexcept {
	for (std::size_t i = 0; i != bsp_strategy_names.size(); ++i) {
		if (strings_equal_with_ascii_case_insensitivity(
				name, bsp_strategy_names[i]
			)) {
			return bsp_strategy(i);
		}
	}
	return std::nullopt;
}

std::u8string_view name_of_bsp_strategy(bsp_strategy strategy) noexcept {
	return bsp_strategy_names[std::to_underlying(strategy)];
}

namespace {
	struct bsp_fragment final {
		surface_index surface;
		plane_index plane;
		accurate_winding winding;
	};

	struct bsp_work_item final {
		bsp_node_index node;
		std::size_t depth;
		std::vector<bsp_fragment> fragments;
	};

	struct split_score final {
		std::size_t front{};
		std::size_t back{};
		std::size_t straddling{};
	};
} // namespace

// Below this many fragment classifications, threads cost more than they save
constexpr std::size_t min_parallel_classifications = 4096;

static face_side classify_fragment(
	bsp_fragment const & fragment,
	plane_index candidate,
	pooled_plane const & candidatePlane
) noexcept {
	if (fragment.plane == candidate
		|| candidatePlane.inverse == fragment.plane) {
		return face_side::on;
	}
	return fragment.winding.WindingOnPlaneSide(
		candidatePlane.normal, candidatePlane.dist, bsp_epsilon
	);
}

static split_score score_candidate(
	std::span<bsp_fragment const> fragments,
	plane_index candidate,
	pooled_plane const & candidatePlane
) noexcept {
	split_score score{};
	for (bsp_fragment const & fragment : fragments) {
		switch (classify_fragment(fragment, candidate, candidatePlane)) {
			case face_side::front:
				++score.front;
				break;
			case face_side::back:
				++score.back;
				break;
			case face_side::cross:
				++score.straddling;
				break;
			case face_side::on:
				break;
		}
	}
	return score;
}

static std::vector<surface_index>
distinct_surfaces(std::span<bsp_fragment const> fragments) {
	std::vector<surface_index> surfaces;
	for (bsp_fragment const & fragment : fragments) {
		if (std::ranges::find(surfaces, fragment.surface) == surfaces.end()) {
			surfaces.push_back(fragment.surface);
		}
	}
	return surfaces;
}

static std::vector<plane_index>
candidate_planes(std::span<bsp_fragment const> fragments) {
	std::vector<plane_index> planes;
	for (bsp_fragment const & fragment : fragments) {
		if (std::ranges::find(planes, fragment.plane) == planes.end()) {
			planes.push_back(fragment.plane);
		}
	}
	return planes;
}

// Moves points created by clipping onto nearby pooled points
static void
snap_to_pooled_points(accurate_winding& winding, point_pool const & points) {
	for (std::size_t i = 0; i != winding.size(); ++i) {
		if (std::optional<point_index> const snapped = points.find(
				winding.point(i)
			)) {
			winding.replace_point(i, points.pooled()[snapped.value()]);
		}
	}
}

// The admissible candidate with the lowest score, the first one on ties.
// std::nullopt if no candidate makes the set cheaper to scan
static std::optional<plane_index> choose_splitting_plane(
	geometry_pools const & pools,
	std::span<bsp_fragment const> fragments,
	std::span<plane_index const> candidates,
	std::size_t numThreads
) {
	std::vector<split_score> scores(candidates.size());
	std::size_t const threadsToUse = candidates.size() * fragments.size()
			< min_parallel_classifications
		? 1
		: numThreads;
	run_threads_on_individual(
		candidates.size(),
		threadsToUse,
		[&](std::size_t candidateNumber) {
			plane_index const candidate = candidates[candidateNumber];
			scores[candidateNumber] = score_candidate(
				fragments, candidate, pools.planes[candidate]
			);
		}
	);

	std::optional<plane_index> best;
	std::size_t bestScore = 0;
	for (std::size_t i = 0; i != candidates.size(); ++i) {
		split_score const & score = scores[i];
		std::size_t const scanCost = 1 + std::max(score.front, score.back)
			+ score.straddling;
		if (scanCost >= fragments.size()) {
			continue;
		}
		std::size_t const imbalance = score.front > score.back
			? score.front - score.back
			: score.back - score.front;
		std::size_t const cost = 8 * score.straddling + imbalance;
		if (!best || cost < bestScore) {
			best = candidates[i];
			bestScore = cost;
		}
	}
	return best;
}

bsp_tree build_bsp_tree(
	geometry_pools const & pools,
	bsp_strategy strategy,
	double pointEpsilon,
	std::size_t numThreads,
	progress_channel* progress,
	std::u8string_view progressName
) {
	bsp_tree tree{};
	tree.nodes.emplace_back();

	std::vector<bsp_fragment> allFragments;
	allFragments.reserve(pools.surfaces.size());
	for (surface_index s = 0; s != surface_index(pools.surfaces.size()); ++s) {
		pooled_surface const & surface = pools.surfaces[s];
		accurate_winding winding{};
		for (point_index p : surface.points) {
			winding.push_point(pools.points[p]);
		}
		allFragments.emplace_back(bsp_fragment{
			.surface = s, .plane = surface.plane, .winding = std::move(winding) }
		);
	}

	if (strategy == bsp_strategy::none) {
		tree.nodes[0].surfaces = distinct_surfaces(allFragments);
		return tree;
	}

	point_pool const snapPoints{ pools.points, pointEpsilon };
	progress_phase phase{ progress,
						  u8"Building " + std::u8string{ progressName },
						  u8"Built " + std::u8string{ progressName },
						  std::uint32_t(pools.planes.size()) };
	std::vector<bool> planeUsed(pools.planes.size(), false);
	std::uint32_t numPlanesUsed = 0;

	std::vector<bsp_work_item> work;
	work.emplace_back(bsp_work_item{
		.node = 0, .depth = 0, .fragments = std::move(allFragments) });

	while (!work.empty()) {
		bsp_work_item item{ std::move(work.back()) };
		work.pop_back();
		tree.maxDepth = std::max(tree.maxDepth, item.depth);

		std::optional<plane_index> splitter;
		if (item.fragments.size() > 1 && item.depth < bsp_max_depth) {
			std::vector<plane_index> candidates = candidate_planes(
				item.fragments
			);
			if (strategy == bsp_strategy::sampling
				&& candidates.size() > bsp_sample_size) {
				std::mt19937 generator{ std::uint32_t(
					hash_multiple(bsp_sampling_seed, item.node)
				) };
				std::vector<plane_index> sampled;
				sampled.reserve(bsp_sample_size);
				std::ranges::sample(
					candidates,
					std::back_inserter(sampled),
					bsp_sample_size,
					generator
				);
				candidates = std::move(sampled);
			}
			splitter = choose_splitting_plane(
				pools, item.fragments, candidates, numThreads
			);
		} else if (item.fragments.size() > 1) {
			++tree.depthLimitedLeaves;
		}

		if (!splitter) {
			tree.nodes[item.node].surfaces = distinct_surfaces(item.fragments
			);
			continue;
		}

		plane_index const planeNumber = splitter.value();
		pooled_plane const & plane = pools.planes[planeNumber];
		std::vector<bsp_fragment> frontFragments;
		std::vector<bsp_fragment> backFragments;
		std::vector<bsp_fragment> coplanarFragments;

		for (bsp_fragment& fragment : item.fragments) {
			switch (classify_fragment(fragment, planeNumber, plane)) {
				case face_side::front:
					frontFragments.emplace_back(std::move(fragment));
					break;
				case face_side::back:
					backFragments.emplace_back(std::move(fragment));
					break;
				case face_side::on:
					coplanarFragments.emplace_back(std::move(fragment));
					break;
				case face_side::cross: {
					accurate_winding frontWinding;
					accurate_winding backWinding;
					fragment.winding.Clip(
						plane.normal,
						plane.dist,
						frontWinding,
						backWinding,
						bsp_epsilon
					);
					snap_to_pooled_points(frontWinding, snapPoints);
					snap_to_pooled_points(backWinding, snapPoints);
					if (frontWinding.size() >= 3) {
						frontFragments.emplace_back(bsp_fragment{
							.surface = fragment.surface,
							.plane = fragment.plane,
							.winding = std::move(frontWinding) });
					}
					if (backWinding.size() >= 3) {
						backFragments.emplace_back(bsp_fragment{
							.surface = fragment.surface,
							.plane = fragment.plane,
							.winding = std::move(backWinding) });
					}
					break;
				}
			}
		}

		bsp_node_index const frontNode = bsp_node_index(tree.nodes.size());
		bsp_node_index const backNode = frontNode + 1;
		tree.nodes.emplace_back();
		tree.nodes.emplace_back();

		bsp_node& node = tree.nodes[item.node];
		node.isLeaf = false;
		node.planeNumber = planeNumber;
		node.front = frontNode;
		node.back = backNode;
		node.surfaces = distinct_surfaces(coplanarFragments);

		if (!planeUsed[planeNumber]) {
			planeUsed[planeNumber] = true;
			phase.update(++numPlanesUsed);
		}

		// The front side is built first
		work.emplace_back(bsp_work_item{ .node = backNode,
										 .depth = item.depth + 1,
										 .fragments = std::move(backFragments) }
		);
		work.emplace_back(bsp_work_item{
			.node = frontNode,
			.depth = item.depth + 1,
			.fragments = std::move(frontFragments) });
	}

	phase.finish();
	Developer(
		developer_level::spam,
		"BSP: %zu nodes, depth %zu\n",
		tree.nodes.size(),
		tree.maxDepth
	);
	return tree;
}

bool bsp_segment_hits_surface(
	geometry_pools const & pools,
	bsp_tree const & tree,
	surface_index surface,
	double3_array const & start,
	double3_array const & end
) {
	struct segment final {
		bsp_node_index node;
		double3_array start;
		double3_array end;
	};

	std::vector<segment> pending{
		segment{ .node = 0, .start = start, .end = end }
	};
	while (!pending.empty()) {
		segment const current{ pending.back() };
		pending.pop_back();
		bsp_node const & node = tree.nodes[current.node];

		if (node.isLeaf) {
			if (std::ranges::contains(node.surfaces, surface)) {
				return true;
			}
			continue;
		}

		pooled_plane const & plane = pools.planes[node.planeNumber];
		double const startDist = dot_product(plane.normal, current.start)
			- plane.dist;
		double const endDist = dot_product(plane.normal, current.end)
			- plane.dist;
		bool const startFront = startDist > bsp_epsilon;
		bool const startBack = startDist < -bsp_epsilon;
		bool const endFront = endDist > bsp_epsilon;
		bool const endBack = endDist < -bsp_epsilon;

		bool const touches = !(startFront && endFront)
			&& !(startBack && endBack);
		if (touches && std::ranges::contains(node.surfaces, surface)) {
			return true;
		}

		if ((startFront && endBack) || (startBack && endFront)) {
			double const t = startDist / (startDist - endDist);
			double3_array const middle = vector_fma(
				current.start, t, vector_subtract(current.end, current.start)
			);
			bsp_node_index const startSide = startFront ? node.front
														: node.back;
			bsp_node_index const endSide = startFront ? node.back
													  : node.front;
			pending.push_back(segment{
				.node = endSide, .start = middle, .end = current.end });
			pending.push_back(segment{
				.node = startSide, .start = current.start, .end = middle });
			continue;
		}

		bool const anyFront = startFront || endFront;
		bool const anyBack = startBack || endBack;
		if (anyFront || !anyBack) {
			pending.push_back(segment{
				.node = node.front, .start = current.start, .end = current.end }
			);
		}
		if (anyBack || !anyFront) {
			pending.push_back(segment{
				.node = node.back, .start = current.start, .end = current.end }
			);
		}
	}
	return false;
}

bsp_report make_bsp_report(geometry_pools const & pools, bsp_tree const & tree) {
	bsp_report report{};
	report.total = pools.surfaces.size();
	report.maxDepth = tree.maxDepth;
	report.depthLimitedLeaves = tree.depthLimitedLeaves;

	double totalArea = 0.0;
	double hitArea = 0.0;
	for (surface_index s = 0; s != surface_index(pools.surfaces.size()); ++s) {
		pooled_surface const & surface = pools.surfaces[s];
		accurate_winding winding{};
		for (point_index p : surface.points) {
			winding.push_point(pools.points[p]);
		}
		double const area = winding.getArea();
		totalArea += area;

		double3_array const center = winding.getCenter();
		double3_array const & normal = pools.planes[surface.plane].normal;
		if (bsp_segment_hits_surface(
				pools,
				tree,
				s,
				vector_fma(center, 0.1, normal),
				vector_fma(center, -0.1, normal)
			)) {
			++report.hit;
			hitArea += area;
		}
	}
	report.hitAreaPercentage = totalArea > 0.0 ? hitArea / totalArea * 100.0
											   : 100.0;

	// Children come after their parents, so walking backwards sees every
	// child's height before its parent's
	std::vector<std::size_t> heights(tree.nodes.size(), 0);
	double balanceSum = 0.0;
	for (std::size_t i = tree.nodes.size(); i-- > 0;) {
		bsp_node const & node = tree.nodes[i];
		if (node.isLeaf) {
			++report.leafCount;
			continue;
		}
		++report.nodeCount;
		std::size_t const frontHeight = heights[node.front];
		std::size_t const backHeight = heights[node.back];
		heights[i] = 1 + std::max(frontHeight, backHeight);
		balanceSum += double(frontHeight) - double(backHeight);
	}
	report.balanceFactor = report.nodeCount == 0
		? 0.0
		: balanceSum / double(report.nodeCount);
	return report;
}
