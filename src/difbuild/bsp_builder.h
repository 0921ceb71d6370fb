#pragma once

#include "geometry.h"
#include "progress_channel.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

enum class bsp_strategy : std::uint8_t {
	// Scores every distinct plane of the set
	exhaustive,
	// Scores a random subset of the planes
	sampling,
	// A single leaf with every surface
	none
};

constexpr std::u8string_view bsp_strategy_options{
	u8"exhaustive|sampling|none"
};

std::optional<bsp_strategy> bsp_strategy_from_string(std::u8string_view name
) noexcept;
std::u8string_view name_of_bsp_strategy(bsp_strategy strategy) noexcept;

constexpr std::size_t bsp_max_depth = 64;
constexpr std::size_t bsp_sample_size = 32;
// Distance within which a point counts as being on a splitting plane
constexpr double bsp_epsilon = 1e-4;
constexpr std::uint32_t bsp_sampling_seed = 42;

using bsp_node_index = std::uint32_t;

struct bsp_node final {
	bool isLeaf{ true };
	plane_index planeNumber{};
	bsp_node_index front{};
	bsp_node_index back{};
	// Leaf: the surfaces with a fragment in the leaf's cell.
	// Internal node: the surfaces lying on the node's plane
	std::vector<surface_index> surfaces;
};

struct bsp_tree final {
	// nodes[0] is the root. Children always come after their parent
	std::vector<bsp_node> nodes;
	std::size_t maxDepth{};
	// Leaves that were forced by bsp_max_depth
	std::size_t depthLimitedLeaves{};
};

struct bsp_report final {
	std::size_t hit{};
	std::size_t total{};
	double hitAreaPercentage{};
	double balanceFactor{};
	std::size_t nodeCount{};
	std::size_t leafCount{};
	std::size_t maxDepth{};
	std::size_t depthLimitedLeaves{};
};

// Splitting planes are chosen among the surfaces' own planes. Straddling
// surfaces are clipped, and the new points are snapped to the pooled points
// within pointEpsilon. Candidate scoring uses up to numThreads threads.
// Progress is posted as "Building <progressName>", which must be unique
// among the builds sharing the channel
bsp_tree build_bsp_tree(
	geometry_pools const & pools,
	bsp_strategy strategy,
	double pointEpsilon,
	std::size_t numThreads,
	progress_channel* progress = nullptr,
	std::u8string_view progressName = u8"BSP"
);

// True if the segment from start to end reaches the surface, either in a
// leaf or on the plane of a node it crosses
bool bsp_segment_hits_surface(
	geometry_pools const & pools,
	bsp_tree const & tree,
	surface_index surface,
	double3_array const & start,
	double3_array const & end
);

// Casts a short segment through the middle of every surface
bsp_report make_bsp_report(geometry_pools const & pools, bsp_tree const & tree);
