#include "conversion.h"

#include "brush_ingest.h"
#include "capacity_splitter.h"
#include "csx_document.h"
#include "dif_assembler.h"
#include "entity_binder.h"
#include "geometry_pools.h"
#include "log.h"
#include "mathlib.h"
#include "threads.h"
#include "time_counter.h"

#include <algorithm>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace {
	// A csx_brush together with the detail level it was authored in
	struct owned_brush final {
		csx_brush const * brush;
		csx_detail_level const * detailLevel;
	};

	// One interior to build, independent of every other
	struct interior_job final {
		geometry_pools pools;
		std::uint32_t detailLevel{};
		double3_array ambientColor{};
		double3_array ambientColorEmergency{};
	};

	struct interior_result final {
		std::vector<std::byte> bytes;
		std::optional<bsp_report> report;
	};
} // namespace

static std::optional<conversion_error>
cancelled_error(std::stop_token const & stopToken, char const * phase) {
	if (!stopToken.stop_requested()) {
		return std::nullopt;
	}
	return make_conversion_error(
		conversion_msg::tool_cancelled, "cancelled while %s", phase
	);
}

static void post_status(progress_channel* progress, std::u8string_view status) {
	if (progress) {
		progress->post_status(status);
	}
}

static geometry_pools pool_brushes(
	std::span<owned_brush const> brushes,
	conversion_settings const & settings,
	std::size_t& degenerateFaces
) {
	std::vector<ingested_brush> ingested;
	ingested.reserve(brushes.size());
	for (owned_brush const & b : brushes) {
		ingested.emplace_back(
			ingest_brush(*b.brush, b.detailLevel->brushScale, degenerateFaces)
		);
	}
	deduplicated_geometry result = deduplicate(
		ingested, settings.pointEpsilon, settings.planeEpsilon
	);
	degenerateFaces += result.degenerateFaces;
	return std::move(result.pools);
}

static bounding_box trigger_bounds(std::span<owned_brush const> brushes) {
	if (brushes.empty()) {
		return bounding_box{};
	}
	bounding_box bounds{ empty_bounding_box };
	for (owned_brush const & b : brushes) {
		for (double3_array const & vertex : b.brush->vertices) {
			add_to_bounding_box(
				bounds, transform_point(b.brush->transform, vertex)
			);
		}
	}
	return is_empty(bounds) ? bounding_box{} : bounds;
}

static std::expected<interior_result, conversion_error> build_interior(
	interior_job const & job,
	dif_format const & format,
	conversion_settings const & settings,
	std::size_t numThreads,
	progress_channel* progress,
	std::size_t jobNumber
) {
	// One phase per interior, so every counter only moves forward
	std::string const number = std::to_string(jobNumber);
	std::u8string progressName{ u8"BSP " };
	progressName.append(number.begin(), number.end());
	bsp_tree const tree = build_bsp_tree(
		job.pools,
		settings.bspStrategy,
		settings.pointEpsilon,
		numThreads,
		progress,
		progressName
	);
	std::optional<bsp_report> report;
	if (settings.bspStrategy != bsp_strategy::none) {
		report = make_bsp_report(job.pools, tree);
	}

	interior_source const source{
		.pools = job.pools,
		.tree = tree,
		.detailLevel = job.detailLevel,
		.ambientColor = job.ambientColor,
		.ambientColorEmergency = job.ambientColorEmergency
	};
	return assemble_interior(format, settings.marbleBlastOptimized, source)
		.transform([&report](std::vector<std::byte> bytes) {
			return interior_result{ .bytes = std::move(bytes),
									.report = report };
		});
}

std::expected<conversion_output, conversion_error> convert_csx_to_dif(
	std::u8string_view csxText,
	conversion_settings const & settings,
	progress_channel* progress,
	std::stop_token stopToken
) {
	std::expected<dif_format, conversion_error> const formatOrError
		= make_dif_format(settings.engine, settings.difVersion);
	if (!formatOrError) [[unlikely]] {
		return std::unexpected(formatOrError.error());
	}
	dif_format const format = formatOrError.value();
	capacity_limits const limits = format.limits();

	time_counter timer;
	post_status(progress, u8"Parsing CSX");
	std::expected<csx_scene, conversion_error> sceneOrError
		= parse_csx_document(csxText);
	if (!sceneOrError) [[unlikely]] {
		return std::unexpected(std::move(sceneOrError.error()));
	}
	csx_scene const & scene = sceneOrError.value();
	Verbose(
		"Parsed %zu detail levels in %.2f seconds\n",
		scene.detailLevels.size(),
		timer.get_total()
	);
	if (auto cancelled = cancelled_error(stopToken, "parsing")) {
		return std::unexpected(std::move(cancelled.value()));
	}

	conversion_output output{};

	// Entities of every detail level, in document order
	std::vector<csx_entity> entities;
	for (csx_detail_level const & detailLevel : scene.detailLevels) {
		entities.insert(
			entities.end(),
			detailLevel.entities.begin(),
			detailLevel.entities.end()
		);
	}
	std::ranges::stable_sort(entities, {}, &csx_entity::inputOrder);
	entity_bindings const bindings = bind_entities(entities);
	output.unboundPathNodesDropped = bindings.unboundDropped;

	// Brushes of elevators and triggers are not world geometry
	std::unordered_set<std::int32_t> entityOwners;
	for (elevator_binding const & binding : bindings.elevators) {
		entityOwners.insert(binding.elevator.id);
		for (csx_entity const & trigger : binding.triggers) {
			entityOwners.insert(trigger.id);
		}
	}

	std::vector<std::vector<owned_brush>> worldBrushes(
		scene.detailLevels.size()
	);
	std::unordered_map<std::int32_t, std::vector<owned_brush>> entityBrushes;
	for (std::size_t dl = 0; dl != scene.detailLevels.size(); ++dl) {
		csx_detail_level const & detailLevel = scene.detailLevels[dl];
		for (csx_brush const & brush : detailLevel.brushes) {
			owned_brush const owned{ .brush = &brush,
									 .detailLevel = &detailLevel };
			if (!entityOwners.contains(brush.owner)) {
				worldBrushes[dl].push_back(owned);
			} else {
				entityBrushes[brush.owner].push_back(owned);
			}
		}
	}

	post_status(progress, u8"Deduplicating geometry");
	csx_detail_level const & primaryLevel = scene.detailLevels.front();
	std::vector<interior_job> jobs;

	geometry_pools const primaryPools = pool_brushes(
		worldBrushes[0], settings, output.degenerateFacesDropped
	);
	std::expected<std::vector<geometry_pools>, conversion_error> unitsOrError
		= split_by_capacity(primaryPools, limits);
	if (!unitsOrError) [[unlikely]] {
		return std::unexpected(std::move(unitsOrError.error()));
	}
	std::vector<geometry_pools>& units = unitsOrError.value();
	if (units.size() > 1) {
		Log("The interior was split into %zu files to fit the DIF format\n",
			units.size());
	}
	jobs.emplace_back(interior_job{
		.pools = std::move(units.front()),
		.detailLevel = 0,
		.ambientColor = primaryLevel.ambientColor,
		.ambientColorEmergency = primaryLevel.ambientColorEmergency });

	for (std::size_t dl = 1; dl != scene.detailLevels.size(); ++dl) {
		std::string const what = "detail level " + std::to_string(dl);
		std::expected<geometry_pools, conversion_error> pools
			= fit_in_one_unit(
				pool_brushes(
					worldBrushes[dl], settings, output.degenerateFacesDropped
				),
				limits,
				what.c_str()
			);
		if (!pools) [[unlikely]] {
			return std::unexpected(std::move(pools.error()));
		}
		jobs.emplace_back(interior_job{
			.pools = std::move(pools.value()),
			.detailLevel = std::uint32_t(dl),
			.ambientColor = scene.detailLevels[dl].ambientColor,
			.ambientColorEmergency = scene.detailLevels[dl]
										 .ambientColorEmergency });
	}

	// Elevators become sub-objects; their triggers keep the order in which
	// they were bound
	dif_contents primary{};
	std::vector<elevator_binding const *> keptElevators;
	for (elevator_binding const & binding : bindings.elevators) {
		std::uint32_t const firstTriggerId = primary.triggers.size();
		for (csx_entity const & trigger : binding.triggers) {
			auto const it = entityBrushes.find(trigger.id);
			primary.triggers.push_back(make_trigger(
				trigger,
				it == entityBrushes.end() ? bounding_box{}
										  : trigger_bounds(it->second)
			));
		}

		csx_entity const & elevator = binding.elevator;
		auto const it = entityBrushes.find(elevator.id);
		if (binding.pathNodes.empty()) {
			Warning(
				"%s %d has no path nodes and was skipped",
				(char const *) elevator.classname.c_str(),
				elevator.id
			);
			continue;
		}
		geometry_pools elevatorPools;
		if (it != entityBrushes.end()) {
			elevatorPools = pool_brushes(
				it->second, settings, output.degenerateFacesDropped
			);
		}
		if (elevatorPools.empty()) {
			Warning(
				"%s %d has no geometry and was skipped",
				(char const *) elevator.classname.c_str(),
				elevator.id
			);
			continue;
		}

		std::string const what = "elevator " + std::to_string(elevator.id);
		std::expected<geometry_pools, conversion_error> pools
			= fit_in_one_unit(elevatorPools, limits, what.c_str());
		if (!pools) [[unlikely]] {
			return std::unexpected(std::move(pools.error()));
		}
		primary.pathFollowers.push_back(make_path_follower(
			binding, std::uint32_t(keptElevators.size()), firstTriggerId
		));
		keptElevators.push_back(&binding);
		jobs.emplace_back(interior_job{
			.pools = std::move(pools.value()),
			.detailLevel = 0,
			.ambientColor = primaryLevel.ambientColor,
			.ambientColorEmergency = primaryLevel.ambientColorEmergency });
	}
	primary.gameEntities = collect_game_entities(bindings.others);

	std::size_t const firstExtraUnit = jobs.size();
	for (std::size_t u = 1; u < units.size(); ++u) {
		jobs.emplace_back(interior_job{
			.pools = std::move(units[u]),
			.detailLevel = 0,
			.ambientColor = primaryLevel.ambientColor,
			.ambientColorEmergency = primaryLevel.ambientColorEmergency });
	}

	if (auto cancelled = cancelled_error(stopToken, "pooling geometry")) {
		return std::unexpected(std::move(cancelled.value()));
	}

	// Each interior writes only its own slot
	std::size_t const numThreads = std::max(settings.numberOfThreads, 1zu);
	std::vector<std::optional<std::expected<interior_result, conversion_error>>>
		results(jobs.size());
	run_threads_on_individual(
		jobs.size(), numThreads, [&](std::size_t jobIndex) {
			if (auto cancelled = cancelled_error(
					stopToken, "building interiors"
				)) {
				results[jobIndex] = std::unexpected(
					std::move(cancelled.value())
				);
				return;
			}
			results[jobIndex] = build_interior(
				jobs[jobIndex],
				format,
				settings,
				numThreads,
				progress,
				jobIndex + 1
			);
		}
	);

	std::vector<interior_result> interiors;
	interiors.reserve(jobs.size());
	for (std::optional<std::expected<interior_result, conversion_error>>&
			 result : results) {
		if (!result.value()) [[unlikely]] {
			return std::unexpected(std::move(result.value().error()));
		}
		interiors.emplace_back(std::move(result.value().value()));
	}

	std::size_t const firstSubObject = firstExtraUnit
		- keptElevators.size();
	for (std::size_t i = 0; i != firstExtraUnit; ++i) {
		(i < firstSubObject ? primary.detailLevels : primary.subObjects)
			.push_back(std::move(interiors[i].bytes));
	}
	output.files.push_back(assemble_dif(primary));
	for (std::size_t i = firstExtraUnit; i != interiors.size(); ++i) {
		dif_contents extra{};
		extra.detailLevels.push_back(std::move(interiors[i].bytes));
		output.files.push_back(assemble_dif(extra));
	}

	for (interior_result const & interior : interiors) {
		if (interior.report) {
			output.reports.push_back(interior.report.value());
		}
	}

	if (output.degenerateFacesDropped != 0) {
		Log("%zu degenerate faces were dropped\n",
			output.degenerateFacesDropped);
	}
	Verbose("Converted in %.2f seconds\n", timer.get_total());
	return output;
}
