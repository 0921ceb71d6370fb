#include "conversion.h"
#include "conversion_settings.h"
#include "filelib.h"
#include "log.h"
#include "numeric_string_conversions.h"
#include "project_constants.h"
#include "threads.h"
#include "time_counter.h"
#include "utf8.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <utility>

using namespace std::literals;

static conversion_settings g_settings{};
static bool g_silent = cli_option_defaults::silent;
static bool g_info = cli_option_defaults::info;

// =====================================================================================
//  Usage
// =====================================================================================
static void Usage(int exitCode = 1) {
	Banner();

	Log("\n-= %s Options =-\n\n", (char const *) g_Program.data());
	Log("    -s, --silent          : Don't show progress bars\n");
	Log("    -d, --dif-version #   : Interior version to write (default %u)\n",
		cli_option_defaults::difVersion);
	Log("    -e, --engine-version %s : Target engine (default %s)\n",
		(char const *) dif_engine_options.data(),
		(char const *) name_of_dif_engine(cli_option_defaults::engine).data()
	);
	Log("    --mb [on|off]         : Leave out what Marble Blast doesn't read (default %s)\n",
		cli_option_defaults::marbleBlastOptimized ? "on" : "off");
	Log("    --bsp %s : BSP splitting strategy\n",
		(char const *) bsp_strategy_options.data());
	Log("    --epsilon-point #     : Distance within which points are merged\n"
	);
	Log("    --epsilon-plane #     : Difference within which planes are merged\n"
	);
	Log("    -threads #            : manually specify the number of threads to run\n"
	);
	Log("    -low | -high          : run program an altered priority level\n"
	);
	Log("    -nolog                : don't generate the compile logfiles\n");
	Log("    -verbose              : compile with verbose messages\n");
	Log("    -noinfo               : Do not show tool configuration information\n"
	);
	Log("    -dev %s : compile with developer logging\n",
		(char const *) developer_level_options.data());
	Log("    --help                : Show this help\n");
	Log("    --version             : Show the version\n\n");
	Log("    csxfile               : The Constructor scene to convert\n\n");

	exit(exitCode);
}

// =====================================================================================
//  Settings
// =====================================================================================
static void Settings() {
	char const * tmp;

	if (!g_info) {
		return;
	}

	Log("\nCurrent %s Settings\n", (char const *) g_Program.data());
	Log("Name               |  Setting  |  Default\n"
		"-------------------|-----------|-------------------------\n");

	Log("threads             [ %7td ] [  Varies ]\n", g_numthreads);
	Log("verbose             [ %7s ] [ %7s ]\n",
		g_verbose ? "on" : "off",
		cli_option_defaults::verbose ? "on" : "off");
	Log("log                 [ %7s ] [ %7s ]\n",
		g_log ? "on" : "off",
		cli_option_defaults::log ? "on" : "off");
	Log("developer           [ %7s ] [ %7s ]\n",
		(char const *) name_of_developer_level(g_developer).data(),
		(char const *)
			name_of_developer_level(cli_option_defaults::developer)
				.data());

	switch (g_threadpriority) {
		case q_threadpriority::eThreadPriorityNormal:
		default:
			tmp = "Normal";
			break;
		case q_threadpriority::eThreadPriorityLow:
			tmp = "Low";
			break;
		case q_threadpriority::eThreadPriorityHigh:
			tmp = "High";
			break;
	}
	Log("priority            [ %7s ] [ %7s ]\n", tmp, "Normal");
	Log("\n");

	Log("engine              [ %7s ] [ %7s ]\n",
		(char const *) name_of_dif_engine(g_settings.engine).data(),
		(char const *) name_of_dif_engine(cli_option_defaults::engine).data()
	);
	Log("dif version         [ %7u ] [ %7u ]\n",
		g_settings.difVersion,
		cli_option_defaults::difVersion);
	Log("marble blast only   [ %7s ] [ %7s ]\n",
		g_settings.marbleBlastOptimized ? "on" : "off",
		cli_option_defaults::marbleBlastOptimized ? "on" : "off");
	Log("bsp                 [ %10s ] [ %10s ]\n",
		(char const *) name_of_bsp_strategy(g_settings.bspStrategy).data(),
		(char const *)
			name_of_bsp_strategy(cli_option_defaults::bspStrategy)
				.data());
	Log("point epsilon       [ %7g ] [ %7g ]\n",
		g_settings.pointEpsilon,
		cli_option_defaults::pointEpsilon);
	Log("plane epsilon       [ %7g ] [ %7g ]\n",
		g_settings.planeEpsilon,
		cli_option_defaults::planeEpsilon);
	Log("silent              [ %7s ] [ %7s ]\n",
		g_silent ? "on" : "off",
		cli_option_defaults::silent ? "on" : "off");
	Log("\n\n");
}

// Draws the progress events until the channel is closed
static void show_progress(progress_channel& channel) {
	constexpr std::size_t barWidth = 40;
	while (std::optional<progress_event> event = channel.receive()) {
		if (event->total == 0) {
			PrintConsole("%s\n", (char const *) event->phase.c_str());
			continue;
		}
		if (event->current >= event->total) {
			PrintConsole(
				"\r%-24s [%s] %u/%u\n",
				(char const *) event->finishPhase.c_str(),
				std::string(barWidth, '=').c_str(),
				event->current,
				event->total
			);
			continue;
		}
		std::size_t const filled = std::size_t(event->current) * barWidth
			/ event->total;
		std::string bar(filled, '=');
		bar.resize(barWidth, ' ');
		PrintConsole(
			"\r%-24s [%s] %u/%u",
			(char const *) event->phase.c_str(),
			bar.c_str(),
			event->current,
			event->total
		);
		FlushConsole();
	}
}

// <base>.dif, then <base>-1.dif, <base>-2.dif...
static std::filesystem::path output_path(std::size_t fileNumber) {
	std::filesystem::path path{ g_Mapname };
	if (fileNumber != 0) {
		path += "-" + std::to_string(fileNumber);
	}
	path += ".dif";
	return path;
}

static int ProcessFile(std::filesystem::path const & csxPath) {
	std::optional<std::u8string> const csxText = read_utf8_file(
		csxPath, true
	);
	if (!csxText) {
		Fatal(
			conversion_msg::unreadable_input,
			"Could not read %s",
			csxPath.c_str()
		);
		return 1;
	}

	std::optional<progress_channel> channel;
	std::optional<std::jthread> progressThread;
	if (!g_silent) {
		channel.emplace();
		progressThread.emplace([&channel]() { show_progress(*channel); });
	}

	std::expected<conversion_output, conversion_error> result
		= convert_csx_to_dif(
			csxText.value(), g_settings, channel ? &*channel : nullptr
		);

	if (channel) {
		channel->close();
		progressThread.reset();
	}

	if (!result) {
		Fatal(
			result.error().msg,
			"%s: %s",
			(char const *) name_of_message(result.error().msg).data(),
			(char const *) result.error().context.c_str()
		);
		return 1;
	}

	conversion_output const & output = result.value();
	for (std::size_t i = 0; i != output.files.size(); ++i) {
		std::filesystem::path const path = output_path(i);
		if (!write_binary_file(path, output.files[i])) {
			Fatal(
				conversion_msg::output_write_failed,
				"Could not write %s",
				path.c_str()
			);
			return 1;
		}
		Log("Wrote %s\n", path.c_str());
	}

	for (std::size_t i = 0; i != output.reports.size(); ++i) {
		bsp_report const & report = output.reports[i];
		Log("BSP Report %zu\n", i);
		Log("Raycast Coverage: %zu/%zu (%.2f%% of surface area)\n",
			report.hit,
			report.total,
			report.hitAreaPercentage);
		Log("Balance Factor: %g\n", report.balanceFactor);
		Verbose(
			"Nodes: %zu, leaves: %zu, depth: %zu, depth-limited leaves: %zu\n",
			report.nodeCount,
			report.leafCount,
			report.maxDepth,
			report.depthLimitedLeaves
		);
	}
	if (output.unboundPathNodesDropped != 0) {
		Log("%zu path nodes or triggers without an elevator were dropped\n",
			output.unboundPathNodesDropped);
	}
	return 0;
}

static bool is_option(char const * arg, std::u8string_view name) {
	return strings_equal_with_ascii_case_insensitivity(
		to_u8string_view(arg), name
	);
}

int main(int const argc, char** argv) {
	char const * csxname_from_arg = nullptr;

	g_Program = u8"csx2dif";

	if (argc == 1) {
		Usage();
	}

	for (int i = 1; i < argc; i++) {
		if (is_option(argv[i], u8"--help") || is_option(argv[i], u8"-h")) {
			Usage(0);
		} else if (is_option(argv[i], u8"--version")) {
			Banner();
			return 0;
		} else if (is_option(argv[i], u8"-s")
				   || is_option(argv[i], u8"--silent")) {
			g_silent = true;
		} else if (is_option(argv[i], u8"-d")
				   || is_option(argv[i], u8"--dif-version")) {
			if (i + 1 < argc) {
				std::optional<std::uint32_t> const version
					= number_from_string<std::uint32_t>(
						to_u8string_view(argv[++i])
					);
				if (!version) {
					Log("Invalid DIF version \"%s\"\n", argv[i]);
					Usage();
				}
				g_settings.difVersion = version.value();
			} else {
				Usage();
			}
		} else if (is_option(argv[i], u8"-e")
				   || is_option(argv[i], u8"--engine-version")) {
			if (i + 1 < argc) {
				std::optional<dif_engine> const engine = dif_engine_from_string(
					to_u8string_view(argv[++i])
				);
				if (!engine) {
					Log("Invalid engine \"%s\"\n", argv[i]);
					Usage();
				}
				g_settings.engine = engine.value();
			} else {
				Usage();
			}
		} else if (is_option(argv[i], u8"--mb")) {
			// The value is optional
			if (i + 1 < argc && is_option(argv[i + 1], u8"off")) {
				g_settings.marbleBlastOptimized = false;
				++i;
			} else {
				g_settings.marbleBlastOptimized = true;
				if (i + 1 < argc && is_option(argv[i + 1], u8"on")) {
					++i;
				}
			}
		} else if (is_option(argv[i], u8"--bsp")) {
			if (i + 1 < argc) {
				std::optional<bsp_strategy> const strategy
					= bsp_strategy_from_string(to_u8string_view(argv[++i]));
				if (!strategy) {
					Log("Invalid BSP strategy \"%s\"\n", argv[i]);
					Usage();
				}
				g_settings.bspStrategy = strategy.value();
			} else {
				Usage();
			}
		} else if (is_option(argv[i], u8"--epsilon-point")
				   || is_option(argv[i], u8"--epsilon-plane")) {
			bool const forPoints = is_option(argv[i], u8"--epsilon-point");
			if (i + 1 < argc) {
				std::optional<double> const epsilon
					= number_from_string<double>(to_u8string_view(argv[++i])
					);
				if (!epsilon || epsilon.value() < 0.0) {
					Log("Invalid epsilon \"%s\"\n", argv[i]);
					Usage();
				}
				(forPoints ? g_settings.pointEpsilon : g_settings.planeEpsilon)
					= epsilon.value();
			} else {
				Usage();
			}
		} else if (is_option(argv[i], u8"-threads")) {
			if (i + 1 < argc) {
				g_numthreads = number_from_string<std::ptrdiff_t>(
								   to_u8string_view(argv[++i])
				)
								   .value_or(-1);

				if (std::cmp_greater(g_numthreads, MAX_THREADS)) {
					Log("Expected value below %zu for '-threads'\n",
						MAX_THREADS);
					Usage();
				}
			} else {
				Usage();
			}
		} else if (is_option(argv[i], u8"-dev")) {
			if (i + 1 < argc) {
				std::optional<developer_level> dl{
					developer_level_from_string(to_u8string_view(argv[++i]))
				};
				if (dl) {
					g_developer = dl.value();
				} else {
					Log("Invalid developer level\n");
					Usage();
				}
			} else {
				Usage();
			}
		} else if (is_option(argv[i], u8"-verbose")) {
			g_verbose = true;
		} else if (is_option(argv[i], u8"-noinfo")) {
			g_info = false;
		} else if (is_option(argv[i], u8"-low")) {
			g_threadpriority = q_threadpriority::eThreadPriorityLow;
		} else if (is_option(argv[i], u8"-high")) {
			g_threadpriority = q_threadpriority::eThreadPriorityHigh;
		} else if (is_option(argv[i], u8"-nolog")) {
			g_log = false;
		} else if (argv[i][0] == '-') {
			Log("Unknown option \"%s\"\n", argv[i]);
			Usage();
		} else if (!csxname_from_arg) {
			csxname_from_arg = argv[i];
		} else {
			Log("Unknown option \"%s\"\n", argv[i]);
			Usage();
		}
	}

	if (!csxname_from_arg) {
		Log("No csxfile specified\n");
		Usage();
	}
	std::filesystem::path const csxPath{ csxname_from_arg,
										 std::filesystem::path::auto_format };
	g_Mapname = path_without_extension(csxPath);

	ResetLog();
	ResetErrorLog();
	OpenLog();
	atexit(CloseLog);
	ThreadSetDefault();
	ThreadSetPriority(g_threadpriority);
	LogStart(argc, argv);
	g_settings.numberOfThreads = std::size_t(g_numthreads);
	Settings();

	time_counter timeCounter;
	int const exitCode = ProcessFile(csxPath);
	LogTimeElapsed(timeCounter.get_total());
	return exitCode;
}
