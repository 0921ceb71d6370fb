#include "threads.h"

#include "cli_option_defaults.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

#ifdef SYSTEM_POSIX
#include <sys/resource.h>
#endif

std::ptrdiff_t g_numthreads = cli_option_defaults::numberOfThreads;
q_threadpriority g_threadpriority = cli_option_defaults::threadPriority;

static thread_local bool insideWorker = false;

std::size_t resolve_thread_count(std::ptrdiff_t requested) noexcept {
	if (requested <= 0) {
		return std::clamp<std::size_t>(
			std::thread::hardware_concurrency(), 1, MAX_THREADS
		);
	}
	return std::min<std::size_t>(requested, MAX_THREADS);
}

void ThreadSetDefault() {
	g_numthreads = resolve_thread_count(g_numthreads);
}

void ThreadSetPriority(q_threadpriority type) {
	g_threadpriority = type;

#ifdef SYSTEM_POSIX
	int val;
	// Currently in Linux land users are incapable of raising the priority
	// level of their processes Unless you are root -high is useless . . .
	switch (g_threadpriority) {
		case q_threadpriority::eThreadPriorityLow:
			val = PRIO_MAX;
			break;

		case q_threadpriority::eThreadPriorityHigh:
			val = PRIO_MIN;
			break;

		case q_threadpriority::eThreadPriorityNormal:
		default:
			val = 0;
			break;
	}
	if (setpriority(PRIO_PROCESS, 0, val) == -1) {
		Developer(
			developer_level::warning,
			"Could not change the process priority\n"
		);
	}
#endif
}

void run_threads_on_individual(
	std::size_t workCount,
	std::size_t numThreads,
	std::function<void(std::size_t)> const & func
) {
	numThreads = std::min(numThreads, workCount);
	if (numThreads <= 1 || insideWorker) {
		for (std::size_t workIndex = 0; workIndex != workCount; ++workIndex) {
			func(workIndex);
		}
		return;
	}

	std::atomic<std::size_t> dispatch{ 0 };
	auto const workerFunction = [&dispatch, workCount, &func]() {
		insideWorker = true;
		for (std::size_t workIndex = dispatch.fetch_add(1);
			 workIndex < workCount;
			 workIndex = dispatch.fetch_add(1)) {
			func(workIndex);
		}
		insideWorker = false;
	};

	Developer(
		developer_level::spam,
		"Running %zu work items on %zu threads\n",
		workCount,
		numThreads
	);
	{
		std::vector<std::jthread> workThreads;
		workThreads.reserve(numThreads);
		for (std::size_t i = 0; i != numThreads; ++i) {
			workThreads.emplace_back(workerFunction);
		}
		// The jthreads join here
	}
}
