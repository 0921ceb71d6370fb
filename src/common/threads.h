#pragma once

#include <cstddef>
#include <functional>

constexpr std::size_t MAX_THREADS = 64;

enum class q_threadpriority {
	eThreadPriorityLow = -1,
	eThreadPriorityNormal,
	eThreadPriorityHigh
};

extern std::ptrdiff_t g_numthreads;
extern q_threadpriority g_threadpriority;

extern void ThreadSetPriority(q_threadpriority type);

// A request <= 0 means one thread per hardware thread
std::size_t resolve_thread_count(std::ptrdiff_t requested) noexcept;
void ThreadSetDefault();

// Calls func(workIndex) once for every workIndex in [0, workCount), spread
// over at most numThreads threads, and returns when all calls have
// returned. Work indices are handed out in increasing order, but may finish
// in any order, so func must only write to state owned by its index.
// A call made from inside a worker runs everything on the calling thread.
void run_threads_on_individual(
	std::size_t workCount,
	std::size_t numThreads,
	std::function<void(std::size_t)> const & func
);
