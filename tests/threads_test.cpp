#include "threads.h"

#include <gtest/gtest.h>

#include <atomic>
#include <vector>

TEST(RunThreadsOnIndividual, CallsEveryIndexOnce) {
	std::vector<std::atomic<int>> calls(1000);
	run_threads_on_individual(calls.size(), 8, [&](std::size_t i) {
		++calls[i];
	});
	for (std::atomic<int> const & count : calls) {
		EXPECT_EQ(count.load(), 1);
	}
}

TEST(RunThreadsOnIndividual, NestedCallsRunOnTheCallingThread) {
	std::atomic<std::size_t> total{ 0 };
	run_threads_on_individual(4, 4, [&](std::size_t) {
		run_threads_on_individual(10, 4, [&](std::size_t) { ++total; });
	});
	EXPECT_EQ(total.load(), 40);

	// Nothing to do is not an error
	run_threads_on_individual(0, 4, [](std::size_t) { FAIL(); });
}

TEST(ResolveThreadCount, ClampsToTheThreadLimit) {
	EXPECT_EQ(resolve_thread_count(3), 3);
	EXPECT_EQ(resolve_thread_count(1000), MAX_THREADS);
	EXPECT_GE(resolve_thread_count(-1), 1);
	EXPECT_LE(resolve_thread_count(0), MAX_THREADS);
}
