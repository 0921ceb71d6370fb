#pragma once
#include <chrono>

// Accumulating stopwatch
class time_counter final {
  private:
	using clock = std::chrono::steady_clock;

	clock::time_point startTime{ clock::time_point::min() };
	clock::duration accumulated{ 0 };

	static double to_seconds(clock::duration d) noexcept {
		return std::chrono::duration_cast<std::chrono::duration<double>>(d)
			.count();
	}

  public:
	void start() noexcept {
		if (startTime == clock::time_point::min()) {
			startTime = clock::now();
		}
	}

	time_counter(bool autoStart = true) noexcept {
		if (autoStart) {
			start();
		}
	}

	void stop() noexcept {
		if (startTime == clock::time_point::min()) {
			return;
		}
		accumulated += clock::now() - startTime;
		startTime = clock::time_point::min();
	}

	double get_total() const noexcept {
		clock::duration total = accumulated;
		if (startTime != clock::time_point::min()) {
			total += clock::now() - startTime;
		}
		return to_seconds(total);
	}
};
