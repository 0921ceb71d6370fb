#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

struct progress_event final {
	std::uint32_t current{};
	// 0 for plain status messages
	std::uint32_t total{};
	std::u8string phase;
	// Shown once current reaches total
	std::u8string finishPhase;
};

// Unbounded queue from any number of producers to one consumer. post()
// never blocks on the consumer
class progress_channel final {
  private:
	std::mutex mutex;
	std::condition_variable eventPosted;
	std::deque<progress_event> events;
	bool closed{ false };

  public:
	void post(progress_event event);

	// Status message without a counter
	void post_status(std::u8string_view message);

	// Ends the stream. Events posted afterwards are dropped
	void close();

	// Blocks until an event arrives. std::nullopt once the channel is
	// closed and drained
	std::optional<progress_event> receive();

	// Does not block
	std::optional<progress_event> try_receive();
};

// Posts progress for one phase, keeping its counter non-decreasing
class progress_phase final {
  private:
	progress_channel* channel;
	std::u8string phase;
	std::u8string finishPhase;
	std::uint32_t total;
	std::uint32_t lastCurrent{ 0 };

  public:
	progress_phase(
		progress_channel* channel,
		std::u8string_view phase,
		std::u8string_view finishPhase,
		std::uint32_t total
	);

	// Lower values than the last posted one are ignored
	void update(std::uint32_t current);
	void finish();
};
