#include "progress_channel.h"

#include <utility>

void progress_channel::post(progress_event event) {
	{
		std::scoped_lock lock{ mutex };
		if (closed) {
			return;
		}
		events.emplace_back(std::move(event));
	}
	eventPosted.notify_one();
}

void progress_channel::post_status(std::u8string_view message) {
	post(progress_event{ .current = 0,
						 .total = 0,
						 .phase = std::u8string{ message },
						 .finishPhase = {} });
}

void progress_channel::close() {
	{
		std::scoped_lock lock{ mutex };
		closed = true;
	}
	eventPosted.notify_all();
}

std::optional<progress_event> progress_channel::receive() {
	std::unique_lock lock{ mutex };
	eventPosted.wait(lock, [this] { return closed || !events.empty(); });
	if (events.empty()) {
		return std::nullopt;
	}
	progress_event event{ std::move(events.front()) };
	events.pop_front();
	return event;
}

std::optional<progress_event> progress_channel::try_receive() {
	std::scoped_lock lock{ mutex };
	if (events.empty()) {
		return std::nullopt;
	}
	progress_event event{ std::move(events.front()) };
	events.pop_front();
	return event;
}

progress_phase::progress_phase(
	progress_channel* channel,
	std::u8string_view phase,
	std::u8string_view finishPhase,
	std::uint32_t total
) :
	channel(channel),
	phase(phase),
	finishPhase(finishPhase),
	total(total) { }

void progress_phase::update(std::uint32_t current) {
	if (!channel || current < lastCurrent) {
		return;
	}
	lastCurrent = current;
	channel->post(progress_event{ .current = current,
								  .total = total,
								  .phase = phase,
								  .finishPhase = finishPhase });
}

void progress_phase::finish() {
	update(total);
}
