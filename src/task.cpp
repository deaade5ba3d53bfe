#include "task.h"

#include <stdexcept>

task::task(const std::string &id, const std::string &payload, const connection_handle &origin,
	std::size_t failure_count)
	: id(id), payload(payload), origin(origin), failure_count(failure_count)
{
}

std::vector<std::string> task::to_frames() const
{
	return {id, payload, origin.get_channel(), origin.get_peer(), std::to_string(failure_count)};
}

task_ptr task::from_frames(const std::vector<std::string> &frames)
{
	if (frames.size() != 5) {
		throw std::invalid_argument("A task is described by 5 frames, got " + std::to_string(frames.size()));
	}

	std::size_t failures;
	try {
		failures = std::stoul(frames[4]);
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Invalid failure count '" + frames[4] + "'");
	}

	return std::make_shared<const task>(frames[0], frames[1], connection_handle(frames[2], frames[3]), failures);
}
