#ifndef TASKBROKER_TASK_H
#define TASKBROKER_TASK_H

#include <memory>
#include <string>
#include <vector>

#include "connection_handle.h"

/**
 * One unit of work submitted by a producer. Immutable, a requeued task is a new object with a higher
 * failure count.
 */
struct task {
	/** Identifier chosen by the producer, unique among pending tasks */
	const std::string id;

	/** Opaque data forwarded to the executor */
	const std::string payload;

	/** Producer connection which receives the result */
	const connection_handle origin;

	/** How many executors already failed while holding this task */
	const std::size_t failure_count;

	/**
	 * @param id identifier of the task
	 * @param payload data for the executor
	 * @param origin producer connection
	 * @param failure_count failed attempts so far
	 */
	task(const std::string &id, const std::string &payload, const connection_handle &origin,
		std::size_t failure_count = 0);

	/**
	 * Serialize the task into reactor message frames, so that it can be passed between handlers.
	 * @return frames: id, payload, origin channel, origin peer, failure count
	 */
	std::vector<std::string> to_frames() const;

	/**
	 * Counterpart of @ref to_frames.
	 * @param frames message frames
	 * @return the task
	 * @throws std::invalid_argument if the frames do not describe a task
	 */
	static std::shared_ptr<const task> from_frames(const std::vector<std::string> &frames);
};

/** Shared pointer to an immutable task */
typedef std::shared_ptr<const task> task_ptr;

#endif // TASKBROKER_TASK_H
