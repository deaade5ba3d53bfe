#ifndef TASKBROKER_EXECUTOR_H
#define TASKBROKER_EXECUTOR_H

#include <string>

#include "connection_handle.h"

/**
 * Availability of an executor.
 */
enum class executor_state {
	/** Waiting in the idle pool */
	IDLE,
	/** Selected for a task, not in the idle pool */
	BUSY
};

/**
 * Contains information about a connected executor.
 * The object itself never changes, its state is kept by the @ref executor_registry.
 */
class executor
{
public:
	/** Identifier announced by the executor in its registration */
	const std::string id;

	/** The connection the executor registered on */
	const connection_handle connection;

	/**
	 * @param id executor identifier
	 * @param connection connection of the executor session
	 */
	executor(const std::string &id, const connection_handle &connection);

	/**
	 * Get a textual description of the executor
	 * @return textual description of the executor
	 */
	std::string get_description() const;
};

#endif // TASKBROKER_EXECUTOR_H
