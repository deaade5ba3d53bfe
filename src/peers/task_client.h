#ifndef TASKBROKER_PEERS_TASK_CLIENT_H
#define TASKBROKER_PEERS_TASK_CLIENT_H

#include <chrono>
#include <memory>
#include <spdlog/logger.h>
#include <string>

#include "line_client.h"

/**
 * Outcome of one submitted task.
 */
struct task_outcome {
	/** Whether a RESULT arrived */
	bool succeeded = false;
	/** The result, or the reason of the failure */
	std::string text;
};

/**
 * The producer side of the protocol: submits one task at a time and waits for its result.
 */
class task_client
{
public:
	/**
	 * @param connection connection to the producer endpoint of the broker (not connected yet)
	 * @param logger an optional logger
	 */
	task_client(std::shared_ptr<line_client> connection, std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Connect to the broker.
	 * @return false if the connection could not be established in time
	 */
	bool connect(std::chrono::milliseconds timeout);

	/**
	 * Submit a task and block until its outcome arrives.
	 * Lines for other task ids are logged and skipped.
	 * @param task_id identifier of the task
	 * @param payload data for the executor
	 * @param timeout how long to wait for the outcome
	 * @return the outcome, a timeout or lost connection is a failure
	 */
	task_outcome submit(const std::string &task_id, const std::string &payload, std::chrono::milliseconds timeout);

	/**
	 * Generate a fresh task identifier of the form task_xxxxxxxx.
	 */
	static std::string generate_task_id();

	/** Close the connection */
	void disconnect();

private:
	std::shared_ptr<line_client> connection_;
	std::shared_ptr<spdlog::logger> logger_;
};

#endif // TASKBROKER_PEERS_TASK_CLIENT_H
