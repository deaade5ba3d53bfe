#ifndef TASKBROKER_PEERS_EXECUTOR_AGENT_H
#define TASKBROKER_PEERS_EXECUTOR_AGENT_H

#include <atomic>
#include <chrono>
#include <memory>
#include <spdlog/logger.h>
#include <string>

#include "line_client.h"
#include "task_processor.h"

/**
 * The executor side of the protocol: registers with the broker and answers every assignment with the result
 * computed by a @ref task_processor.
 */
class executor_agent
{
public:
	/**
	 * @param connection connection to the executor endpoint of the broker (not connected yet)
	 * @param id identifier to register with
	 * @param processor computes the results
	 * @param logger an optional logger
	 */
	executor_agent(std::shared_ptr<line_client> connection,
		const std::string &id,
		std::shared_ptr<task_processor> processor,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Connect and send the registration, wait for its acknowledgement.
	 * @param timeout how long to wait for the connection and for the ACK each
	 * @return true if the broker acknowledged the registration
	 */
	bool register_executor(std::chrono::milliseconds timeout);

	/**
	 * Process assignments until the connection closes or @ref stop is called.
	 * @return number of processed tasks
	 */
	std::size_t run();

	/** Make @ref run return soon. Thread-safe. */
	void stop();

	/** The identifier the agent registers with */
	const std::string &get_id() const;

private:
	std::shared_ptr<line_client> connection_;
	std::string id_;
	std::shared_ptr<task_processor> processor_;
	std::shared_ptr<spdlog::logger> logger_;
	std::atomic<bool> stopped_;
};

#endif // TASKBROKER_PEERS_EXECUTOR_AGENT_H
