#ifndef TASKBROKER_BROKER_CONNECT_H
#define TASKBROKER_BROKER_CONNECT_H

#include <memory>
#include <spdlog/logger.h>
#include <zmq.hpp>

#include "config/broker_config.h"
#include "executor_registry.h"
#include "pending_ledger.h"
#include "reactor/reactor.h"

/**
 * Accepts producer and executor connections and wires them to the handlers that route tasks between them.
 */
class broker_connect
{
private:
	/** Loaded broker configuration. */
	std::shared_ptr<const broker_config> config_;
	/** System logger. */
	std::shared_ptr<spdlog::logger> logger_;
	/** Registry of connected executors. */
	std::shared_ptr<executor_registry> registry_;
	/** Tasks waiting for their results. */
	std::shared_ptr<pending_ledger> ledger_;
	/** A reactor that provides us with an event-based API to communicate with the producers and executors */
	reactor reactor_;

public:
	/** A string key for the socket accepting producers */
	const static std::string KEY_PRODUCERS;

	/** A string key for the socket accepting executors */
	const static std::string KEY_EXECUTORS;

	/** A string key for tasks handed over to the dispatch handler */
	const static std::string KEY_DISPATCH;

	/**
	 * @param config a configuration object used to set up the connections
	 * @param context ZeroMQ context
	 * @param registry a registry used to track executors
	 * @param ledger tasks waiting for results
	 * @param logger
	 */
	broker_connect(std::shared_ptr<const broker_config> config,
		std::shared_ptr<zmq::context_t> context,
		std::shared_ptr<executor_registry> registry,
		std::shared_ptr<pending_ledger> ledger,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Bind to sockets and start receiving and routing tasks.
	 * Blocks execution until @ref terminate is called.
	 */
	void start_brokering();

	/**
	 * Ask the main loop to end. Async-signal-safe. The registry is closed when the loop ends,
	 * so a dispatcher waiting for an executor gives up right away.
	 */
	void terminate();
};


#endif // TASKBROKER_BROKER_CONNECT_H
