#ifndef TASKBROKER_HANDLERS_BROKER_HANDLER_H
#define TASKBROKER_HANDLERS_BROKER_HANDLER_H

#include <map>
#include <memory>
#include <spdlog/logger.h>

#include "../config/broker_config.h"
#include "../executor_registry.h"
#include "../pending_ledger.h"
#include "../reactor/handler_interface.h"
#include "../sessions/executor_session.h"
#include "../sessions/producer_session.h"

/**
 * Processes traffic of the producer and executor sockets. Owns one session per connection and feeds it
 * connection events and received lines. Runs on the reactor thread.
 */
class broker_handler : public handler_interface
{
public:
	/**
	 * @param config broker configuration
	 * @param registry executor registry shared with the dispatch handler
	 * @param ledger pending tasks shared with the dispatch handler
	 * @param logger an optional logger
	 */
	broker_handler(std::shared_ptr<const broker_config> config,
		std::shared_ptr<executor_registry> registry,
		std::shared_ptr<pending_ledger> ledger,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	void on_request(const message_container &message, const response_cb &respond) override;

	/** Number of open producer connections */
	std::size_t get_producer_count() const;

	/** Number of open executor connections (registered or not) */
	std::size_t get_executor_session_count() const;

	/**
	 * Find the session of an executor connection.
	 * @param peer routing id of the connection
	 * @return the session or nullptr
	 */
	std::shared_ptr<const executor_session> find_executor_session(const std::string &peer) const;

	/**
	 * Find the session of a producer connection.
	 * @param peer routing id of the connection
	 * @return the session or nullptr
	 */
	std::shared_ptr<const producer_session> find_producer_session(const std::string &peer) const;

private:
	/** Broker configuration */
	std::shared_ptr<const broker_config> config_;

	std::shared_ptr<executor_registry> registry_;

	std::shared_ptr<pending_ledger> ledger_;

	/** A system logger */
	std::shared_ptr<spdlog::logger> logger_;

	/** Sessions of producer connections by routing id */
	std::map<std::string, std::shared_ptr<producer_session>> producers_;

	/** Sessions of executor connections by routing id */
	std::map<std::string, std::shared_ptr<executor_session>> executors_;

	/** Handle an event of the producer socket */
	void process_producer_event(const message_container &message, const response_cb &respond);

	/** Handle an event of the executor socket */
	void process_executor_event(const message_container &message, const response_cb &respond);

	/**
	 * Handle a message the reactor could not write. The connection is considered broken.
	 */
	void process_undelivered(const message_container &message, const response_cb &respond);

	/** Get the session of a producer connection, create it if this is the first we hear of it */
	std::shared_ptr<producer_session> get_producer(const std::string &peer);

	/** Get the session of an executor connection, create it if this is the first we hear of it */
	std::shared_ptr<executor_session> get_executor(const std::string &peer);

	/** Close the session of an executor connection and forget it */
	void close_executor(const std::string &peer, const response_cb &respond);

	/** Close the session of a producer connection and forget it */
	void close_producer(const std::string &peer);
};

#endif // TASKBROKER_HANDLERS_BROKER_HANDLER_H
