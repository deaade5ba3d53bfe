#ifndef TASKBROKER_SESSIONS_EXECUTOR_SESSION_H
#define TASKBROKER_SESSIONS_EXECUTOR_SESSION_H

#include <memory>
#include <spdlog/logger.h>
#include <string>

#include "../connection_handle.h"
#include "../executor_registry.h"
#include "../pending_ledger.h"
#include "../reactor/command_holder.h"
#include "../reactor/handler_interface.h"

/**
 * Lifecycle of an executor connection.
 */
enum class executor_session_state {
	/** Waiting for the REGISTER message */
	REGISTERING,
	/** Registered and waiting in the idle pool */
	IDLE,
	/** Registered and selected for a task */
	BUSY,
	/** Connection is gone or the session was aborted */
	CLOSED
};

/**
 * Protocol logic of one executor connection.
 * The first line must register the executor, after that only task results are accepted. Results are routed
 * to the producers through the pending ledger.
 */
class executor_session
{
public:
	/**
	 * @param connection the executor connection
	 * @param registry registry the executor joins after registration
	 * @param ledger pending tasks shared with the producer sessions
	 * @param max_task_failures how many lost executors a task survives before it is failed
	 * @param logger an optional logger
	 */
	executor_session(const connection_handle &connection,
		std::shared_ptr<executor_registry> registry,
		std::shared_ptr<pending_ledger> ledger,
		std::size_t max_task_failures,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Process one line received from the executor.
	 * A failed registration aborts the session and closes the connection.
	 * @param line the line without terminator
	 * @param respond callback for outgoing messages
	 */
	void on_line(const std::string &line, const handler_interface::response_cb &respond);

	/**
	 * The connection went away or cannot be written to. The executor is evicted, a task it was holding
	 * is dispatched again or failed.
	 * @param respond callback for outgoing messages
	 */
	void on_closed(const handler_interface::response_cb &respond);

	/** Current state of the session, IDLE and BUSY are taken from the registry */
	executor_session_state get_state() const;

	/** Identifier the executor registered with, empty before registration */
	const std::string &get_executor_id() const;

	/** The executor connection */
	const connection_handle &get_connection() const;

private:
	connection_handle connection_;
	std::shared_ptr<executor_registry> registry_;
	std::shared_ptr<pending_ledger> ledger_;
	std::size_t max_task_failures_;
	std::shared_ptr<spdlog::logger> logger_;

	/** Messages accepted before registration */
	command_holder registering_commands_;

	/** Messages accepted from a registered executor */
	command_holder commands_;

	/** The registered executor, nullptr before registration */
	executor_registry::executor_ptr executor_;

	bool closed_ = false;

	/** Add the executor to the registry and acknowledge it */
	void process_register(const wire_message &message, const handler_interface::response_cb &respond);

	/** Route a result to its producer and return the executor to the idle pool */
	void process_task_result(const wire_message &message, const handler_interface::response_cb &respond);

	/** Close the connection without ever entering the pool */
	void abort(const handler_interface::response_cb &respond);

	/** Decide the fate of a task whose executor was lost */
	void resolve_stranded(task_ptr stranded, const handler_interface::response_cb &respond);
};

#endif // TASKBROKER_SESSIONS_EXECUTOR_SESSION_H
