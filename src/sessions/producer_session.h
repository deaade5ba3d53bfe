#ifndef TASKBROKER_SESSIONS_PRODUCER_SESSION_H
#define TASKBROKER_SESSIONS_PRODUCER_SESSION_H

#include <memory>
#include <spdlog/logger.h>
#include <string>

#include "../connection_handle.h"
#include "../pending_ledger.h"
#include "../reactor/command_holder.h"
#include "../reactor/handler_interface.h"

/**
 * Lifecycle of a producer connection.
 */
enum class producer_state {
	/** Accepted, nothing received yet */
	CONNECTED,
	/** Decoding an incoming line */
	RECEIVING,
	/** Recording a decoded task and handing it over to dispatching */
	ADMITTING,
	/** Waiting for the next line */
	IDLE,
	/** Connection is gone */
	CLOSED
};

/**
 * Protocol logic of one producer connection.
 * Every TASK line is admitted into the pending ledger and forwarded to the dispatch handler,
 * without waiting for an executor. Results are written to the connection by the executor sessions.
 */
class producer_session
{
public:
	/**
	 * @param connection the producer connection
	 * @param ledger pending tasks shared with the executor sessions
	 * @param logger an optional logger
	 */
	producer_session(const connection_handle &connection,
		std::shared_ptr<pending_ledger> ledger,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	/**
	 * Process one line received from the producer. Malformed lines are logged and skipped.
	 * @param line the line without terminator
	 * @param respond callback for outgoing messages (to the producer or to the dispatch handler)
	 */
	void on_line(const std::string &line, const handler_interface::response_cb &respond);

	/**
	 * The connection went away, forget all tasks still waiting for a result.
	 */
	void on_closed();

	/** Current state of the session */
	producer_state get_state() const;

	/** The producer connection */
	const connection_handle &get_connection() const;

	/** Number of tasks admitted so far */
	std::size_t get_admitted_count() const;

private:
	connection_handle connection_;
	std::shared_ptr<pending_ledger> ledger_;
	std::shared_ptr<spdlog::logger> logger_;

	/** Handlers of the messages a producer may send */
	command_holder commands_;

	producer_state state_ = producer_state::CONNECTED;

	std::size_t admitted_ = 0;

	/**
	 * Record a new task and hand it over to the dispatch handler.
	 * A task id that is already pending is refused with a TASK_FAILED message.
	 */
	void process_task(const wire_message &message, const handler_interface::response_cb &respond);
};

#endif // TASKBROKER_SESSIONS_PRODUCER_SESSION_H
