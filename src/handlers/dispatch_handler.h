#ifndef TASKBROKER_HANDLERS_DISPATCH_HANDLER_H
#define TASKBROKER_HANDLERS_DISPATCH_HANDLER_H

#include <chrono>
#include <list>
#include <memory>
#include <spdlog/logger.h>

#include "../config/broker_config.h"
#include "../executor_registry.h"
#include "../pending_ledger.h"
#include "../reactor/handler_interface.h"
#include "../task.h"

/**
 * Hands admitted tasks over to idle executors.
 * Runs asynchronously, so blocking in executor_registry::acquire never stalls the reactor. A task for which
 * no executor could be acquired waits for the retry interval (measured by the reactor timer) and is tried
 * again, until the attempt limit is reached. Only a fresh task arriving while nothing is deferred may block
 * for the acquire timeout, retries never block, so timer messages do not pile up behind them.
 */
class dispatch_handler : public handler_interface
{
public:
	/**
	 * @param config broker configuration (timeouts and limits)
	 * @param registry executor registry
	 * @param ledger pending tasks, a task that is no longer pending is not dispatched
	 * @param logger an optional logger
	 */
	dispatch_handler(std::shared_ptr<const broker_config> config,
		std::shared_ptr<executor_registry> registry,
		std::shared_ptr<pending_ledger> ledger,
		std::shared_ptr<spdlog::logger> logger = nullptr);

	void on_request(const message_container &message, const response_cb &respond) override;

	/** Number of tasks waiting for their next dispatch attempt */
	std::size_t get_deferred_count() const;

private:
	/** A task waiting for the next attempt */
	struct deferred_task {
		task_ptr work;
		/** Attempts made so far */
		std::size_t attempts;
		/** Time waited since the last attempt */
		std::chrono::milliseconds waited;
	};

	std::shared_ptr<const broker_config> config_;
	std::shared_ptr<executor_registry> registry_;
	std::shared_ptr<pending_ledger> ledger_;
	std::shared_ptr<spdlog::logger> logger_;

	/** Tasks waiting for a retry, oldest first */
	std::list<deferred_task> deferred_;

	/**
	 * Make one dispatch attempt.
	 * @param work the task
	 * @param attempt ordinal number of this attempt (starting at 1)
	 * @param wait how long to wait for an idle executor
	 * @param respond callback for the assignment message
	 */
	void dispatch(task_ptr work, std::size_t attempt, std::chrono::milliseconds wait, const response_cb &respond);

	/** Retry deferred tasks whose interval has elapsed */
	void process_timer(const message_container &message, const response_cb &respond);

	/** Give up a task and tell its producer */
	void fail(task_ptr work, const std::string &reason, const response_cb &respond);
};

#endif // TASKBROKER_HANDLERS_DISPATCH_HANDLER_H
