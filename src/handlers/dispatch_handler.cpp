#include "dispatch_handler.h"
#include "../broker_connect.h"
#include "../helpers/logger.h"
#include "../protocol/wire_codec.h"

dispatch_handler::dispatch_handler(std::shared_ptr<const broker_config> config,
	std::shared_ptr<executor_registry> registry,
	std::shared_ptr<pending_ledger> ledger,
	std::shared_ptr<spdlog::logger> logger)
	: config_(config), registry_(registry), ledger_(ledger), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

void dispatch_handler::on_request(const message_container &message, const response_cb &respond)
{
	if (message.key == broker_connect::KEY_DISPATCH) {
		task_ptr work;

		try {
			work = task::from_frames(message.data);
		} catch (const std::invalid_argument &e) {
			logger_->error("Malformed dispatch request: {}", e.what());
			return;
		}

		// block for an executor only while nothing else waits, deferred tasks must not be held up
		auto wait = deferred_.empty() ? config_->get_acquire_timeout() : std::chrono::milliseconds(0);
		dispatch(work, 1, wait, respond);
	}

	if (message.key == reactor::KEY_TIMER) {
		process_timer(message, respond);
	}
}

void dispatch_handler::dispatch(
	task_ptr work, std::size_t attempt, std::chrono::milliseconds wait, const response_cb &respond)
{
	// the producer went away (or the task was resolved) in the meantime
	if (!ledger_->is_owned_by(work->id, work->origin)) {
		logger_->debug(" - task '{}' is no longer pending, not dispatching it", work->id);
		return;
	}

	std::string assignment;
	try {
		assignment = wire_codec::encode(wire_codec::TAG_ASSIGN_TASK, {work->id, work->payload});
	} catch (const protocol_error &e) {
		fail(work, e.what(), respond);
		return;
	}

	while (true) {
		auto exec = registry_->acquire(wait);

		if (exec == nullptr) {
			break;
		}

		if (!registry_->assign(exec, work)) {
			// evicted between acquire and assign, try the next one
			logger_->debug(" - executor {} vanished before task '{}' was assigned", exec->get_description(), work->id);
			continue;
		}

		respond(exec->connection.line_message(assignment));
		logger_->debug(" - task '{}' assigned to executor {}", work->id, exec->get_description());
		return;
	}

	std::size_t max_attempts = config_->get_max_dispatch_attempts();

	if (max_attempts != 0 && attempt >= max_attempts) {
		fail(work, "no executor available after " + std::to_string(attempt) + " attempts", respond);
		return;
	}

	logger_->debug(" - no idle executor for task '{}' (attempt {}), deferring", work->id, attempt);
	deferred_.push_back(deferred_task{work, attempt, std::chrono::milliseconds(0)});
}

void dispatch_handler::process_timer(const message_container &message, const response_cb &respond)
{
	if (deferred_.empty() || message.data.empty()) {
		return;
	}

	std::chrono::milliseconds elapsed(std::stoll(message.data.front()));
	std::list<deferred_task> due;

	for (auto it = deferred_.begin(); it != deferred_.end();) {
		it->waited += elapsed;

		if (it->waited >= config_->get_retry_interval()) {
			due.push_back(*it);
			it = deferred_.erase(it);
		} else {
			++it;
		}
	}

	for (auto &item : due) {
		dispatch(item.work, item.attempts + 1, std::chrono::milliseconds(0), respond);
	}
}

void dispatch_handler::fail(task_ptr work, const std::string &reason, const response_cb &respond)
{
	if (ledger_->take_if_owned(work->id, work->origin)) {
		logger_->error("Task '{}' failed: {}", work->id, reason);
		respond(work->origin.line_message(wire_codec::encode(wire_codec::TAG_TASK_FAILED, {work->id, reason})));
	}
}

std::size_t dispatch_handler::get_deferred_count() const
{
	return deferred_.size();
}
