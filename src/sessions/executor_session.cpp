#include "executor_session.h"
#include "../broker_connect.h"
#include "../helpers/logger.h"

executor_session::executor_session(const connection_handle &connection,
	std::shared_ptr<executor_registry> registry,
	std::shared_ptr<pending_ledger> ledger,
	std::size_t max_task_failures,
	std::shared_ptr<spdlog::logger> logger)
	: connection_(connection), registry_(registry), ledger_(ledger), max_task_failures_(max_task_failures),
	  logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	registering_commands_.register_command(wire_codec::TAG_REGISTER,
		[this](const wire_message &message, const handler_interface::response_cb &respond) {
			process_register(message, respond);
		});

	commands_.register_command(wire_codec::TAG_TASK_RESULT,
		[this](const wire_message &message, const handler_interface::response_cb &respond) {
			process_task_result(message, respond);
		});
}

void executor_session::on_line(const std::string &line, const handler_interface::response_cb &respond)
{
	if (closed_ || line.empty()) {
		return;
	}

	wire_message message;
	try {
		message = wire_codec::decode(line);
	} catch (const protocol_error &e) {
		logger_->warn("Malformed line from executor {}: {}", connection_.get_description(), e.what());

		if (executor_ == nullptr) {
			abort(respond);
		}
		return;
	}

	if (executor_ == nullptr) {
		if (!registering_commands_.call_function(message, respond)) {
			logger_->warn("Executor {} sent '{}' before registering", connection_.get_description(), message.tag);
			abort(respond);
		}
		return;
	}

	if (!commands_.call_function(message, respond)) {
		logger_->warn("Unexpected message '{}' from executor {}. Skipped.", message.tag, executor_->get_description());
	}
}

void executor_session::process_register(const wire_message &message, const handler_interface::response_cb &respond)
{
	const std::string &executor_id = message.fields.at(0);

	if (executor_id.empty()) {
		logger_->warn("Executor {} registered without an id", connection_.get_description());
		abort(respond);
		return;
	}

	auto candidate = std::make_shared<const executor>(executor_id, connection_);

	if (!registry_->add_executor(candidate)) {
		logger_->error("Registration of executor {} rejected, the id is already taken", candidate->get_description());
		abort(respond);
		return;
	}

	// written right away on the reactor thread, assignments from the dispatch handler can only follow
	respond(connection_.line_message(wire_codec::encode(wire_codec::TAG_ACK, {executor_id})));

	executor_ = candidate;
	logger_->info("Executor {} registered", executor_->get_description());
}

void executor_session::process_task_result(
	const wire_message &message, const handler_interface::response_cb &respond)
{
	const std::string &task_id = message.fields.at(0);
	const std::string &result = message.fields.at(1);

	task_ptr current = registry_->get_current_task(executor_->id);

	if (current == nullptr || current->id != task_id) {
		logger_->warn("Discarding result of task '{}' from executor {}, it was not assigned to it",
			task_id,
			executor_->get_description());
		return;
	}

	// the original producer may be gone and the id reused by somebody else
	if (ledger_->take_if_owned(task_id, current->origin)) {
		respond(current->origin.line_message(wire_codec::encode(wire_codec::TAG_RESULT, {task_id, result})));
		logger_->debug(" - result of task '{}' from executor {} sent to producer {}",
			task_id,
			executor_->get_description(),
			current->origin.get_description());
	} else {
		logger_->warn(
			"Discarding result of task '{}' from executor {}, nobody waits for it", task_id, executor_->get_description());
	}

	registry_->release(executor_->id);
	logger_->debug(" - executor {} is now idle", executor_->get_description());
}

void executor_session::abort(const handler_interface::response_cb &respond)
{
	closed_ = true;
	respond(connection_.close_message());
}

void executor_session::on_closed(const handler_interface::response_cb &respond)
{
	if (closed_) {
		return;
	}

	closed_ = true;

	if (executor_ == nullptr) {
		logger_->info("Unregistered executor connection {} closed", connection_.get_description());
		return;
	}

	logger_->info("Executor {} disconnected", executor_->get_description());

	task_ptr stranded = registry_->evict(executor_->id);
	if (stranded != nullptr) {
		resolve_stranded(stranded, respond);
	}
}

void executor_session::resolve_stranded(task_ptr stranded, const handler_interface::response_cb &respond)
{
	// the producer might be gone, or the result might have arrived already
	if (!ledger_->is_owned_by(stranded->id, stranded->origin)) {
		return;
	}

	std::size_t failures = stranded->failure_count + 1;

	if (failures < max_task_failures_) {
		logger_->warn("Task '{}' lost with executor {}, dispatching it again", stranded->id, executor_->get_description());

		task retry(stranded->id, stranded->payload, stranded->origin, failures);
		respond(message_container(broker_connect::KEY_DISPATCH, "", retry.to_frames()));
		return;
	}

	if (ledger_->take_if_owned(stranded->id, stranded->origin)) {
		logger_->error("Task '{}' failed, {} executors were lost while holding it", stranded->id, failures);

		std::string reason = "executor lost " + std::to_string(failures) + " times";
		respond(stranded->origin.line_message(wire_codec::encode(wire_codec::TAG_TASK_FAILED, {stranded->id, reason})));
	}
}

executor_session_state executor_session::get_state() const
{
	if (closed_) {
		return executor_session_state::CLOSED;
	}

	if (executor_ == nullptr) {
		return executor_session_state::REGISTERING;
	}

	executor_state state;
	if (!registry_->get_state(executor_->id, state)) {
		return executor_session_state::CLOSED;
	}

	return state == executor_state::IDLE ? executor_session_state::IDLE : executor_session_state::BUSY;
}

const std::string &executor_session::get_executor_id() const
{
	static const std::string none;
	return executor_ != nullptr ? executor_->id : none;
}

const connection_handle &executor_session::get_connection() const
{
	return connection_;
}
