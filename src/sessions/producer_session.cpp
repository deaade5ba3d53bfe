#include "producer_session.h"
#include "../broker_connect.h"
#include "../helpers/logger.h"
#include "../task.h"

producer_session::producer_session(
	const connection_handle &connection, std::shared_ptr<pending_ledger> ledger, std::shared_ptr<spdlog::logger> logger)
	: connection_(connection), ledger_(ledger), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	commands_.register_command(wire_codec::TAG_TASK,
		[this](const wire_message &message, const handler_interface::response_cb &respond) {
			process_task(message, respond);
		});
}

void producer_session::on_line(const std::string &line, const handler_interface::response_cb &respond)
{
	if (state_ == producer_state::CLOSED || line.empty()) {
		return;
	}

	state_ = producer_state::RECEIVING;

	wire_message message;
	try {
		message = wire_codec::decode(line);
	} catch (const protocol_error &e) {
		logger_->warn("Malformed line from producer {}: {}", connection_.get_description(), e.what());
		state_ = producer_state::IDLE;
		return;
	}

	if (!commands_.call_function(message, respond)) {
		logger_->warn("Unexpected message '{}' from producer {}. Skipped.", message.tag, connection_.get_description());
	}

	state_ = producer_state::IDLE;
}

void producer_session::process_task(const wire_message &message, const handler_interface::response_cb &respond)
{
	state_ = producer_state::ADMITTING;

	const std::string &task_id = message.fields.at(0);
	const std::string &payload = message.fields.at(1);

	if (task_id.empty()) {
		logger_->warn("Task without an id from producer {}. Skipped.", connection_.get_description());
		return;
	}

	if (!ledger_->put(task_id, connection_)) {
		logger_->error("Task '{}' from producer {} rejected, the id is already pending",
			task_id,
			connection_.get_description());
		respond(connection_.line_message(wire_codec::encode(wire_codec::TAG_TASK_FAILED, {task_id, "duplicate task id"})));
		return;
	}

	++admitted_;
	logger_->debug(" - admitted task '{}' from producer {}", task_id, connection_.get_description());

	task work(task_id, payload, connection_);
	respond(message_container(broker_connect::KEY_DISPATCH, "", work.to_frames()));
}

void producer_session::on_closed()
{
	if (state_ == producer_state::CLOSED) {
		return;
	}

	state_ = producer_state::CLOSED;

	auto dropped = ledger_->drop_all(connection_);
	for (auto &task_id : dropped) {
		logger_->warn("Producer {} left before task '{}' was resolved", connection_.get_description(), task_id);
	}

	logger_->info("Producer {} disconnected", connection_.get_description());
}

producer_state producer_session::get_state() const
{
	return state_;
}

const connection_handle &producer_session::get_connection() const
{
	return connection_;
}

std::size_t producer_session::get_admitted_count() const
{
	return admitted_;
}
