#include "executor_agent.h"
#include "../helpers/logger.h"
#include "../protocol/wire_codec.h"

executor_agent::executor_agent(std::shared_ptr<line_client> connection,
	const std::string &id,
	std::shared_ptr<task_processor> processor,
	std::shared_ptr<spdlog::logger> logger)
	: connection_(connection), id_(id), processor_(processor), logger_(logger), stopped_(false)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

bool executor_agent::register_executor(std::chrono::milliseconds timeout)
{
	if (!connection_->connect(timeout)) {
		logger_->error("Could not connect to the broker");
		return false;
	}

	if (!connection_->send_line(wire_codec::encode(wire_codec::TAG_REGISTER, {id_}))) {
		logger_->error("Could not send the registration");
		return false;
	}

	std::string line;
	if (!connection_->receive_line(line, timeout)) {
		logger_->error("The broker did not acknowledge executor '{}'", id_);
		return false;
	}

	try {
		wire_message reply = wire_codec::decode(line);
		if (reply.tag == wire_codec::TAG_ACK && reply.fields.at(0) == id_) {
			logger_->info("Registered as executor '{}'", id_);
			return true;
		}
	} catch (const protocol_error &e) {
		logger_->error("Malformed registration reply: {}", e.what());
		return false;
	}

	logger_->error("Unexpected registration reply '{}'", line);
	return false;
}

std::size_t executor_agent::run()
{
	std::size_t processed = 0;
	std::string line;

	while (!stopped_.load() && connection_->is_connected()) {
		if (!connection_->receive_line(line, std::chrono::milliseconds(500))) {
			continue;
		}

		wire_message message;
		try {
			message = wire_codec::decode(line);
		} catch (const protocol_error &e) {
			logger_->warn("Malformed line from the broker: {}", e.what());
			continue;
		}

		if (message.tag != wire_codec::TAG_ASSIGN_TASK) {
			logger_->warn("Unexpected message '{}' from the broker", message.tag);
			continue;
		}

		const std::string &task_id = message.fields.at(0);
		logger_->info("Received task '{}': {}", task_id, message.fields.at(1));

		std::string result = processor_->process(message.fields.at(1));

		std::string reply;
		try {
			reply = wire_codec::encode(wire_codec::TAG_TASK_RESULT, {task_id, result});
		} catch (const protocol_error &e) {
			reply = wire_codec::encode(wire_codec::TAG_TASK_RESULT, {task_id, "ERROR: " + std::string(e.what())});
		}

		if (!connection_->send_line(reply)) {
			logger_->error("Could not send the result of task '{}'", task_id);
			break;
		}

		logger_->info("Result of task '{}' sent: {}", task_id, result);
		++processed;
	}

	connection_->close();
	return processed;
}

void executor_agent::stop()
{
	stopped_.store(true);
}

const std::string &executor_agent::get_id() const
{
	return id_;
}
