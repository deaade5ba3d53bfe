#include "task_client.h"
#include "../helpers/logger.h"
#include "../protocol/wire_codec.h"

#include <cstdint>
#include <random>
#include <spdlog/fmt/fmt.h>

task_client::task_client(std::shared_ptr<line_client> connection, std::shared_ptr<spdlog::logger> logger)
	: connection_(connection), logger_(logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}
}

bool task_client::connect(std::chrono::milliseconds timeout)
{
	return connection_->connect(timeout);
}

task_outcome task_client::submit(const std::string &task_id, const std::string &payload, std::chrono::milliseconds timeout)
{
	task_outcome outcome;

	std::string request;
	try {
		request = wire_codec::encode(wire_codec::TAG_TASK, {task_id, payload});
	} catch (const protocol_error &e) {
		outcome.text = e.what();
		return outcome;
	}

	if (!connection_->send_line(request)) {
		outcome.text = "connection lost";
		return outcome;
	}

	logger_->info("Sent task '{}': {}", task_id, payload);

	auto deadline = std::chrono::steady_clock::now() + timeout;
	std::string line;

	while (true) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			outcome.text = "timed out";
			return outcome;
		}

		if (!connection_->receive_line(line, std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now))) {
			outcome.text = connection_->is_connected() ? "timed out" : "connection lost";
			return outcome;
		}

		wire_message reply;
		try {
			reply = wire_codec::decode(line);
		} catch (const protocol_error &e) {
			logger_->warn("Malformed reply from the broker: {}", e.what());
			continue;
		}

		bool is_result = reply.tag == wire_codec::TAG_RESULT;
		if ((!is_result && reply.tag != wire_codec::TAG_TASK_FAILED) || reply.fields.at(0) != task_id) {
			logger_->warn("Unexpected reply '{}' while waiting for task '{}'", line, task_id);
			continue;
		}

		outcome.succeeded = is_result;
		outcome.text = reply.fields.at(1);
		return outcome;
	}
}

std::string task_client::generate_task_id()
{
	static std::random_device device;
	std::mt19937 generator(device());
	std::uniform_int_distribution<std::uint32_t> distribution;

	return fmt::format("task_{:08x}", distribution(generator));
}

void task_client::disconnect()
{
	connection_->close();
}
