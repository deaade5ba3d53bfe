#include <csignal>
#include <iostream>
#include <memory>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <zmq.hpp>

#include <boost/program_options.hpp>

#include "executor_agent.h"
#include "task_client.h"

namespace
{
	executor_agent *running_agent = nullptr;

	void handle_signal(int)
	{
		if (running_agent != nullptr) {
			running_agent->stop();
		}
	}
} // namespace


int main(int argc, char **argv)
{
	using namespace boost::program_options;

	options_description desc("Allowed options for taskbroker-executor");
	desc.add_options()("help,h", "Writes this help message to stderr")(
		"broker,b", value<std::string>()->default_value("tcp://127.0.0.1:8889"), "Executor endpoint of the broker")(
		"id,i", value<std::string>(), "Identifier to register with (generated when omitted)");

	variables_map vm;
	try {
		store(parse_command_line(argc, argv, desc), vm);
		notify(vm);
	} catch (std::exception &e) {
		std::cerr << "Error in loading a parameter: " << e.what() << std::endl;
		return 1;
	}

	if (vm.count("help")) {
		std::cerr << desc << std::endl;
		return 1;
	}

	std::string id;
	if (vm.count("id")) {
		id = vm["id"].as<std::string>();
	} else {
		// same random suffix the client uses for task ids
		id = "worker_" + task_client::generate_task_id().substr(5);
	}

	try {
		auto logger = spdlog::stdout_logger_mt("executor");
		auto context = std::make_shared<zmq::context_t>(1);
		auto connection = std::make_shared<line_client>(context, vm["broker"].as<std::string>());

		executor_agent agent(connection, id, std::make_shared<sum_processor>(), logger);

		if (!agent.register_executor(std::chrono::milliseconds(5000))) {
			return 1;
		}

		running_agent = &agent;
		std::signal(SIGINT, handle_signal);
		std::signal(SIGTERM, handle_signal);

		std::size_t processed = agent.run();
		running_agent = nullptr;

		logger->info("Executor '{}' processed {} task(s)", id, processed);
	} catch (std::exception &e) {
		std::cerr << "The executor failed: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
