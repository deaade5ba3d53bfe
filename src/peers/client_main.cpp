#include <iostream>
#include <memory>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <zmq.hpp>

#include <boost/program_options.hpp>

#include "task_client.h"


int main(int argc, char **argv)
{
	using namespace boost::program_options;

	options_description desc("Allowed options for taskbroker-client");
	desc.add_options()("help,h", "Writes this help message to stderr")(
		"broker,b", value<std::string>()->default_value("tcp://127.0.0.1:8888"), "Producer endpoint of the broker")(
		"timeout,t", value<std::size_t>()->default_value(30000), "Milliseconds to wait for each result")(
		"payload", value<std::vector<std::string>>(), "Payloads of the tasks to submit");

	positional_options_description positional;
	positional.add("payload", -1);

	variables_map vm;
	try {
		store(command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
		notify(vm);
	} catch (std::exception &e) {
		std::cerr << "Error in loading a parameter: " << e.what() << std::endl;
		return 1;
	}

	if (vm.count("help")) {
		std::cerr << desc << std::endl;
		return 1;
	}

	std::vector<std::string> payloads = {"1,2,3,4,5", "10,20,30", "100,200,300,400"};
	if (vm.count("payload")) {
		payloads = vm["payload"].as<std::vector<std::string>>();
	}

	std::chrono::milliseconds timeout(vm["timeout"].as<std::size_t>());
	std::size_t failed = 0;

	try {
		auto logger = spdlog::stdout_logger_mt("client");
		auto context = std::make_shared<zmq::context_t>(1);
		task_client client(std::make_shared<line_client>(context, vm["broker"].as<std::string>()), logger);

		if (!client.connect(std::chrono::milliseconds(5000))) {
			std::cerr << "Could not connect to the broker" << std::endl;
			return 1;
		}

		for (auto &payload : payloads) {
			std::string task_id = task_client::generate_task_id();
			task_outcome outcome = client.submit(task_id, payload, timeout);

			if (outcome.succeeded) {
				std::cout << task_id << ": " << outcome.text << std::endl;
			} else {
				std::cout << task_id << " failed: " << outcome.text << std::endl;
				++failed;
			}
		}

		client.disconnect();
	} catch (std::exception &e) {
		std::cerr << "The client failed: " << e.what() << std::endl;
		return 1;
	}

	return failed == 0 ? 0 : 2;
}
