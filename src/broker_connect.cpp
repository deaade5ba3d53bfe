#include "broker_connect.h"
#include "handlers/broker_handler.h"
#include "handlers/dispatch_handler.h"
#include "helpers/logger.h"
#include "reactor/stream_socket_wrapper.h"

const std::string broker_connect::KEY_PRODUCERS = "producers";
const std::string broker_connect::KEY_EXECUTORS = "executors";
const std::string broker_connect::KEY_DISPATCH = "dispatch";

broker_connect::broker_connect(std::shared_ptr<const broker_config> config,
	std::shared_ptr<zmq::context_t> context,
	std::shared_ptr<executor_registry> registry,
	std::shared_ptr<pending_ledger> ledger,
	std::shared_ptr<spdlog::logger> logger)
	: config_(config), logger_(logger), registry_(registry), ledger_(ledger), reactor_(context, logger)
{
	if (logger_ == nullptr) {
		logger_ = helpers::create_null_logger();
	}

	auto producers_endpoint =
		"tcp://" + config_->get_producer_address() + ":" + std::to_string(config_->get_producer_port());
	logger_->debug("Binding producers to {}", producers_endpoint);

	auto executors_endpoint =
		"tcp://" + config_->get_executor_address() + ":" + std::to_string(config_->get_executor_port());
	logger_->debug("Binding executors to {}", executors_endpoint);

	reactor_.add_socket(KEY_PRODUCERS,
		std::make_shared<stream_socket_wrapper>(context, producers_endpoint, true, config_->get_max_line_length()));
	reactor_.add_socket(KEY_EXECUTORS,
		std::make_shared<stream_socket_wrapper>(context, executors_endpoint, true, config_->get_max_line_length()));

	reactor_.add_handler({KEY_PRODUCERS, KEY_EXECUTORS, reactor::KEY_UNDELIVERED},
		std::make_shared<broker_handler>(config_, registry_, ledger_, logger_));
	reactor_.add_async_handler(
		{KEY_DISPATCH, reactor::KEY_TIMER}, std::make_shared<dispatch_handler>(config_, registry_, ledger_, logger_));

	// the dispatch thread may wait in acquire, it has to give up before it is joined
	reactor_.add_shutdown_hook([this]() { registry_->close(); });
}

void broker_connect::start_brokering()
{
	reactor_.start_loop();
	logger_->info("The main loop terminated");
}

void broker_connect::terminate()
{
	reactor_.terminate();
}
