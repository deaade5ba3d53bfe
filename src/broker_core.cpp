#include "broker_core.h"
#include "helpers/logger.h"

#include <csignal>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>

broker_connect *broker_core::signalled_broker_ = nullptr;

broker_core::broker_core(std::vector<std::string> args)
	: args_(args), config_filename_("config.yml"), logger_(nullptr), broker_(nullptr)
{
	// parse cmd parameters
	parse_params();
	// load configuration from yaml file
	load_config();
	// initialize logger
	log_init();
	// construct and setup broker connection
	broker_init();
	signals_init();
}

broker_core::~broker_core()
{
	std::signal(SIGINT, SIG_DFL);
	std::signal(SIGTERM, SIG_DFL);
	signalled_broker_ = nullptr;

	if (logger_ != nullptr) {
		logger_->flush();
	}
}

void broker_core::run()
{
	logger_->info("Broker will now start brokering.");
	broker_->start_brokering();
	logger_->info("Broker will now end.");
}

void broker_core::parse_params()
{
	using namespace boost::program_options;

	// Declare the supported options.
	options_description desc("Allowed options for taskbroker");
	desc.add_options()("help,h", "Writes this help message to stderr")(
		"config,c", value<std::string>(), "Set configuration file of this program (default config.yml)");

	variables_map vm;
	try {
		store(command_line_parser(args_).options(desc).run(), vm);
		notify(vm);
	} catch (std::exception &e) {
		force_exit("Error in loading a parameter: " + std::string(e.what()));
	}

	// Evaluate all information from command line
	if (vm.count("help")) {
		std::cerr << desc << std::endl;
		force_exit();
	}

	if (vm.count("config")) {
		config_filename_ = vm["config"].as<std::string>();
	}
}

void broker_core::load_config()
{
	try {
		YAML::Node config_yaml = YAML::LoadFile(config_filename_);
		config_ = std::make_shared<broker_config>(config_yaml);
	} catch (std::exception &e) {
		force_exit("Error loading config file: " + std::string(e.what()));
	}
}

void broker_core::force_exit(const std::string &msg)
{
	// write to log
	if (msg != "") {
		if (logger_ != nullptr) {
			logger_->critical(msg);
			logger_->flush();
		}
		std::cerr << msg << std::endl;
	}

	exit(1);
}

void broker_core::log_init()
{
	auto log_conf = config_->get_log_config();

	// Set up logger
	// Try to create target directory for logs
	auto path = fs::path(log_conf.log_path);
	try {
		if (!fs::is_directory(path)) {
			fs::create_directories(path);
		}
	} catch (fs::filesystem_error &e) {
		force_exit("Logger: " + std::string(e.what()));
	}

	try {
		auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
			(path / (log_conf.log_basename + "." + log_conf.log_suffix)).string(),
			log_conf.log_file_size,
			log_conf.log_files_count);

		// queue size for asynchronous logging, the thread pool is shared by all async loggers
		spdlog::init_thread_pool(8192, 1);
		logger_ = std::make_shared<spdlog::async_logger>(
			"logger", rotating_sink, spdlog::thread_pool(), spdlog::async_overflow_policy::block);
		spdlog::register_logger(logger_);
		spdlog::flush_every(std::chrono::seconds(1));

		logger_->set_level(helpers::get_log_level(log_conf.log_level));

		// Print header to log
		if (helpers::compare_log_levels(spdlog::level::info, logger_->level()) > 0) {
			logger_->critical("--- Started taskbroker ---");
		} else {
			logger_->info("--------------------------");
			logger_->info("    Started taskbroker");
			logger_->info("--------------------------");
		}
	} catch (spdlog::spdlog_ex &e) {
		force_exit("Logger: " + std::string(e.what()));
	}
}

void broker_core::broker_init()
{
	logger_->info("Initializing broker connection...");
	registry_ = std::make_shared<executor_registry>();
	ledger_ = std::make_shared<pending_ledger>(config_->get_ledger_shards());
	context_ = std::make_shared<zmq::context_t>(1);
	broker_ = std::make_shared<broker_connect>(config_, context_, registry_, ledger_, logger_);
	logger_->info("Broker connection initialized.");
}

void broker_core::signals_init()
{
	signalled_broker_ = broker_.get();
	std::signal(SIGINT, broker_core::handle_signal);
	std::signal(SIGTERM, broker_core::handle_signal);
}

void broker_core::handle_signal(int)
{
	if (signalled_broker_ != nullptr) {
		signalled_broker_->terminate();
	}
}
