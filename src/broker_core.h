#ifndef TASKBROKER_BROKER_CORE_H
#define TASKBROKER_BROKER_CORE_H

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include <zmq.hpp>

#define BOOST_FILESYSTEM_NO_DEPRECATED
#define BOOST_NO_CXX11_SCOPED_ENUMS
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
namespace fs = boost::filesystem;


// Our very own code includes
#include "broker_connect.h"
#include "config/broker_config.h"
#include "config/log_config.h"
#include "executor_registry.h"
#include "pending_ledger.h"


/**
 * Main class of whole program.
 * It handles creation and destruction of all used parts. And of course running them.
 */
class broker_core
{
public:
	/** Disabled default constructor. */
	broker_core() = delete;

	/** Disabled copy constructor. */
	broker_core(const broker_core &source) = delete;

	/** Disabled copy assignment operator. */
	broker_core &operator=(const broker_core &source) = delete;

	/**
	 * There is only one constructor, which should get cmd parameters from command line.
	 * Constructor initializes all variables and structures, parses cmd parameters and loads configuration.
	 * @param args Command line parameters.
	 */
	explicit broker_core(std::vector<std::string> args);

	/**
	 * Destructor. Unregisters the signal handlers.
	 */
	~broker_core();

	/**
	 * Run the broker until SIGINT or SIGTERM arrives.
	 */
	void run();

private:
	/**
	 * Setup all things around spdlog logger, creates log path/file if not existing.
	 */
	void log_init();

	/**
	 * Construct the registry, the ledger and the broker connection.
	 */
	void broker_init();

	/**
	 * Make SIGINT and SIGTERM end the main loop.
	 */
	void signals_init();

	/**
	 * Exit whole application with return code 1.
	 * @param msg String which is copied to stderr and logger if initialized.
	 */
	[[noreturn]] void force_exit(const std::string &msg = "");

	/**
	 * Parse command line arguments given in constructor.
	 */
	void parse_params();

	/**
	 * Load broker configuration from config file at default location
	 * or from file given in cmd parameters.
	 */
	void load_config();

	/** Signal handler, ends the main loop of the running instance */
	static void handle_signal(int signal);

	/** The instance the signals are delivered to */
	static broker_connect *signalled_broker_;

	// PRIVATE DATA MEMBERS
	/** Command line parameters. */
	std::vector<std::string> args_;

	/** Filename where broker configuration is loaded from. */
	std::string config_filename_;

	/** Loaded broker configuration. */
	std::shared_ptr<broker_config> config_;

	/** Pointer to system logger. */
	std::shared_ptr<spdlog::logger> logger_;

	/** Registry of connected executors. */
	std::shared_ptr<executor_registry> registry_;

	/** Tasks waiting for their results. */
	std::shared_ptr<pending_ledger> ledger_;

	/** Pointer to ZeroMQ context. */
	std::shared_ptr<zmq::context_t> context_;

	/** Main broker class which handles incoming and outgoing connections. */
	std::shared_ptr<broker_connect> broker_;
};

#endif // TASKBROKER_BROKER_CORE_H
