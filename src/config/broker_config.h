#ifndef TASKBROKER_CONFIG_BROKER_CONFIG_H
#define TASKBROKER_CONFIG_BROKER_CONFIG_H

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "log_config.h"


/**
 * An object representation of the broker configuration.
 * Every value has a default, so an empty YAML map is a valid configuration.
 */
class broker_config
{
public:
	/** A default constructor */
	broker_config() = default;
	/**
	 * A constructor that loads the configuration from a YAML document.
	 * @param config The input document.
	 * @throws config_error when the document is not a map or a value is invalid
	 */
	explicit broker_config(const YAML::Node &config);
	/**
	 * Destructor
	 */
	virtual ~broker_config() = default;
	/**
	 * Get IP address the producers connect to.
	 * @return Address of the producer endpoint.
	 */
	virtual const std::string &get_producer_address() const;
	/**
	 * Get the port the producers connect to.
	 * @return Port of the producer endpoint.
	 */
	virtual std::uint16_t get_producer_port() const;
	/**
	 * Get IP address the executors connect to.
	 * @return Address of the executor endpoint.
	 */
	virtual const std::string &get_executor_address() const;
	/**
	 * Get the port the executors connect to.
	 * @return Port of the executor endpoint.
	 */
	virtual std::uint16_t get_executor_port() const;
	/**
	 * Get the longest time one dispatch attempt waits for an idle executor.
	 */
	virtual std::chrono::milliseconds get_acquire_timeout() const;
	/**
	 * Get the delay between two dispatch attempts of the same task.
	 */
	virtual std::chrono::milliseconds get_retry_interval() const;
	/**
	 * Get the number of dispatch attempts after which a task is failed, zero means no limit.
	 */
	virtual std::size_t get_max_dispatch_attempts() const;
	/**
	 * Get how many executors may be lost while holding a task before the task is failed.
	 */
	virtual std::size_t get_max_task_failures() const;
	/** Number of independently locked parts of the pending ledger */
	virtual std::size_t get_ledger_shards() const;
	/** Longest accepted protocol line in bytes */
	virtual std::size_t get_max_line_length() const;
	/**
	 * Get wrapper for logger configuration.
	 * @return Logging config as @ref log_config structure.
	 */
	virtual const log_config &get_log_config() const;

private:
	/** Producer socket address */
	std::string producer_address_ = "127.0.0.1";
	/** Executor socket address */
	std::string executor_address_ = "127.0.0.1";
	/** Producer socket port */
	std::uint16_t producer_port_ = 8888;
	/** Executor socket port */
	std::uint16_t executor_port_ = 8889;
	std::chrono::milliseconds acquire_timeout_ = std::chrono::milliseconds(5000);
	std::chrono::milliseconds retry_interval_ = std::chrono::milliseconds(1000);
	std::size_t max_dispatch_attempts_ = 60;
	std::size_t max_task_failures_ = 3;
	std::size_t ledger_shards_ = 16;
	std::size_t max_line_length_ = 65536;
	/** Configuration of logger */
	log_config log_config_;
};


/**
 * Broker configuration exception.
 */
class config_error : public std::runtime_error
{
public:
	/** Destructor */
	~config_error() override = default;

	/**
	 * Construction with message returned with @a what method.
	 * @param msg description of exception circumstances
	 */
	explicit config_error(const std::string &msg);
};

#endif // TASKBROKER_CONFIG_BROKER_CONFIG_H
