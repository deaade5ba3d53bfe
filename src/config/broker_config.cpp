#include "broker_config.h"

#define BOOST_FILESYSTEM_NO_DEPRECATED
#define BOOST_NO_CXX11_SCOPED_ENUMS
#include <boost/filesystem.hpp>
namespace fs = boost::filesystem;

namespace
{
	/**
	 * Load an optional scalar from a map node.
	 * @return true if the value was present
	 */
	template <typename T> bool load_scalar(const YAML::Node &section, const char *key, T &target)
	{
		if (section[key] && section[key].IsScalar()) {
			target = section[key].as<T>();
			return true;
		}

		return false;
	}

	/** Load an optional scalar interpreted as milliseconds */
	bool load_millis(const YAML::Node &section, const char *key, std::chrono::milliseconds &target)
	{
		std::size_t millis;
		if (load_scalar(section, key, millis)) {
			target = std::chrono::milliseconds(millis);
			return true;
		}

		return false;
	}
} // namespace

broker_config::broker_config(const YAML::Node &config)
{
	try {
		if (!config.IsMap()) {
			throw config_error("The configuration is not a YAML map");
		}

		// load producer address and port
		if (config["producers"] && config["producers"].IsMap()) {
			load_scalar(config["producers"], "address", producer_address_);
			load_scalar(config["producers"], "port", producer_port_);
		} // no throw... can be omitted

		// load executor address and port
		if (config["executors"] && config["executors"].IsMap()) {
			load_scalar(config["executors"], "address", executor_address_);
			load_scalar(config["executors"], "port", executor_port_);
		}

		// load dispatching parameters
		if (config["dispatch"] && config["dispatch"].IsMap()) {
			const YAML::Node &dispatch = config["dispatch"];
			load_millis(dispatch, "acquire_timeout", acquire_timeout_);
			load_millis(dispatch, "retry_interval", retry_interval_);
			load_scalar(dispatch, "max_attempts", max_dispatch_attempts_);
			load_scalar(dispatch, "max_task_failures", max_task_failures_);
		}

		if (config["ledger"] && config["ledger"].IsMap()) {
			load_scalar(config["ledger"], "shards", ledger_shards_);
		}

		if (config["protocol"] && config["protocol"].IsMap()) {
			load_scalar(config["protocol"], "max_line_length", max_line_length_);
		}

		// load logger
		if (config["logger"] && config["logger"].IsMap()) {
			const YAML::Node &logger = config["logger"];

			std::string file;
			if (load_scalar(logger, "file", file)) {
				fs::path tmp = file;
				log_config_.log_basename = tmp.filename().string();
				log_config_.log_path = tmp.parent_path().string();
			}

			load_scalar(logger, "level", log_config_.log_level);
			load_scalar(logger, "max-size", log_config_.log_file_size);
			load_scalar(logger, "rotations", log_config_.log_files_count);
		} // no throw... can be omitted
	} catch (YAML::Exception &ex) {
		throw config_error("Broker configuration was not loaded: " + std::string(ex.what()));
	}

	if (ledger_shards_ == 0) {
		throw config_error("The pending ledger needs at least one shard");
	}

	if (max_line_length_ == 0) {
		throw config_error("The maximal line length must be positive");
	}

	if (max_task_failures_ == 0) {
		throw config_error("The maximal number of task failures must be positive");
	}
}

const std::string &broker_config::get_producer_address() const
{
	return producer_address_;
}

std::uint16_t broker_config::get_producer_port() const
{
	return producer_port_;
}

const std::string &broker_config::get_executor_address() const
{
	return executor_address_;
}

std::uint16_t broker_config::get_executor_port() const
{
	return executor_port_;
}

std::chrono::milliseconds broker_config::get_acquire_timeout() const
{
	return acquire_timeout_;
}

std::chrono::milliseconds broker_config::get_retry_interval() const
{
	return retry_interval_;
}

std::size_t broker_config::get_max_dispatch_attempts() const
{
	return max_dispatch_attempts_;
}

std::size_t broker_config::get_max_task_failures() const
{
	return max_task_failures_;
}

std::size_t broker_config::get_ledger_shards() const
{
	return ledger_shards_;
}

std::size_t broker_config::get_max_line_length() const
{
	return max_line_length_;
}

const log_config &broker_config::get_log_config() const
{
	return log_config_;
}

config_error::config_error(const std::string &msg) : std::runtime_error(msg)
{
}
