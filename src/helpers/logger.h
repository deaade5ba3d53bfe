#ifndef TASKBROKER_HELPERS_LOGGER_H
#define TASKBROKER_HELPERS_LOGGER_H

#include <memory>
#include <string>

// clang-format off
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
// clang-format on

namespace helpers
{
	/**
	 * Creates a logger which throws everything away. Used whenever no logger is given.
	 * The logger is not registered globally.
	 * @return smart pointer to created logger
	 */
	std::shared_ptr<spdlog::logger> create_null_logger();

	/**
	 * Translate the textual name of a logging level used in the configuration.
	 * Unknown names result in the most verbose level.
	 * @param lev textual description of logging level
	 * @return matching spdlog level
	 */
	spdlog::level::level_enum get_log_level(const std::string &lev);

	/**
	 * Get a number describing verbosity of given log level.
	 * More informative levels (debug, info) have greater values than error levels.
	 * @param lev spdlog level enum type
	 * @return verbosity of the level
	 */
	int get_log_level_number(spdlog::level::level_enum lev);

	/**
	 * Compare verbosity of two levels:
	 *   result = verbosity(first) - verbosity(second)
	 * @param first minuend
	 * @param second subtrahend
	 * @return difference
	 */
	int compare_log_levels(spdlog::level::level_enum first, spdlog::level::level_enum second);
}


#endif // TASKBROKER_HELPERS_LOGGER_H
