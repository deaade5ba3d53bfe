#include "gtest/gtest.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/spdlog.h"

#define BOOST_FILESYSTEM_NO_DEPRECATED
#define BOOST_NO_CXX11_SCOPED_ENUMS
#include <boost/filesystem.hpp>

namespace fs = boost::filesystem;


void init()
{
	std::string log_path = "/tmp/taskbroker_log/";
	std::string log_basename = "tests.log";
	spdlog::level::level_enum log_level = spdlog::level::debug;
	std::size_t log_file_size = 1024 * 1024;
	std::size_t log_files_count = 3;

	// Set up logger
	// Try to create target directory for logs
	auto path = fs::path(log_path);
	try {
		if (!fs::is_directory(path)) {
			fs::create_directories(path);
		}
	} catch (fs::filesystem_error &e) {
		std::cerr << "Logger: " << e.what() << std::endl;
		throw;
	}

	// Create and register logger
	try {
		auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
			(path / log_basename).string(), log_file_size, log_files_count);
		auto file_logger = std::make_shared<spdlog::logger>("logger", rotating_sink);
		file_logger->set_level(log_level);
		spdlog::register_logger(file_logger);

		file_logger->critical("------------------------------");
		file_logger->critical("    Started taskbroker tests");
		file_logger->critical("------------------------------");
	} catch (spdlog::spdlog_ex &e) {
		std::cerr << "Logger: " << e.what() << std::endl;
		throw;
	}
}


int main(int argc, char **argv)
{
	try {
		init();
	} catch (std::exception &e) {
		std::cerr << "Test initialization failed: " << e.what() << std::endl;
		return 1;
	}

	testing::InitGoogleTest(&argc, argv);
	auto result = RUN_ALL_TESTS();

	return result;
}
