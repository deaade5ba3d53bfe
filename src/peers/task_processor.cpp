#include "task_processor.h"

#include <boost/algorithm/string.hpp>
#include <limits>
#include <stdexcept>
#include <vector>

std::string sum_processor::process(const std::string &payload)
{
	std::vector<std::string> items;
	boost::split(items, payload, boost::is_any_of(","));

	long long sum = 0;

	for (auto &item : items) {
		std::string number = boost::trim_copy(item);

		std::size_t parsed = 0;
		long long value = 0;
		try {
			value = std::stoll(number, &parsed);
		} catch (const std::invalid_argument &) {
			return "ERROR: invalid number '" + number + "'";
		} catch (const std::out_of_range &) {
			return "ERROR: number out of range '" + number + "'";
		}

		if (parsed != number.size()) {
			return "ERROR: invalid number '" + number + "'";
		}

		if ((value > 0 && sum > std::numeric_limits<long long>::max() - value) ||
			(value < 0 && sum < std::numeric_limits<long long>::min() - value)) {
			return "ERROR: sum out of range";
		}

		sum += value;
	}

	return std::to_string(sum);
}
