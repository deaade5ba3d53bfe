#ifndef TASKBROKER_HELPERS_STRING_TO_HEX_H
#define TASKBROKER_HELPERS_STRING_TO_HEX_H

#include <string>

namespace helpers
{
	/**
	 * Render binary data (e.g. a ZeroMQ routing id) as lowercase hexadecimal digits, two per byte.
	 * @param string data to be rendered
	 * @return printable representation
	 */
	std::string string_to_hex(const std::string &string);
}


#endif // TASKBROKER_HELPERS_STRING_TO_HEX_H
