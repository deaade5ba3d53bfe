#include "string_to_hex.h"

std::string helpers::string_to_hex(const std::string &string)
{
	static const char digits[] = "0123456789abcdef";

	std::string result;
	result.reserve(string.size() * 2);

	for (unsigned char c : string) {
		result += digits[c >> 4];
		result += digits[c & 0x0f];
	}

	return result;
}
