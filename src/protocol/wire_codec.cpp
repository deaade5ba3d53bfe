#include "wire_codec.h"

#include <map>

const std::string wire_codec::TAG_TASK = "TASK";
const std::string wire_codec::TAG_RESULT = "RESULT";
const std::string wire_codec::TAG_TASK_FAILED = "TASK_FAILED";
const std::string wire_codec::TAG_REGISTER = "REGISTER";
const std::string wire_codec::TAG_ACK = "ACK";
const std::string wire_codec::TAG_ASSIGN_TASK = "ASSIGN_TASK";
const std::string wire_codec::TAG_TASK_RESULT = "TASK_RESULT";

wire_message::wire_message(const std::string &tag, const std::vector<std::string> &fields) : tag(tag), fields(fields)
{
}

bool wire_message::operator==(const wire_message &other) const
{
	return tag == other.tag && fields == other.fields;
}

protocol_error::protocol_error(const std::string &msg) : std::runtime_error(msg)
{
}

std::size_t wire_codec::get_field_count(const std::string &tag)
{
	static const std::map<std::string, std::size_t> field_counts = {
		{TAG_TASK, 2},
		{TAG_RESULT, 2},
		{TAG_TASK_FAILED, 2},
		{TAG_REGISTER, 1},
		{TAG_ACK, 1},
		{TAG_ASSIGN_TASK, 2},
		{TAG_TASK_RESULT, 2},
	};

	auto it = field_counts.find(tag);
	if (it == field_counts.end()) {
		throw protocol_error("Unknown message tag '" + tag + "'");
	}

	return it->second;
}

std::string wire_codec::encode(const std::string &tag, const std::vector<std::string> &fields)
{
	std::size_t expected = get_field_count(tag);
	if (fields.size() != expected) {
		throw protocol_error("Message '" + tag + "' takes " + std::to_string(expected) + " fields, " +
			std::to_string(fields.size()) + " given");
	}

	std::string line = tag;

	for (std::size_t i = 0; i < fields.size(); ++i) {
		auto &field = fields[i];

		if (field.find_first_of("\r\n") != std::string::npos) {
			throw protocol_error("Field " + std::to_string(i + 1) + " of '" + tag + "' contains a line terminator");
		}

		// only the last field is allowed to swallow delimiters
		if (i + 1 < fields.size() && field.find(FIELD_DELIMITER) != std::string::npos) {
			throw protocol_error("Field " + std::to_string(i + 1) + " of '" + tag + "' contains a field delimiter");
		}

		line += FIELD_DELIMITER;
		line += field;
	}

	return line;
}

wire_message wire_codec::decode(const std::string &line)
{
	std::size_t tag_end = line.find(FIELD_DELIMITER);
	wire_message result;
	result.tag = line.substr(0, tag_end);

	std::size_t expected = get_field_count(result.tag);

	if (tag_end == std::string::npos) {
		throw protocol_error(
			"Message '" + result.tag + "' takes " + std::to_string(expected) + " fields, none given");
	}

	std::size_t offset = tag_end + 1;

	for (std::size_t i = 0; i < expected; ++i) {
		if (i + 1 == expected) {
			result.fields.push_back(line.substr(offset));
			break;
		}

		std::size_t end = line.find(FIELD_DELIMITER, offset);
		if (end == std::string::npos) {
			throw protocol_error("Message '" + result.tag + "' takes " + std::to_string(expected) + " fields, " +
				std::to_string(i + 1) + " given");
		}

		result.fields.push_back(line.substr(offset, end - offset));
		offset = end + 1;
	}

	return result;
}
