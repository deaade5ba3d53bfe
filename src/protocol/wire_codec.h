#ifndef TASKBROKER_PROTOCOL_WIRE_CODEC_H
#define TASKBROKER_PROTOCOL_WIRE_CODEC_H

#include <stdexcept>
#include <string>
#include <vector>


/**
 * One line of the broker protocol split into its tag and fields.
 */
struct wire_message {
	/** Message type, e.g. TASK or TASK_RESULT */
	std::string tag;

	/** Fields following the tag, the last one holds the remainder of the line */
	std::vector<std::string> fields;

	/**
	 * The default constructor
	 */
	wire_message() = default;

	/**
	 * @param tag message type
	 * @param fields fields following the tag
	 */
	wire_message(const std::string &tag, const std::vector<std::string> &fields);

	/**
	 * Two messages are equal if their tags and all their fields are equal
	 * @param other the object we are comparing with
	 * @return true if and only if the objects are equal
	 */
	bool operator==(const wire_message &other) const;
};


/**
 * Malformed or unexpected protocol message.
 */
class protocol_error : public std::runtime_error
{
public:
	/** Destructor */
	~protocol_error() override = default;

	/**
	 * @param msg description of the malformation
	 */
	explicit protocol_error(const std::string &msg);
};


/**
 * Stateless encoder and decoder of the line-oriented, pipe-delimited broker protocol.
 * Lines are handled without their terminator, framing is done by the transport.
 */
namespace wire_codec
{
	/** Separator between the tag and the fields */
	const char FIELD_DELIMITER = '|';

	/** Terminator of every line on the wire */
	const char LINE_DELIMITER = '\n';

	/** producer -> broker: task_id, payload */
	extern const std::string TAG_TASK;
	/** broker -> producer: task_id, result */
	extern const std::string TAG_RESULT;
	/** broker -> producer: task_id, reason */
	extern const std::string TAG_TASK_FAILED;
	/** executor -> broker: executor_id */
	extern const std::string TAG_REGISTER;
	/** broker -> executor: executor_id */
	extern const std::string TAG_ACK;
	/** broker -> executor: task_id, payload */
	extern const std::string TAG_ASSIGN_TASK;
	/** executor -> broker: task_id, result */
	extern const std::string TAG_TASK_RESULT;

	/**
	 * Get the number of fields a message type carries.
	 * @param tag message type
	 * @return field count
	 * @throws protocol_error for unknown tags
	 */
	std::size_t get_field_count(const std::string &tag);

	/**
	 * Build a protocol line. Only the last field may contain the field delimiter,
	 * no field may contain a line terminator.
	 * @param tag message type
	 * @param fields exactly as many fields as the tag requires
	 * @return the line without terminator
	 * @throws protocol_error if the message cannot be represented
	 */
	std::string encode(const std::string &tag, const std::vector<std::string> &fields);

	/**
	 * Split a protocol line into at most (field count + 1) parts, the last field takes the rest of
	 * the line verbatim.
	 * @param line line without terminator
	 * @return decoded message
	 * @throws protocol_error on unknown tag or missing fields
	 */
	wire_message decode(const std::string &line);
}

#endif // TASKBROKER_PROTOCOL_WIRE_CODEC_H
