#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/protocol/wire_codec.h"

using namespace testing;

TEST(wire_codec, encodes_task)
{
	EXPECT_EQ("TASK|t1|1,2,3,4,5", wire_codec::encode(wire_codec::TAG_TASK, {"t1", "1,2,3,4,5"}));
	EXPECT_EQ("ACK|w1", wire_codec::encode(wire_codec::TAG_ACK, {"w1"}));
}

TEST(wire_codec, last_field_keeps_delimiters)
{
	auto line = wire_codec::encode(wire_codec::TAG_RESULT, {"t1", "a|b||c"});
	EXPECT_EQ("RESULT|t1|a|b||c", line);

	auto message = wire_codec::decode(line);
	EXPECT_EQ(wire_codec::TAG_RESULT, message.tag);
	EXPECT_THAT(message.fields, ElementsAre("t1", "a|b||c"));
}

TEST(wire_codec, decodes_empty_payload)
{
	auto message = wire_codec::decode("TASK|t1|");
	EXPECT_THAT(message.fields, ElementsAre("t1", ""));
}

TEST(wire_codec, decodes_register)
{
	EXPECT_EQ(wire_message(wire_codec::TAG_REGISTER, {"worker|1"}), wire_codec::decode("REGISTER|worker|1"));
}

TEST(wire_codec, rejects_unknown_tag)
{
	EXPECT_THROW(wire_codec::decode("HELLO|t1|x"), protocol_error);
	EXPECT_THROW(wire_codec::decode("task|t1|x"), protocol_error);
	EXPECT_THROW(wire_codec::encode("HELLO", {"x"}), protocol_error);
}

TEST(wire_codec, rejects_missing_fields)
{
	EXPECT_THROW(wire_codec::decode("TASK"), protocol_error);
	EXPECT_THROW(wire_codec::decode("TASK|t1"), protocol_error);
	EXPECT_THROW(wire_codec::decode("REGISTER"), protocol_error);
	EXPECT_THROW(wire_codec::decode(""), protocol_error);
}

TEST(wire_codec, rejects_unrepresentable_fields)
{
	EXPECT_THROW(wire_codec::encode(wire_codec::TAG_TASK, {"t1"}), protocol_error);
	EXPECT_THROW(wire_codec::encode(wire_codec::TAG_TASK, {"t|1", "x"}), protocol_error);
	EXPECT_THROW(wire_codec::encode(wire_codec::TAG_TASK, {"t1", "x\ny"}), protocol_error);
	EXPECT_THROW(wire_codec::encode(wire_codec::TAG_ACK, {"w\r1"}), protocol_error);
}

TEST(wire_codec, field_counts)
{
	EXPECT_EQ(1u, wire_codec::get_field_count(wire_codec::TAG_REGISTER));
	EXPECT_EQ(2u, wire_codec::get_field_count(wire_codec::TAG_ASSIGN_TASK));
	EXPECT_EQ(2u, wire_codec::get_field_count(wire_codec::TAG_TASK_FAILED));
	EXPECT_THROW(wire_codec::get_field_count("NOPE"), protocol_error);
}
