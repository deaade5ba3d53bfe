#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/peers/line_client.h"
#include "../src/reactor/stream_socket_wrapper.h"
#include "mocks.h"

using namespace testing;

class stream_socket_wrapper_test : public Test
{
protected:
	std::shared_ptr<zmq::context_t> context = std::make_shared<zmq::context_t>(1);
	const std::string endpoint = "tcp://127.0.0.1:28950";
	std::shared_ptr<stream_socket_wrapper> socket =
		std::make_shared<stream_socket_wrapper>(context, endpoint, true, 16);

	void SetUp() override
	{
		socket->initialize();
	}

	/** Receive the next event of the broker side socket */
	bool next_event(message_container &message)
	{
		std::vector<zmq_pollitem_t> items = {socket->get_pollitem()};
		zmq::poll(items, std::chrono::milliseconds(3000));

		if (!(items.front().revents & ZMQ_POLLIN)) {
			return false;
		}

		return socket->receive_message(message);
	}
};

TEST_F(stream_socket_wrapper_test, connection_lifecycle)
{
	line_client client(context, endpoint);
	ASSERT_TRUE(client.connect(std::chrono::milliseconds(3000)));

	message_container message;
	ASSERT_TRUE(next_event(message));
	EXPECT_THAT(message.data, ElementsAre(stream_socket_wrapper::FRAME_CONNECTED));
	std::string peer = message.identity;

	ASSERT_TRUE(client.send_line("REGISTER|w1"));
	ASSERT_TRUE(next_event(message));
	EXPECT_EQ(peer, message.identity);
	EXPECT_THAT(message.data, ElementsAre(stream_socket_wrapper::FRAME_LINES, "REGISTER|w1"));

	ASSERT_TRUE(socket->send_message(message_container("executors", peer, {"ACK|w1", "ASSIGN_TASK|t1|x"})));

	std::string line;
	ASSERT_TRUE(client.receive_line(line, std::chrono::milliseconds(3000)));
	EXPECT_EQ("ACK|w1", line);
	ASSERT_TRUE(client.receive_line(line, std::chrono::milliseconds(3000)));
	EXPECT_EQ("ASSIGN_TASK|t1|x", line);

	client.close();
	ASSERT_TRUE(next_event(message));
	EXPECT_THAT(message.data, ElementsAre(stream_socket_wrapper::FRAME_DISCONNECTED));
}

TEST_F(stream_socket_wrapper_test, overlong_line)
{
	line_client client(context, endpoint);
	ASSERT_TRUE(client.connect(std::chrono::milliseconds(3000)));

	message_container message;
	ASSERT_TRUE(next_event(message));

	ASSERT_TRUE(client.send_line("TASK|t1|this payload is way too long"));
	ASSERT_TRUE(next_event(message));
	EXPECT_THAT(message.data, ElementsAre(stream_socket_wrapper::FRAME_OVERFLOW));
}

TEST_F(stream_socket_wrapper_test, broker_closes_connection)
{
	line_client client(context, endpoint);
	ASSERT_TRUE(client.connect(std::chrono::milliseconds(3000)));

	message_container message;
	ASSERT_TRUE(next_event(message));

	ASSERT_TRUE(socket->send_message(message_container("executors", message.identity, {})));

	std::string line;
	EXPECT_FALSE(client.receive_line(line, std::chrono::milliseconds(3000)));
	EXPECT_FALSE(client.is_connected());
}

TEST_F(stream_socket_wrapper_test, unknown_peer)
{
	EXPECT_FALSE(socket->send_message(message_container("executors", "nobody", {"RESULT|t1|1"})));
}
