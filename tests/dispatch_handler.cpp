#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/handlers/dispatch_handler.h"
#include "mocks.h"

using namespace testing;

class dispatch_handler_test : public Test
{
protected:
	std::shared_ptr<NiceMock<mock_broker_config>> config = std::make_shared<NiceMock<mock_broker_config>>();
	std::shared_ptr<executor_registry> registry = std::make_shared<executor_registry>();
	std::shared_ptr<pending_ledger> ledger = std::make_shared<pending_ledger>(4);
	response_recorder recorder;
	dispatch_handler handler{config, registry, ledger, nullptr};

	void add_executor(const std::string &id)
	{
		registry->add_executor(
			std::make_shared<const executor>(id, connection_handle(broker_connect::KEY_EXECUTORS, "peer_" + id)));
	}

	/** Admit a task like a producer session does and hand it to the handler */
	void submit(const std::string &task_id, const std::string &payload, const std::string &producer_peer = "p1")
	{
		connection_handle producer(broker_connect::KEY_PRODUCERS, producer_peer);
		ledger->put(task_id, producer);
		handler.on_request(
			message_container(broker_connect::KEY_DISPATCH, "", task(task_id, payload, producer).to_frames()),
			recorder.callback());
	}

	void tick(int millis)
	{
		handler.on_request(message_container(reactor::KEY_TIMER, "", {std::to_string(millis)}), recorder.callback());
	}
};

TEST_F(dispatch_handler_test, assigns_to_idle_executor)
{
	add_executor("w1");
	submit("t1", "1,2,3,4,5");

	EXPECT_THAT(recorder.lines_to(broker_connect::KEY_EXECUTORS, "peer_w1"), ElementsAre("ASSIGN_TASK|t1|1,2,3,4,5"));

	auto held = registry->get_current_task("w1");
	ASSERT_NE(nullptr, held);
	EXPECT_EQ("t1", held->id);
	EXPECT_EQ(0u, registry->get_idle_count());
}

TEST_F(dispatch_handler_test, round_robin)
{
	add_executor("w1");
	add_executor("w2");
	add_executor("w3");

	submit("t1", "a");
	submit("t2", "b");
	submit("t3", "c");

	EXPECT_THAT(recorder.messages,
		ElementsAre(message_container(broker_connect::KEY_EXECUTORS, "peer_w1", {"ASSIGN_TASK|t1|a"}),
			message_container(broker_connect::KEY_EXECUTORS, "peer_w2", {"ASSIGN_TASK|t2|b"}),
			message_container(broker_connect::KEY_EXECUTORS, "peer_w3", {"ASSIGN_TASK|t3|c"})));
}

TEST_F(dispatch_handler_test, waits_for_an_executor)
{
	submit("t1", "a");
	submit("t2", "b");

	EXPECT_TRUE(recorder.messages.empty());
	EXPECT_EQ(2u, handler.get_deferred_count());

	add_executor("w1");
	add_executor("w2");

	// the retry interval has not elapsed yet
	tick(50);
	EXPECT_TRUE(recorder.messages.empty());

	tick(50);
	EXPECT_EQ(0u, handler.get_deferred_count());
	EXPECT_EQ(2u, recorder.with_key(broker_connect::KEY_EXECUTORS).size());
	EXPECT_EQ(0u, registry->get_idle_count());
}

TEST_F(dispatch_handler_test, gives_up_after_max_attempts)
{
	// three attempts are allowed by the mocked configuration
	submit("t1", "a");
	tick(100);
	EXPECT_EQ(1u, handler.get_deferred_count());
	EXPECT_TRUE(recorder.messages.empty());

	tick(100);
	EXPECT_EQ(0u, handler.get_deferred_count());
	EXPECT_THAT(recorder.lines_to(broker_connect::KEY_PRODUCERS, "p1"),
		ElementsAre("TASK_FAILED|t1|no executor available after 3 attempts"));
	EXPECT_EQ(0u, ledger->size());
}

TEST_F(dispatch_handler_test, unbounded_attempts)
{
	EXPECT_CALL(*config, get_max_dispatch_attempts()).WillRepeatedly(Return(0));

	submit("t1", "a");
	for (int i = 0; i < 10; ++i) {
		tick(100);
	}

	EXPECT_EQ(1u, handler.get_deferred_count());
	EXPECT_TRUE(recorder.messages.empty());
}

TEST_F(dispatch_handler_test, abandons_swept_task)
{
	submit("t1", "a");
	ledger->drop_all(connection_handle(broker_connect::KEY_PRODUCERS, "p1"));
	add_executor("w1");

	tick(100);

	EXPECT_TRUE(recorder.messages.empty());
	EXPECT_EQ(0u, handler.get_deferred_count());
	EXPECT_EQ(1u, registry->get_idle_count());
}

TEST_F(dispatch_handler_test, skips_task_that_is_not_pending)
{
	add_executor("w1");

	// never admitted into the ledger
	handler.on_request(message_container(broker_connect::KEY_DISPATCH,
						   "",
						   task("t1", "a", connection_handle(broker_connect::KEY_PRODUCERS, "p1")).to_frames()),
		recorder.callback());

	EXPECT_TRUE(recorder.messages.empty());
	EXPECT_EQ(1u, registry->get_idle_count());
}

TEST_F(dispatch_handler_test, ignores_malformed_request)
{
	add_executor("w1");
	handler.on_request(message_container(broker_connect::KEY_DISPATCH, "", {"t1", "a"}), recorder.callback());
	handler.on_request(
		message_container(broker_connect::KEY_DISPATCH, "", {"t1", "a", "producers", "p1", "many"}), recorder.callback());

	EXPECT_TRUE(recorder.messages.empty());
	EXPECT_EQ(1u, registry->get_idle_count());
}

TEST_F(dispatch_handler_test, requeued_task_keeps_failure_count)
{
	add_executor("w1");

	connection_handle producer(broker_connect::KEY_PRODUCERS, "p1");
	ledger->put("t1", producer);
	handler.on_request(
		message_container(broker_connect::KEY_DISPATCH, "", task("t1", "a", producer, 1).to_frames()),
		recorder.callback());

	auto held = registry->get_current_task("w1");
	ASSERT_NE(nullptr, held);
	EXPECT_EQ(1u, held->failure_count);
}

TEST(dispatch_handler, only_the_first_waiting_task_blocks)
{
	auto config = std::make_shared<NiceMock<mock_broker_config>>();
	auto registry = std::make_shared<StrictMock<mock_executor_registry>>();
	auto ledger = std::make_shared<pending_ledger>(4);
	response_recorder recorder;
	dispatch_handler handler(config, registry, ledger);

	EXPECT_CALL(*config, get_acquire_timeout()).WillRepeatedly(Return(std::chrono::milliseconds(5000)));
	EXPECT_CALL(*config, get_retry_interval()).WillRepeatedly(Return(std::chrono::milliseconds(1000)));
	EXPECT_CALL(*config, get_max_dispatch_attempts()).WillRepeatedly(Return(0));

	// one blocking acquire for the first task, then the other four arrive and one retry round runs
	EXPECT_CALL(*registry, acquire(std::chrono::milliseconds(5000))).Times(1).WillOnce(Return(nullptr));
	EXPECT_CALL(*registry, acquire(std::chrono::milliseconds(0))).Times(9).WillRepeatedly(Return(nullptr));

	connection_handle producer(broker_connect::KEY_PRODUCERS, "p1");
	for (int i = 1; i <= 5; ++i) {
		std::string id = "t" + std::to_string(i);
		ledger->put(id, producer);
		handler.on_request(
			message_container(broker_connect::KEY_DISPATCH, "", task(id, "x", producer).to_frames()), recorder.callback());
	}
	EXPECT_EQ(5u, handler.get_deferred_count());

	// every deferred task gets its retry once the interval elapses
	handler.on_request(message_container(reactor::KEY_TIMER, "", {"1000"}), recorder.callback());

	EXPECT_EQ(5u, handler.get_deferred_count());
	EXPECT_TRUE(recorder.messages.empty());
}
