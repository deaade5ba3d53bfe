#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <thread>

#include "../src/executor_registry.h"
#include "../src/reactor/reactor.h"

using namespace testing;

class pair_socket_wrapper : public socket_wrapper_base
{
public:
	pair_socket_wrapper(const std::shared_ptr<zmq::context_t> context, const std::string &addr)
		: socket_wrapper_base(context, zmq::socket_type::pair, addr, false),
		  local_socket_(*context, zmq::socket_type::pair), context_(context)
	{
		local_socket_.setsockopt(ZMQ_LINGER, 0);
		local_socket_.bind(addr_);
		socket_.close();
	}

	void initialize() override
	{
		// called by the reactor
		socket_ = zmq::socket_t(*context_, zmq::socket_type::pair);
		socket_.setsockopt(ZMQ_LINGER, 0);
		socket_.connect(addr_);
	}

	bool send_message(const message_container &message) override
	{
		return socket_send(socket_, message);
	}

	bool receive_message(message_container &message) override
	{
		return socket_receive(socket_, message);
	}

	bool send_message_local(const message_container &message)
	{
		return socket_send(local_socket_, message);
	}

	bool receive_message_local(message_container &message)
	{
		return socket_receive(local_socket_, message, true);
	}

private:
	zmq::socket_t local_socket_;
	std::shared_ptr<zmq::context_t> context_;

	bool socket_send(zmq::socket_t &socket, const message_container &message)
	{
		bool retval;
		zmq::message_t zmessage(message.identity.c_str(), message.identity.size());
		retval = socket.send(zmessage, ZMQ_SNDMORE);

		if (!retval) {
			return false;
		}

		for (auto it = std::begin(message.data); it != std::end(message.data); ++it) {
			zmessage.rebuild(it->c_str(), it->size());
			retval = socket.send(zmessage, std::next(it) != std::end(message.data) ? ZMQ_SNDMORE : 0);

			if (!retval) {
				return false;
			}
		}

		return true;
	}

	bool socket_receive(zmq::socket_t &socket, message_container &message, bool noblock = false)
	{
		zmq::message_t received_message;
		bool retval;

		retval = socket.recv(&received_message, noblock ? ZMQ_NOBLOCK : 0);

		if (!retval) {
			return false;
		}

		message.identity = std::string((char *) received_message.data(), received_message.size());

		while (received_message.more()) {
			retval = socket.recv(&received_message);

			if (!retval) {
				return false;
			}

			message.data.emplace_back((char *) received_message.data(), received_message.size());
		}

		return true;
	}
};

/**
 * A handler driven by a function passed on creation
 */
class pluggable_handler : public handler_interface
{
public:
	typedef std::function<void(const message_container &message, const response_cb &response)> fnc_t;

	std::vector<message_container> received;

	pluggable_handler(fnc_t fnc) : fnc_(fnc)
	{
	}

	static std::shared_ptr<pluggable_handler> create(fnc_t fnc)
	{
		return std::make_shared<pluggable_handler>(fnc);
	}

	void on_request(const message_container &message, const response_cb &response) override
	{
		received.push_back(message);
		fnc_(message, response);
	}

private:
	fnc_t fnc_;
};

TEST(reactor, synchronous_handler)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto socket = std::make_shared<pair_socket_wrapper>(context, "inproc://synchronous_handler_1");
	auto handler = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) {
		respond(message_container("socket", "id1", {"Hello!"}));
	});

	r.add_socket("socket", socket);
	r.add_handler({"socket"}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	socket->send_message_local(message_container("", "id1", {"Hello??"}));
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	EXPECT_THAT(handler->received, ElementsAre(message_container("socket", "id1", {"Hello??"})));

	message_container message;
	socket->receive_message_local(message);

	EXPECT_EQ("id1", message.identity);
	EXPECT_THAT(message.data, ElementsAre("Hello!"));

	r.terminate();
	thread.join();
}

TEST(reactor, asynchronous_handler)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto socket = std::make_shared<pair_socket_wrapper>(context, "inproc://asynchronous_handler_1");
	auto handler = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) {
		respond(message_container("socket", "id1", {"Hello!"}));
	});

	r.add_socket("socket", socket);
	r.add_async_handler({"socket"}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	socket->send_message_local(message_container("", "id1", {"Hello??"}));
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	EXPECT_THAT(handler->received, ElementsAre(message_container("socket", "id1", {"Hello??"})));

	message_container message;
	socket->receive_message_local(message);

	EXPECT_EQ("id1", message.identity);
	EXPECT_THAT(message.data, ElementsAre("Hello!"));

	r.terminate();
	thread.join();
}

TEST(reactor, timers)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto socket = std::make_shared<pair_socket_wrapper>(context, "inproc://timers_1");
	auto handler = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) { });

	r.add_async_handler({r.KEY_TIMER}, handler);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(200));

	ASSERT_LE(1u, handler->received.size());

	r.terminate();
	thread.join();
}

/**
 * A socket that refuses to send anything, as if every peer was gone
 */
class broken_socket_wrapper : public pair_socket_wrapper
{
public:
	using pair_socket_wrapper::pair_socket_wrapper;

	bool send_message(const message_container &message) override
	{
		return false;
	}
};

TEST(reactor, undelivered_messages)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto socket = std::make_shared<broken_socket_wrapper>(context, "inproc://undelivered_1");
	auto handler = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) {
		respond(message_container("socket", "id1", {"line 1", "line 2"}));
	});
	auto undelivered = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) { });

	r.add_socket("socket", socket);
	r.add_handler({"socket"}, handler);
	r.add_handler({r.KEY_UNDELIVERED}, undelivered);

	std::thread thread([&r]() { r.start_loop(); });
	std::this_thread::sleep_for(std::chrono::milliseconds(10));

	socket->send_message_local(message_container("", "id1", {"Hello??"}));
	std::this_thread::sleep_for(std::chrono::milliseconds(50));

	r.terminate();
	thread.join();

	EXPECT_THAT(undelivered->received,
		ElementsAre(message_container(r.KEY_UNDELIVERED, "id1", {"socket", "line 1", "line 2"})));
}

TEST(reactor, messages_between_handlers)
{
	auto context = std::make_shared<zmq::context_t>(1);
	reactor r(context);
	auto producer = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) {
		if (msg.key == "start") {
			respond(message_container("internal", "", {"payload"}));
		}
	});
	auto consumer = pluggable_handler::create([](const message_container &msg, const handler_interface::response_cb &respond) { });

	r.add_handler({"start"}, producer);
	r.add_handler({"internal"}, consumer);

	r.process_message(message_container("start", "", {}));

	EXPECT_THAT(consumer->received, ElementsAre(message_container("internal", "", {"payload"})));
}

TEST(reactor, async_handler_gets_every_message_while_busy)
{
	auto context = std::make_shared<zmq::context_t>(1);
	const std::size_t count = 5000;
	std::promise<void> release;
	std::shared_future<void> released = release.get_future().share();
	std::atomic<std::size_t> handled(0);

	{
		reactor r(context);
		auto handler = pluggable_handler::create(
			[&handled, released](const message_container &msg, const handler_interface::response_cb &respond) {
				released.wait();
				++handled;
			});

		r.add_async_handler({"work"}, handler);

		// the handler is stuck, everything has to be queued
		for (std::size_t i = 0; i < count; ++i) {
			r.process_message(message_container("work", "", {std::to_string(i)}));
		}

		release.set_value();

		auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
		while (handled.load() < count && std::chrono::steady_clock::now() < deadline) {
			std::this_thread::sleep_for(std::chrono::milliseconds(10));
		}
	}

	EXPECT_EQ(count, handled.load());
}

TEST(reactor, shutdown_hook_wakes_blocked_async_handler)
{
	auto context = std::make_shared<zmq::context_t>(1);
	auto registry = std::make_shared<executor_registry>();
	reactor r(context);
	std::atomic<bool> waiting(false);

	auto handler = pluggable_handler::create(
		[registry, &waiting](const message_container &msg, const handler_interface::response_cb &respond) {
			if (!waiting.exchange(true)) {
				registry->acquire(std::chrono::seconds(60));
			}
		});

	r.add_async_handler({r.KEY_TIMER}, handler);
	r.add_shutdown_hook([registry]() { registry->close(); });

	std::thread thread([&r]() { r.start_loop(); });

	while (!waiting.load()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}

	auto stopping = std::chrono::steady_clock::now();
	r.terminate();
	thread.join();

	EXPECT_GT(std::chrono::seconds(5), std::chrono::steady_clock::now() - stopping);
}
