#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <thread>

#include "../src/executor_registry.h"

using namespace testing;

namespace
{
	executor_registry::executor_ptr make_executor(const std::string &id)
	{
		return std::make_shared<const executor>(id, connection_handle("executors", "peer_" + id));
	}

	task_ptr make_task(const std::string &id)
	{
		return std::make_shared<const task>(id, "1,2,3", connection_handle("producers", "client"));
	}

	const std::chrono::milliseconds no_wait(0);
} // namespace

TEST(executor_registry, round_robin_in_registration_order)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));
	registry.add_executor(make_executor("w2"));
	registry.add_executor(make_executor("w3"));

	EXPECT_EQ("w1", registry.acquire(no_wait)->id);
	EXPECT_EQ("w2", registry.acquire(no_wait)->id);
	EXPECT_EQ("w3", registry.acquire(no_wait)->id);
	EXPECT_EQ(nullptr, registry.acquire(no_wait));
}

TEST(executor_registry, released_executor_goes_to_the_back)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));
	registry.add_executor(make_executor("w2"));

	auto first = registry.acquire(no_wait);
	ASSERT_EQ("w1", first->id);
	ASSERT_TRUE(registry.release("w1"));

	EXPECT_EQ("w2", registry.acquire(no_wait)->id);
	EXPECT_EQ("w1", registry.acquire(no_wait)->id);
}

TEST(executor_registry, acquire_times_out)
{
	executor_registry registry;

	auto start = std::chrono::steady_clock::now();
	EXPECT_EQ(nullptr, registry.acquire(std::chrono::milliseconds(50)));
	EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(45));
}

TEST(executor_registry, states)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));

	executor_state state;
	ASSERT_TRUE(registry.get_state("w1", state));
	EXPECT_EQ(executor_state::IDLE, state);

	auto exec = registry.acquire(no_wait);
	ASSERT_TRUE(registry.get_state("w1", state));
	EXPECT_EQ(executor_state::BUSY, state);
	EXPECT_EQ(0u, registry.get_idle_count());
	EXPECT_EQ(1u, registry.get_executor_count());

	EXPECT_FALSE(registry.get_state("nobody", state));
}

TEST(executor_registry, release_is_idempotent)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));

	// an idle executor is not released twice into the pool
	EXPECT_FALSE(registry.release("w1"));
	EXPECT_EQ(1u, registry.get_idle_count());

	registry.acquire(no_wait);
	EXPECT_TRUE(registry.release("w1"));
	EXPECT_FALSE(registry.release("w1"));
	EXPECT_EQ(1u, registry.get_idle_count());

	EXPECT_FALSE(registry.release("unknown"));
}

TEST(executor_registry, evicted_idle_executor_is_never_selected)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));
	registry.add_executor(make_executor("w2"));

	EXPECT_EQ(nullptr, registry.evict("w1"));
	EXPECT_EQ(nullptr, registry.find_executor("w1"));

	EXPECT_EQ("w2", registry.acquire(no_wait)->id);
	EXPECT_EQ(nullptr, registry.acquire(no_wait));
}

TEST(executor_registry, evicting_busy_executor_returns_its_task)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));

	auto exec = registry.acquire(no_wait);
	auto work = make_task("t1");
	ASSERT_TRUE(registry.assign(exec, work));
	EXPECT_EQ(work, registry.get_current_task("w1"));

	EXPECT_EQ(work, registry.evict("w1"));
	EXPECT_EQ(0u, registry.get_executor_count());
	EXPECT_FALSE(registry.release("w1"));
}

TEST(executor_registry, release_clears_current_task)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));

	auto exec = registry.acquire(no_wait);
	registry.assign(exec, make_task("t1"));
	registry.release("w1");

	EXPECT_EQ(nullptr, registry.get_current_task("w1"));
	EXPECT_EQ(nullptr, registry.evict("w1"));
}

TEST(executor_registry, assign_after_eviction_fails)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));

	auto exec = registry.acquire(no_wait);
	registry.evict("w1");
	EXPECT_FALSE(registry.assign(exec, make_task("t1")));

	// a new executor with the same id is a different executor
	registry.add_executor(make_executor("w1"));
	EXPECT_FALSE(registry.assign(exec, make_task("t1")));
}

TEST(executor_registry, duplicate_id_is_rejected)
{
	executor_registry registry;
	auto original = make_executor("w1");

	EXPECT_TRUE(registry.add_executor(original));
	EXPECT_FALSE(registry.add_executor(make_executor("w1")));

	EXPECT_EQ(original, registry.find_executor("w1"));
	EXPECT_EQ(1u, registry.get_idle_count());
}

TEST(executor_registry, release_wakes_waiting_acquire)
{
	executor_registry registry;
	registry.add_executor(make_executor("w1"));
	registry.acquire(no_wait);

	executor_registry::executor_ptr acquired;
	std::thread waiter([&registry, &acquired]() { acquired = registry.acquire(std::chrono::milliseconds(5000)); });

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	registry.release("w1");
	waiter.join();

	ASSERT_NE(nullptr, acquired);
	EXPECT_EQ("w1", acquired->id);
}

TEST(executor_registry, close_wakes_waiting_acquire)
{
	executor_registry registry;

	executor_registry::executor_ptr acquired = make_executor("placeholder");
	auto start = std::chrono::steady_clock::now();
	std::thread waiter([&registry, &acquired]() { acquired = registry.acquire(std::chrono::milliseconds(5000)); });

	std::this_thread::sleep_for(std::chrono::milliseconds(50));
	registry.close();
	waiter.join();

	EXPECT_EQ(nullptr, acquired);
	EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(4000));
}
