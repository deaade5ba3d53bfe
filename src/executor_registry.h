#ifndef TASKBROKER_EXECUTOR_REGISTRY_H
#define TASKBROKER_EXECUTOR_REGISTRY_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "executor.h"
#include "task.h"

/**
 * Service that stores information about registered executors and hands idle ones out in round-robin order.
 * All methods are safe to call from multiple threads. An executor selected by @ref acquire is BUSY and stays out
 * of the idle pool until it is released or evicted.
 */
class executor_registry
{
public:
	/** Pointer to executor instance type. */
	typedef std::shared_ptr<const executor> executor_ptr;

private:
	/** Bookkeeping for one registered executor */
	struct entry {
		executor_ptr exec;
		executor_state state;
		/** Task assigned to a BUSY executor, if any */
		task_ptr current_task;
	};

	/** Registered executors by their identifier */
	std::map<std::string, entry> executors_;

	/** Idle executors, the front is the one that has waited the longest */
	std::deque<executor_ptr> idle_;

	/** Guards all of the above */
	mutable std::mutex mutex_;

	/** Signalled when an executor becomes idle or the registry is closed */
	std::condition_variable idle_changed_;

	/** Set after close(), acquire never blocks again */
	bool closed_ = false;

	/** Remove the executor from the idle deque, caller holds the mutex */
	void remove_idle(const executor_ptr &exec);

public:
	/** Default constructor, initializes empty registry. */
	executor_registry();

	/** Virtual destructor for mocking */
	virtual ~executor_registry() = default;

	/**
	 * Register a new executor, it becomes IDLE and is put at the back of the pool.
	 * @param exec executor to be added
	 * @return false if an executor with the same id is already registered (nothing changes then)
	 */
	virtual bool add_executor(executor_ptr exec);

	/**
	 * Take the longest-waiting idle executor and mark it BUSY. Blocks until one is available.
	 * @param timeout how long to wait for an idle executor at most
	 * @return the executor, or nullptr after the timeout or when the registry is closed
	 */
	virtual executor_ptr acquire(std::chrono::milliseconds timeout);

	/**
	 * Remember the task held by an acquired executor.
	 * @param exec executor returned by acquire
	 * @param work the task it is being given
	 * @return false if the executor is no longer registered as BUSY (it was evicted meanwhile)
	 */
	virtual bool assign(executor_ptr exec, task_ptr work);

	/**
	 * Return a BUSY executor to the back of the idle pool and wake one waiter.
	 * @param id executor identifier
	 * @return true if the executor was BUSY, otherwise nothing changes
	 */
	virtual bool release(const std::string &id);

	/**
	 * Remove an executor from the registry, for example when its connection is lost.
	 * @param id executor identifier
	 * @return the task the executor was holding, nullptr if none (or the executor is unknown)
	 */
	virtual task_ptr evict(const std::string &id);

	/**
	 * Find executor by its unique identifier.
	 * @param id executor identifier
	 * @return the executor or @a nullptr
	 */
	virtual executor_ptr find_executor(const std::string &id) const;

	/**
	 * Get the state of an executor.
	 * @param id executor identifier
	 * @param state output parameter
	 * @return false if the executor is not registered
	 */
	virtual bool get_state(const std::string &id, executor_state &state) const;

	/**
	 * Get the task the executor currently holds.
	 * @param id executor identifier
	 * @return the task, nullptr if none
	 */
	virtual task_ptr get_current_task(const std::string &id) const;

	/** Number of registered executors */
	virtual std::size_t get_executor_count() const;

	/** Number of idle executors */
	virtual std::size_t get_idle_count() const;

	/**
	 * Wake all threads blocked in acquire, which then return nullptr. Used at shutdown.
	 */
	virtual void close();
};

#endif // TASKBROKER_EXECUTOR_REGISTRY_H
