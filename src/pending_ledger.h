#ifndef TASKBROKER_PENDING_LEDGER_H
#define TASKBROKER_PENDING_LEDGER_H

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "connection_handle.h"

/**
 * Maps ids of tasks in flight to the producer connection that is waiting for their result.
 * The map is split into independently locked shards selected by a hash of the task id, so that producers and
 * executors touching different tasks do not contend. Every operation is atomic with respect to one task id.
 */
class pending_ledger
{
private:
	/** One independently locked part of the ledger */
	struct shard {
		std::mutex mutex;
		std::unordered_map<std::string, connection_handle> entries;
	};

	/** All shards, their count never changes */
	std::vector<std::unique_ptr<shard>> shards_;

	/** Select the shard responsible for the task id */
	shard &get_shard(const std::string &task_id) const;

public:
	/** Default number of shards */
	static const std::size_t DEFAULT_SHARDS = 16;

	/**
	 * @param shard_count number of shards
	 * @throws std::invalid_argument when shard_count is zero
	 */
	explicit pending_ledger(std::size_t shard_count = DEFAULT_SHARDS);

	virtual ~pending_ledger() = default;

	/**
	 * Record a pending task.
	 * @param task_id identifier of the task
	 * @param producer connection waiting for the result
	 * @return false if the id is already pending (the existing entry is kept)
	 */
	virtual bool put(const std::string &task_id, const connection_handle &producer);

	/**
	 * Atomically remove an entry and return its producer. Of several concurrent callers only one succeeds.
	 * @param task_id identifier of the task
	 * @param producer output parameter
	 * @return false if the id is not pending
	 */
	virtual bool take(const std::string &task_id, connection_handle &producer);

	/**
	 * Remove an entry only if it still belongs to the given producer.
	 * A task id reused by another producer after the original one went away is left alone.
	 * @param task_id identifier of the task
	 * @param owner expected producer
	 * @return true if the entry was removed
	 */
	virtual bool take_if_owned(const std::string &task_id, const connection_handle &owner);

	/**
	 * Remove an entry without looking at it.
	 * @param task_id identifier of the task
	 * @return true if there was such entry
	 */
	virtual bool drop(const std::string &task_id);

	/**
	 * Check that the task is still pending for the given producer.
	 * @param task_id identifier of the task
	 * @param producer expected owner
	 */
	virtual bool is_owned_by(const std::string &task_id, const connection_handle &producer) const;

	/**
	 * Remove all entries of a producer, used when its connection goes away.
	 * @param producer the connection
	 * @return ids of removed tasks
	 */
	virtual std::vector<std::string> drop_all(const connection_handle &producer);

	/** Total number of pending tasks */
	virtual std::size_t size() const;

	/** Number of shards */
	std::size_t get_shard_count() const;
};

#endif // TASKBROKER_PENDING_LEDGER_H
