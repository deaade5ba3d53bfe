#include "pending_ledger.h"

#include <functional>
#include <stdexcept>

const std::size_t pending_ledger::DEFAULT_SHARDS;

pending_ledger::pending_ledger(std::size_t shard_count)
{
	if (shard_count == 0) {
		throw std::invalid_argument("The pending ledger needs at least one shard");
	}

	for (std::size_t i = 0; i < shard_count; ++i) {
		shards_.push_back(std::make_unique<shard>());
	}
}

pending_ledger::shard &pending_ledger::get_shard(const std::string &task_id) const
{
	return *shards_[std::hash<std::string>()(task_id) % shards_.size()];
}

bool pending_ledger::put(const std::string &task_id, const connection_handle &producer)
{
	shard &s = get_shard(task_id);
	std::lock_guard<std::mutex> lock(s.mutex);

	return s.entries.emplace(task_id, producer).second;
}

bool pending_ledger::take(const std::string &task_id, connection_handle &producer)
{
	shard &s = get_shard(task_id);
	std::lock_guard<std::mutex> lock(s.mutex);

	auto it = s.entries.find(task_id);

	if (it == std::end(s.entries)) {
		return false;
	}

	producer = it->second;
	s.entries.erase(it);
	return true;
}

bool pending_ledger::take_if_owned(const std::string &task_id, const connection_handle &owner)
{
	shard &s = get_shard(task_id);
	std::lock_guard<std::mutex> lock(s.mutex);

	auto it = s.entries.find(task_id);

	if (it == std::end(s.entries) || it->second != owner) {
		return false;
	}

	s.entries.erase(it);
	return true;
}

bool pending_ledger::drop(const std::string &task_id)
{
	shard &s = get_shard(task_id);
	std::lock_guard<std::mutex> lock(s.mutex);

	return s.entries.erase(task_id) > 0;
}

bool pending_ledger::is_owned_by(const std::string &task_id, const connection_handle &producer) const
{
	shard &s = get_shard(task_id);
	std::lock_guard<std::mutex> lock(s.mutex);

	auto it = s.entries.find(task_id);
	return it != std::end(s.entries) && it->second == producer;
}

std::vector<std::string> pending_ledger::drop_all(const connection_handle &producer)
{
	std::vector<std::string> removed;

	for (auto &s : shards_) {
		std::lock_guard<std::mutex> lock(s->mutex);

		for (auto it = std::begin(s->entries); it != std::end(s->entries);) {
			if (it->second == producer) {
				removed.push_back(it->first);
				it = s->entries.erase(it);
			} else {
				++it;
			}
		}
	}

	return removed;
}

std::size_t pending_ledger::size() const
{
	std::size_t result = 0;

	for (auto &s : shards_) {
		std::lock_guard<std::mutex> lock(s->mutex);
		result += s->entries.size();
	}

	return result;
}

std::size_t pending_ledger::get_shard_count() const
{
	return shards_.size();
}
