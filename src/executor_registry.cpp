#include "executor_registry.h"

#include <algorithm>


executor_registry::executor_registry()
{
}

void executor_registry::remove_idle(const executor_ptr &exec)
{
	auto it = std::find(std::begin(idle_), std::end(idle_), exec);

	if (it != std::end(idle_)) {
		idle_.erase(it);
	}
}

bool executor_registry::add_executor(executor_ptr exec)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (executors_.find(exec->id) != std::end(executors_)) {
			return false;
		}

		executors_.emplace(exec->id, entry{exec, executor_state::IDLE, nullptr});
		idle_.push_back(exec);
	}

	idle_changed_.notify_one();
	return true;
}

executor_registry::executor_ptr executor_registry::acquire(std::chrono::milliseconds timeout)
{
	std::unique_lock<std::mutex> lock(mutex_);

	if (!idle_changed_.wait_for(lock, timeout, [this] { return closed_ || !idle_.empty(); })) {
		return nullptr;
	}

	if (closed_) {
		return nullptr;
	}

	executor_ptr exec = idle_.front();
	idle_.pop_front();
	executors_.at(exec->id).state = executor_state::BUSY;

	return exec;
}

bool executor_registry::assign(executor_ptr exec, task_ptr work)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = executors_.find(exec->id);

	// the executor could have been evicted (and maybe replaced by a new one with the same id)
	if (it == std::end(executors_) || it->second.exec != exec || it->second.state != executor_state::BUSY) {
		return false;
	}

	it->second.current_task = work;
	return true;
}

bool executor_registry::release(const std::string &id)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);

		auto it = executors_.find(id);

		if (it == std::end(executors_) || it->second.state != executor_state::BUSY) {
			return false;
		}

		it->second.state = executor_state::IDLE;
		it->second.current_task = nullptr;
		idle_.push_back(it->second.exec);
	}

	idle_changed_.notify_one();
	return true;
}

task_ptr executor_registry::evict(const std::string &id)
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = executors_.find(id);

	if (it == std::end(executors_)) {
		return nullptr;
	}

	task_ptr held = it->second.current_task;
	remove_idle(it->second.exec);
	executors_.erase(it);

	return held;
}

executor_registry::executor_ptr executor_registry::find_executor(const std::string &id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = executors_.find(id);
	return it != std::end(executors_) ? it->second.exec : nullptr;
}

bool executor_registry::get_state(const std::string &id, executor_state &state) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = executors_.find(id);

	if (it == std::end(executors_)) {
		return false;
	}

	state = it->second.state;
	return true;
}

task_ptr executor_registry::get_current_task(const std::string &id) const
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto it = executors_.find(id);
	return it != std::end(executors_) ? it->second.current_task : nullptr;
}

std::size_t executor_registry::get_executor_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return executors_.size();
}

std::size_t executor_registry::get_idle_count() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return idle_.size();
}

void executor_registry::close()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		closed_ = true;
	}

	idle_changed_.notify_all();
}
