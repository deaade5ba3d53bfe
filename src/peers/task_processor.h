#ifndef TASKBROKER_PEERS_TASK_PROCESSOR_H
#define TASKBROKER_PEERS_TASK_PROCESSOR_H

#include <string>

/**
 * Computes the result of a task on the executor side.
 */
class task_processor
{
public:
	/** Destructor */
	virtual ~task_processor() = default;

	/**
	 * Process the payload of one task. Must not throw, failures are reported in the result.
	 * @param payload task data as received from the broker
	 * @return the result line sent back to the broker
	 */
	virtual std::string process(const std::string &payload) = 0;
};

/**
 * Sums a comma-separated list of integers, e.g. "1,2,3,4,5" gives "15".
 * Malformed input gives "ERROR: <reason>".
 */
class sum_processor : public task_processor
{
public:
	std::string process(const std::string &payload) override;
};

#endif // TASKBROKER_PEERS_TASK_PROCESSOR_H
