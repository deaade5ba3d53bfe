#ifndef TASKBROKER_REACTOR_HANDLER_INTERFACE_H
#define TASKBROKER_REACTOR_HANDLER_INTERFACE_H

#include <functional>

#include "message_container.h"

/**
 * An interface for reactor event handlers.
 */
class handler_interface
{
public:
	/** Destructor */
	virtual ~handler_interface() = default;

	/**
	 * Type of the callback function passed to the handler by the reactor.
	 * Messages passed to it are written to the socket named by their key, or delivered to the handlers subscribed
	 * to the key if there is no such socket. The callback may only be used from the thread the handler was called in.
	 */
	using response_cb = std::function<void(const message_container &)>;

	/**
	 * Process a message the handler is subscribed to
	 * @param message message to be processed
	 * @param respond callback that enables the handler to respond
	 */
	virtual void on_request(const message_container &message, const response_cb &respond) = 0;
};

#endif // TASKBROKER_REACTOR_HANDLER_INTERFACE_H
