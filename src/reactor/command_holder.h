#ifndef TASKBROKER_REACTOR_COMMAND_HOLDER_H
#define TASKBROKER_REACTOR_COMMAND_HOLDER_H

#include "../protocol/wire_codec.h"
#include "handler_interface.h"
#include <functional>
#include <map>
#include <string>


/**
 * Command holder.
 *
 * Maps tags of decoded protocol messages to callbacks. A session registers the message types it accepts in its
 * current state and lets the holder pick the right callback for each incoming line.
 */
class command_holder
{
public:
	/** Type of callback function for easier use. */
	typedef std::function<void(const wire_message &, const handler_interface::response_cb &)> callback_fn;

	/**
	 * Invoke registered callback for the tag of given message (if any).
	 * @param message decoded message, its tag selects the callback
	 * @param respond a callback to let the handler respond
	 * @return @a true if a callback was found and called, @a false otherwise
	 */
	bool call_function(const wire_message &message, const handler_interface::response_cb &respond) const;

	/**
	 * Register new command with a callback.
	 * @param tag message tag the callback reacts to
	 * @param callback Function to call when a message with this tag occurs.
	 * @return @a true if add successful, @a false if the tag was already registered
	 */
	bool register_command(const std::string &tag, callback_fn callback);

private:
	/** Container for <tag, callback> pairs with fast searching. */
	std::map<std::string, callback_fn> functions_;
};

#endif // TASKBROKER_REACTOR_COMMAND_HOLDER_H
