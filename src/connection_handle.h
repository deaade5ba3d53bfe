#ifndef TASKBROKER_CONNECTION_HANDLE_H
#define TASKBROKER_CONNECTION_HANDLE_H

#include <string>

#include "reactor/message_container.h"

/**
 * Opaque reference to one peer connection of the broker.
 * It does not own the underlying socket (the reactor does), it only knows how to address the connection:
 * the name of the reactor socket (channel) and the routing id of the peer on it.
 * Writing is done by passing the produced messages to a reactor response callback.
 */
class connection_handle
{
public:
	/** An empty handle which does not address anything */
	connection_handle() = default;

	/**
	 * @param channel reactor key of the socket the connection belongs to
	 * @param peer routing id of the connection
	 */
	connection_handle(const std::string &channel, const std::string &peer);

	/**
	 * Get the reactor key of the socket the connection belongs to.
	 */
	const std::string &get_channel() const;

	/**
	 * Get the routing id of the connection.
	 */
	const std::string &get_peer() const;

	/**
	 * Build a message writing one protocol line to the connection.
	 * @param line line without terminator
	 * @return message for a reactor response callback
	 */
	message_container line_message(const std::string &line) const;

	/**
	 * Build a message that closes the connection.
	 * @return message for a reactor response callback
	 */
	message_container close_message() const;

	/**
	 * Get a printable description of the connection for logging.
	 */
	std::string get_description() const;

	/** Handles are equal when they address the same connection */
	bool operator==(const connection_handle &other) const;

	/** Negation of operator== */
	bool operator!=(const connection_handle &other) const;

	/** Ordering for use in maps */
	bool operator<(const connection_handle &other) const;

private:
	/** Reactor key of the socket */
	std::string channel_;

	/** Routing id of the peer */
	std::string peer_;
};

#endif // TASKBROKER_CONNECTION_HANDLE_H
