#ifndef TASKBROKER_PEERS_LINE_CLIENT_H
#define TASKBROKER_PEERS_LINE_CLIENT_H

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <zmq.hpp>

#include "../helpers/line_buffer.h"

/**
 * Blocking line-oriented TCP client built on a connecting ZeroMQ STREAM socket.
 * Used by the peer tools and by the end-to-end tests to talk to the broker like any plain TCP peer would.
 */
class line_client
{
public:
	/**
	 * @param context ZeroMQ context
	 * @param endpoint address of the broker, e.g. tcp://127.0.0.1:8888
	 * @param max_line_length longest line accepted from the broker
	 */
	line_client(std::shared_ptr<zmq::context_t> context,
		const std::string &endpoint,
		std::size_t max_line_length = 65536);

	/** Closes the connection if still open */
	~line_client();

	/**
	 * Connect to the endpoint and wait until the connection is established.
	 * @param timeout how long to wait
	 * @return true when connected
	 */
	bool connect(std::chrono::milliseconds timeout);

	/**
	 * Write one line, the terminator is appended.
	 * @return false when not connected or the write failed
	 */
	bool send_line(const std::string &line);

	/**
	 * Wait for the next complete line.
	 * @param line output parameter, the line without terminator
	 * @param timeout how long to wait
	 * @return false on timeout or when the connection was closed
	 */
	bool receive_line(std::string &line, std::chrono::milliseconds timeout);

	/** Number of overlong lines dropped so far */
	std::size_t get_discarded_count() const;

	/** Whether the connection is up */
	bool is_connected() const;

	/** Close the connection */
	void close();

private:
	zmq::socket_t socket_;
	std::string endpoint_;
	/** Routing id of the connection, known after the connection notification */
	std::string peer_;
	bool connected_ = false;
	helpers::line_buffer buffer_;
	/** Received lines not yet returned */
	std::deque<std::string> lines_;
	std::size_t discarded_ = 0;

	/**
	 * Wait for one message from the socket (at most for the timeout) and process it.
	 */
	void poll_socket(std::chrono::milliseconds timeout);
};

#endif // TASKBROKER_PEERS_LINE_CLIENT_H
