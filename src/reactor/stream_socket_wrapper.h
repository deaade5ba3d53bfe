#ifndef TASKBROKER_REACTOR_STREAM_SOCKET_WRAPPER_H
#define TASKBROKER_REACTOR_STREAM_SOCKET_WRAPPER_H

#include <map>
#include <set>
#include <zmq.hpp>

#include "../helpers/line_buffer.h"
#include "socket_wrapper_base.h"

/**
 * Wraps a ZeroMQ stream socket, i.e. plain TCP connections identified by routing ids.
 *
 * Received messages carry the routing id of the connection in the identity field and one of these frame layouts:
 *   - {FRAME_CONNECTED} - a new connection was accepted
 *   - {FRAME_DISCONNECTED} - the peer went away
 *   - {FRAME_LINES, line...} - complete lines (possibly none) received on the connection
 *   - {FRAME_OVERFLOW, line...} - a line exceeding the length limit was discarded, complete lines may follow
 *
 * Sent messages are written as one line per frame. A message without frames closes the connection.
 */
class stream_socket_wrapper : public socket_wrapper_base
{
public:
	/** Leading frame of a connection notification */
	static const std::string FRAME_CONNECTED;

	/** Leading frame of a disconnection notification */
	static const std::string FRAME_DISCONNECTED;

	/** Leading frame of a batch of received lines */
	static const std::string FRAME_LINES;

	/** Leading frame of a batch of lines in which an overlong line was dropped */
	static const std::string FRAME_OVERFLOW;

	/**
	 * @param context a ZeroMQ context
	 * @param addr address used by the socket
	 * @param bound true if the socket should bind, false if it connects
	 * @param max_line_length longest accepted line
	 */
	stream_socket_wrapper(std::shared_ptr<zmq::context_t> context,
		const std::string &addr,
		const bool bound,
		std::size_t max_line_length = 65536);

	~stream_socket_wrapper() override = default;

	bool send_message(const message_container &message) override;

	bool receive_message(message_container &target) override;

private:
	/** Partial lines of all open connections */
	std::map<std::string, helpers::line_buffer> peers_;

	/** Connections we closed, whose disconnection notification may still arrive */
	std::set<std::string> closed_;

	/** Length limit handed to line buffers */
	std::size_t max_line_length_;
};

#endif // TASKBROKER_REACTOR_STREAM_SOCKET_WRAPPER_H
