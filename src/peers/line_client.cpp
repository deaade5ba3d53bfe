#include "line_client.h"
#include "../protocol/wire_codec.h"

#include <vector>

line_client::line_client(
	std::shared_ptr<zmq::context_t> context, const std::string &endpoint, std::size_t max_line_length)
	: socket_(*context, zmq::socket_type::stream), endpoint_(endpoint), buffer_(max_line_length)
{
	socket_.setsockopt(ZMQ_LINGER, 0);
}

line_client::~line_client()
{
	close();
}

bool line_client::connect(std::chrono::milliseconds timeout)
{
	socket_.connect(endpoint_);

	auto deadline = std::chrono::steady_clock::now() + timeout;

	while (!connected_) {
		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			socket_.disconnect(endpoint_);
			return false;
		}

		poll_socket(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
	}

	return true;
}

bool line_client::send_line(const std::string &line)
{
	if (!connected_) {
		return false;
	}

	std::string body = line + wire_codec::LINE_DELIMITER;

	try {
		socket_.send(peer_.data(), peer_.size(), ZMQ_SNDMORE);
		socket_.send(body.data(), body.size(), 0);
	} catch (const zmq::error_t &) {
		connected_ = false;
		return false;
	}

	return true;
}

bool line_client::receive_line(std::string &line, std::chrono::milliseconds timeout)
{
	auto deadline = std::chrono::steady_clock::now() + timeout;

	while (lines_.empty()) {
		if (!connected_) {
			return false;
		}

		auto now = std::chrono::steady_clock::now();
		if (now >= deadline) {
			return false;
		}

		poll_socket(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
	}

	line = lines_.front();
	lines_.pop_front();
	return true;
}

std::size_t line_client::get_discarded_count() const
{
	return discarded_;
}

bool line_client::is_connected() const
{
	return connected_;
}

void line_client::close()
{
	if (!connected_) {
		return;
	}

	connected_ = false;

	try {
		// an empty payload closes the connection
		socket_.send(peer_.data(), peer_.size(), ZMQ_SNDMORE);
		socket_.send("", 0, 0);
	} catch (const zmq::error_t &) {
		// the connection is already gone
	}
}

void line_client::poll_socket(std::chrono::milliseconds timeout)
{
	std::vector<zmq_pollitem_t> items = {zmq_pollitem_t{static_cast<void *>(socket_), 0, ZMQ_POLLIN, 0}};
	zmq::poll(items, timeout);

	if (!(items.front().revents & ZMQ_POLLIN)) {
		return;
	}

	zmq::message_t identity;
	zmq::message_t payload;
	socket_.recv(&identity, 0);

	if (!identity.more()) {
		return;
	}

	socket_.recv(&payload, 0);
	std::string id(static_cast<char *>(identity.data()), identity.size());

	if (payload.size() == 0) {
		// connection notifications, the first one is the connect, every later one a disconnect
		if (!connected_ && peer_.empty()) {
			peer_ = id;
			connected_ = true;
		} else {
			connected_ = false;
		}
		return;
	}

	std::vector<std::string> lines;
	if (!buffer_.append(static_cast<char *>(payload.data()), payload.size(), lines)) {
		++discarded_;
	}
	lines_.insert(lines_.end(), lines.begin(), lines.end());
}
