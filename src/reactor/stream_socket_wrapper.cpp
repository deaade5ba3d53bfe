#include "stream_socket_wrapper.h"
#include "../protocol/wire_codec.h"

const std::string stream_socket_wrapper::FRAME_CONNECTED = "connected";
const std::string stream_socket_wrapper::FRAME_DISCONNECTED = "disconnected";
const std::string stream_socket_wrapper::FRAME_LINES = "lines";
const std::string stream_socket_wrapper::FRAME_OVERFLOW = "overflow";

stream_socket_wrapper::stream_socket_wrapper(
	std::shared_ptr<zmq::context_t> context, const std::string &addr, const bool bound, std::size_t max_line_length)
	: socket_wrapper_base(context, zmq::socket_type::stream, addr, bound), max_line_length_(max_line_length)
{
}

bool stream_socket_wrapper::send_message(const message_container &source)
{
	std::string body;
	for (auto &line : source.data) {
		body += line;
		body += wire_codec::LINE_DELIMITER;
	}

	try {
		// an unknown routing id fails right here with EHOSTUNREACH
		if (socket_.send(source.identity.data(), source.identity.size(), ZMQ_SNDMORE) != source.identity.size()) {
			return false;
		}

		// an empty body makes ZeroMQ close the connection
		socket_.send(body.data(), body.size(), 0);
	} catch (const zmq::error_t &) {
		return false;
	}

	if (source.data.empty()) {
		peers_.erase(source.identity);
		closed_.insert(source.identity);
	}

	return true;
}

bool stream_socket_wrapper::receive_message(message_container &target)
{
	zmq::message_t msg;
	target.data.clear();

	try {
		socket_.recv(&msg, 0);
		target.identity = std::string(static_cast<char *>(msg.data()), msg.size());

		if (!msg.more()) {
			return false;
		}

		socket_.recv(&msg, 0);
	} catch (const zmq::error_t &) {
		return false;
	}

	// zero-length payloads are connection notifications
	if (msg.size() == 0) {
		if (peers_.erase(target.identity) > 0 || closed_.erase(target.identity) > 0) {
			target.data.push_back(FRAME_DISCONNECTED);
		} else {
			peers_.emplace(target.identity, helpers::line_buffer(max_line_length_));
			target.data.push_back(FRAME_CONNECTED);
		}

		return true;
	}

	if (closed_.count(target.identity) > 0) {
		// leftovers from a connection we already closed
		target.data.push_back(FRAME_LINES);
		return true;
	}

	auto it = peers_.find(target.identity);
	if (it == peers_.end()) {
		it = peers_.emplace(target.identity, helpers::line_buffer(max_line_length_)).first;
	}

	std::vector<std::string> lines;
	bool within_limit = it->second.append(static_cast<char *>(msg.data()), msg.size(), lines);

	target.data.push_back(within_limit ? FRAME_LINES : FRAME_OVERFLOW);
	target.data.insert(target.data.end(), lines.begin(), lines.end());

	return true;
}
