#include "connection_handle.h"
#include "helpers/string_to_hex.h"

connection_handle::connection_handle(const std::string &channel, const std::string &peer)
	: channel_(channel), peer_(peer)
{
}

const std::string &connection_handle::get_channel() const
{
	return channel_;
}

const std::string &connection_handle::get_peer() const
{
	return peer_;
}

message_container connection_handle::line_message(const std::string &line) const
{
	return message_container(channel_, peer_, {line});
}

message_container connection_handle::close_message() const
{
	return message_container(channel_, peer_, {});
}

std::string connection_handle::get_description() const
{
	return channel_ + "/" + helpers::string_to_hex(peer_);
}

bool connection_handle::operator==(const connection_handle &other) const
{
	return channel_ == other.channel_ && peer_ == other.peer_;
}

bool connection_handle::operator!=(const connection_handle &other) const
{
	return !((*this) == other);
}

bool connection_handle::operator<(const connection_handle &other) const
{
	return channel_ < other.channel_ || (channel_ == other.channel_ && peer_ < other.peer_);
}
