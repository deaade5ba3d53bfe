#include "command_holder.h"

bool command_holder::call_function(const wire_message &message, const handler_interface::response_cb &respond) const
{
	auto it = functions_.find(message.tag);
	if (it == functions_.end()) {
		return false;
	}

	(it->second)(message, respond);
	return true;
}

bool command_holder::register_command(const std::string &tag, command_holder::callback_fn callback)
{
	auto ret = functions_.emplace(tag, callback);
	return ret.second;
}
