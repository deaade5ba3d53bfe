#include "line_buffer.h"

helpers::line_buffer::line_buffer(std::size_t max_line_length) : max_line_length_(max_line_length)
{
}

bool helpers::line_buffer::append(const char *data, std::size_t size, std::vector<std::string> &lines)
{
	bool within_limit = true;
	pending_.append(data, size);

	std::size_t start = 0;
	while (true) {
		std::size_t end = pending_.find('\n', start);
		if (end == std::string::npos) {
			break;
		}

		std::size_t length = end - start;
		if (length > 0 && pending_[end - 1] == '\r') {
			--length;
		}

		if (skipping_) {
			// terminator of a line whose beginning was already thrown away
			skipping_ = false;
		} else if (length > max_line_length_) {
			within_limit = false;
		} else {
			lines.emplace_back(pending_, start, length);
		}

		start = end + 1;
	}

	pending_.erase(0, start);

	if (pending_.size() > max_line_length_) {
		pending_.clear();
		if (!skipping_) {
			within_limit = false;
		}
		skipping_ = true;
	}

	return within_limit;
}

std::size_t helpers::line_buffer::get_pending_size() const
{
	return pending_.size();
}

void helpers::line_buffer::clear()
{
	pending_.clear();
	skipping_ = false;
}
