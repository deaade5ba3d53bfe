#ifndef TASKBROKER_HELPERS_LINE_BUFFER_H
#define TASKBROKER_HELPERS_LINE_BUFFER_H

#include <string>
#include <vector>

namespace helpers
{
	/**
	 * Accumulates chunks of a byte stream and cuts them into lines.
	 * Both "\n" and "\r\n" terminate a line, terminators are not part of the produced lines.
	 */
	class line_buffer
	{
	public:
		/**
		 * @param max_line_length longest line (without terminator) that is accepted
		 */
		explicit line_buffer(std::size_t max_line_length = 65536);

		/**
		 * Append a chunk of data and extract all lines completed by it.
		 * Lines longer than the limit are discarded, as is an unterminated remainder that already exceeds it.
		 * @param data pointer to the chunk
		 * @param size length of the chunk
		 * @param lines completed lines are appended here
		 * @return false if anything was discarded because of the length limit
		 */
		bool append(const char *data, std::size_t size, std::vector<std::string> &lines);

		/**
		 * Get the amount of buffered bytes which do not form a complete line yet.
		 */
		std::size_t get_pending_size() const;

		/**
		 * Forget the unterminated remainder.
		 */
		void clear();

	private:
		/** Unterminated remainder of the stream */
		std::string pending_;

		/** Length limit for a single line */
		std::size_t max_line_length_;

		/** True while the rest of an overlong line is being skipped */
		bool skipping_ = false;
	};
}

#endif // TASKBROKER_HELPERS_LINE_BUFFER_H
