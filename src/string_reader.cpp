#include "string_reader.hpp"

#include <utility>

namespace sigil {

StringReader::StringReader(std::string string, std::string path)
: m_string {std::move(string)}, m_path {std::move(path)}, m_cursor {0} {}

std::string StringReader::get_path() const { return m_path; }

bool StringReader::at_eof() const { return m_cursor >= m_string.size(); }

std::size_t StringReader::read_at_most(char* buffer, std::size_t limit) {
	std::size_t read = 0;
	while (read < limit and not at_eof()) {
		buffer[read++] = m_string[m_cursor++];
	}
	return read;
}

} // namespace sigil
