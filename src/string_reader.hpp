#ifndef STRING_READER_HPP
#define STRING_READER_HPP

#include "reader.hpp"

namespace sigil {

struct StringReader : Reader {
	StringReader(std::string string, std::string path = "<string>");

	std::string get_path() const override;
	bool at_eof() const override;

	std::size_t read_at_most(char* buffer, std::size_t limit) override;

 private:
	std::string m_string;
	std::string m_path;
	std::size_t m_cursor;
};

} // namespace sigil

#endif
