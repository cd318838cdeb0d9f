#ifndef READER_HPP
#define READER_HPP

#include <cstddef>
#include <string>

namespace sigil {

// Source of listing text
struct Reader {
	virtual ~Reader() {};

	virtual std::string get_path() const = 0;
	virtual bool at_eof() const = 0;

	virtual std::size_t read_at_most(char* buffer, std::size_t limit) = 0;

	// drains the reader
	std::string read_to_end();
};

} // namespace sigil

#endif
