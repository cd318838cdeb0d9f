#include "reader.hpp"

namespace sigil {

std::string Reader::read_to_end() {
	std::string text {};
	char buffer[4096];
	while (not at_eof()) {
		std::size_t read = read_at_most(buffer, sizeof(buffer));
		if (read == 0) break;
		text.append(buffer, read);
	}
	return text;
}

} // namespace sigil
