#ifndef SIGIL_STREAM_PORT_HPP
#define SIGIL_STREAM_PORT_HPP

#include <istream>
#include <ostream>

#include "port.hpp"

namespace sigil {

// UTF-8 port over a pair of standard streams
struct StreamPort : Port {
	StreamPort(std::istream& input, std::ostream& output)
	: input {input}, output {output} {}

	std::istream& input;
	std::ostream& output;

	std::optional<std::string> read_number() override;
	std::optional<std::uint32_t> read_codepoint() override;

	void write_text(const std::string& text) override;
	void write_codepoint(std::uint32_t codepoint) override;
};

// appends the UTF-8 encoding of codepoint to out
void encode_utf8(std::uint32_t codepoint, std::string& out);

} // namespace sigil

#endif
