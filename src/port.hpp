#ifndef SIGIL_PORT_HPP
#define SIGIL_PORT_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace sigil {

// Boundary through which a run reads and writes. An empty optional means
// end-of-input.
struct Port {
	virtual ~Port() {};

	virtual std::optional<std::string> read_number() = 0;
	virtual std::optional<std::uint32_t> read_codepoint() = 0;

	virtual void write_text(const std::string& text) = 0;
	virtual void write_codepoint(std::uint32_t codepoint) = 0;
};

} // namespace sigil

#endif
