// Loader for textual instruction listings

#ifndef SIGIL_ASSEMBLER_HPP
#define SIGIL_ASSEMBLER_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "instruction.hpp"
#include "location.hpp"
#include "reader.hpp"

namespace sigil {

struct AssemblyError : std::runtime_error {
	AssemblyError(Location loc, const std::string& message)
	: std::runtime_error {message}, loc {loc} {}

	Location loc;
};

struct Assembler {
	Assembler(Reader* reader);

	// throws AssemblyError on the first malformed line
	Program assemble();

	std::vector<std::string> get_lines() const { return m_lines; }

 private:
	struct Token {
		std::string_view text;
		Location loc;
	};

	// jump whose target names a label
	struct Fixup {
		std::size_t index;
		Token label;
	};

	std::vector<Token> tokenize(int line_no, std::string_view line) const;
	void assemble_line(int line_no, std::string_view line);
	void define_label(const Token& token);
	void emit_instruction(int line_no, const std::vector<Token>& tokens, std::size_t first);

	std::size_t parse_span(const Token& token) const;
	std::uint64_t parse_magnitude(const Token& token) const;
	std::uint64_t parse_target(const Token& token);

	Reader* m_reader;
	std::vector<std::string> m_lines {};
	Program m_program {};
	std::map<std::string, std::size_t, std::less<>> m_labels {};
	std::vector<Fixup> m_fixups {};
};

Program assemble(Reader* reader);

} // namespace sigil

#endif
