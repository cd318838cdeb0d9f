#ifndef INSTRUCTION_HPP
#define INSTRUCTION_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

namespace sigil {

enum class OpKind {
	PUSH,
	COMBINE,
	TRANSFER_TO_QUEUE,
	TRANSFER_FROM_QUEUE,
	DUPLICATE_SPREAD,
	JUMP_IF_NONPOSITIVE,
	JUMP_ALWAYS,
	OUTPUT_NUMBER,
	OUTPUT_CHAR,
	INPUT_NUMBER,
	INPUT_CHAR,
	TERMINATE,
};

// operator applied by OpKind::COMBINE
enum class Arith {
	ADD,
	SUB,
	MUL,
	DIV,
};

struct Instruction {
	OpKind opcode;
	std::size_t span {0};
	std::uint64_t magnitude {0};
	Arith arith {Arith::ADD};
	// where the decoder found it, only used for diagnostics
	std::size_t origin {0};
};

struct Program {
	Program& emit(OpKind, std::size_t span = 0, std::uint64_t magnitude = 0);
	Program& emit_combine(Arith, std::size_t span);
	Program& with_origin(std::size_t origin);
	void add_label(std::string name);

	std::size_t size() const { return m_vec.size(); }
	bool empty() const { return m_vec.empty(); }
	const Instruction& at(std::size_t index) const { return m_vec.at(index); }

	std::vector<Instruction>::const_iterator begin() const { return m_vec.begin(); }
	std::vector<Instruction>::const_iterator end() const { return m_vec.end(); }

	std::vector<Instruction> m_vec;
	// instruction index -> label names, only kept for listings
	std::multimap<std::size_t, std::string> labels;
};

// return textual representation of opcode, as used by listings
const char* opkind_repr(OpKind op);
const char* arith_repr(Arith arith);
const char* mnemonic(const Instruction& inst);

// how many of span/magnitude the listing spells out
std::size_t mnemonic_operand_count(OpKind op);

void print_program(FILE*, const Program&);
int print_inst(FILE*, const Instruction& inst);

} // namespace sigil

#endif
