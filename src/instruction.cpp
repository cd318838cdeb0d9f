#include "instruction.hpp"

#include <utility>

namespace sigil {

Program& Program::emit(OpKind opcode, std::size_t span, std::uint64_t magnitude) {
	m_vec.push_back(Instruction {opcode, span, magnitude, Arith::ADD, m_vec.size()});
	return *this;
}

Program& Program::emit_combine(Arith arith, std::size_t span) {
	m_vec.push_back(Instruction {OpKind::COMBINE, span, 0, arith, m_vec.size()});
	return *this;
}

Program& Program::with_origin(std::size_t origin) {
	m_vec.back().origin = origin;
	return *this;
}

void Program::add_label(std::string name) {
	labels.emplace(m_vec.size(), std::move(name));
}

const char* opkind_repr(OpKind op) {
	switch (op) {
		case OpKind::PUSH: return "PUSH";
		case OpKind::COMBINE: return "COMBINE";
		case OpKind::TRANSFER_TO_QUEUE: return "TRANSFER_TO_QUEUE";
		case OpKind::TRANSFER_FROM_QUEUE: return "TRANSFER_FROM_QUEUE";
		case OpKind::DUPLICATE_SPREAD: return "DUPLICATE_SPREAD";
		case OpKind::JUMP_IF_NONPOSITIVE: return "JUMP_IF_NONPOSITIVE";
		case OpKind::JUMP_ALWAYS: return "JUMP_ALWAYS";
		case OpKind::OUTPUT_NUMBER: return "OUTPUT_NUMBER";
		case OpKind::OUTPUT_CHAR: return "OUTPUT_CHAR";
		case OpKind::INPUT_NUMBER: return "INPUT_NUMBER";
		case OpKind::INPUT_CHAR: return "INPUT_CHAR";
		case OpKind::TERMINATE: return "TERMINATE";
	}
	std::unreachable();
}

const char* arith_repr(Arith arith) {
	switch (arith) {
		case Arith::ADD: return "add";
		case Arith::SUB: return "sub";
		case Arith::MUL: return "mul";
		case Arith::DIV: return "div";
	}
	std::unreachable();
}

const char* mnemonic(const Instruction& inst) {
	switch (inst.opcode) {
		case OpKind::PUSH: return "push";
		case OpKind::COMBINE: return arith_repr(inst.arith);
		case OpKind::TRANSFER_TO_QUEUE: return "enqueue";
		case OpKind::TRANSFER_FROM_QUEUE: return "dequeue";
		case OpKind::DUPLICATE_SPREAD: return "spread";
		case OpKind::JUMP_IF_NONPOSITIVE: return "jle";
		case OpKind::JUMP_ALWAYS: return "jmp";
		case OpKind::OUTPUT_NUMBER: return "putn";
		case OpKind::OUTPUT_CHAR: return "putc";
		case OpKind::INPUT_NUMBER: return "getn";
		case OpKind::INPUT_CHAR: return "getc";
		case OpKind::TERMINATE: return "halt";
	}
	std::unreachable();
}

std::size_t mnemonic_operand_count(OpKind op) {
	switch (op) {
		case OpKind::PUSH: return 2;
		case OpKind::COMBINE: return 1;
		case OpKind::TRANSFER_TO_QUEUE: return 1;
		case OpKind::TRANSFER_FROM_QUEUE: return 1;
		case OpKind::DUPLICATE_SPREAD: return 1;
		case OpKind::JUMP_IF_NONPOSITIVE: return 2;
		case OpKind::JUMP_ALWAYS: return 1;
		case OpKind::OUTPUT_NUMBER: return 1;
		case OpKind::OUTPUT_CHAR: return 1;
		case OpKind::INPUT_NUMBER: return 1;
		case OpKind::INPUT_CHAR: return 1;
		case OpKind::TERMINATE: return 0;
	}
	std::unreachable();
}

int print_inst(FILE* fd, const Instruction& inst) {
	int printed = fprintf(fd, "\t%-7s", mnemonic(inst));
	switch (inst.opcode) {
		case OpKind::JUMP_ALWAYS:
			printed += fprintf(fd, " %llu", (unsigned long long)inst.magnitude);
			break;
		case OpKind::TERMINATE: break;
		case OpKind::PUSH:
		case OpKind::JUMP_IF_NONPOSITIVE:
			printed += fprintf(
				fd, " %zu %llu", inst.span, (unsigned long long)inst.magnitude
			);
			break;
		default: printed += fprintf(fd, " %zu", inst.span); break;
	}
	return printed;
}

void print_program(FILE* fd, const Program& program) {
	int max = 0;
	std::size_t i = 0;
	for (const auto& inst : program) {
		auto labels = program.labels.equal_range(i);
		for (auto it = labels.first; it != labels.second; it++)
			fprintf(fd, "%s:\n", it->second.c_str());
		int printed = print_inst(fd, inst);
		if (printed > max) max = printed;
		for (int pad = 0; pad < (max - printed); pad++) fputc(' ', fd);
		fprintf(fd, "  ; %04zu line %zu\n", i, inst.origin);
		i++;
	}
	auto labels = program.labels.equal_range(i);
	for (auto it = labels.first; it != labels.second; it++)
		fprintf(fd, "%s:\n", it->second.c_str());
}

} // namespace sigil
