#include "assembler.hpp"

#include <cctype>
#include <charconv>

namespace sigil {

namespace {

struct MnemonicEntry {
	const char* name;
	OpKind opcode;
	Arith arith;
};

// clang-format off
const MnemonicEntry MNEMONICS[] = {
	{"push",    OpKind::PUSH,                Arith::ADD},
	{"add",     OpKind::COMBINE,             Arith::ADD},
	{"sub",     OpKind::COMBINE,             Arith::SUB},
	{"mul",     OpKind::COMBINE,             Arith::MUL},
	{"div",     OpKind::COMBINE,             Arith::DIV},
	{"enqueue", OpKind::TRANSFER_TO_QUEUE,   Arith::ADD},
	{"dequeue", OpKind::TRANSFER_FROM_QUEUE, Arith::ADD},
	{"spread",  OpKind::DUPLICATE_SPREAD,    Arith::ADD},
	{"jle",     OpKind::JUMP_IF_NONPOSITIVE, Arith::ADD},
	{"jmp",     OpKind::JUMP_ALWAYS,         Arith::ADD},
	{"putn",    OpKind::OUTPUT_NUMBER,       Arith::ADD},
	{"putc",    OpKind::OUTPUT_CHAR,         Arith::ADD},
	{"getn",    OpKind::INPUT_NUMBER,        Arith::ADD},
	{"getc",    OpKind::INPUT_CHAR,          Arith::ADD},
	{"halt",    OpKind::TERMINATE,           Arith::ADD},
};
// clang-format on

const MnemonicEntry* find_mnemonic(std::string_view name) {
	for (const auto& entry : MNEMONICS)
		if (name == entry.name) return &entry;
	return nullptr;
}

bool is_label_start(char c) {
	return std::isalpha(static_cast<unsigned char>(c)) or c == '_';
}

bool is_label_char(char c) {
	return std::isalnum(static_cast<unsigned char>(c)) or c == '_' or c == '.';
}

bool is_label_name(std::string_view text) {
	if (text.empty() or not is_label_start(text[0])) return false;
	for (char c : text)
		if (not is_label_char(c)) return false;
	return true;
}

template<typename T>
bool parse_unsigned(std::string_view text, T& out) {
	if (text.empty() or not std::isdigit(static_cast<unsigned char>(text[0])))
		return false;
	const char* end = text.data() + text.size();
	auto [ptr, ec] = std::from_chars(text.data(), end, out);
	return ec == std::errc {} and ptr == end;
}

} // namespace

Assembler::Assembler(Reader* reader) : m_reader {reader} {}

Program Assembler::assemble() {
	std::string text = m_reader->read_to_end();
	std::size_t start = 0;
	while (start < text.size()) {
		auto newline = text.find('\n', start);
		if (newline == std::string::npos) newline = text.size();
		std::string line = text.substr(start, newline - start);
		if (not line.empty() and line.back() == '\r') line.pop_back();
		m_lines.push_back(std::move(line));
		start = newline + 1;
	}

	for (std::size_t i = 0; i < m_lines.size(); i++)
		assemble_line((int)i, m_lines[i]);

	for (const auto& fixup : m_fixups) {
		auto it = m_labels.find(fixup.label.text);
		if (it == m_labels.end())
			throw AssemblyError(
				fixup.label.loc, "undefined label `" + std::string(fixup.label.text) + "'"
			);
		m_program.m_vec[fixup.index].magnitude = it->second;
	}

	return std::move(m_program);
}

auto Assembler::tokenize(int line_no, std::string_view line) const
	-> std::vector<Token> {
	std::vector<Token> tokens {};
	std::size_t i = 0;
	while (i < line.size()) {
		if (line[i] == ';') break;
		if (std::isspace(static_cast<unsigned char>(line[i]))) {
			i++;
			continue;
		}
		std::size_t begin = i;
		while (i < line.size() and line[i] != ';'
		       and not std::isspace(static_cast<unsigned char>(line[i])))
			i++;
		Location loc {{line_no, (int)begin}, {line_no, (int)i - 1}};
		tokens.push_back(Token {line.substr(begin, i - begin), loc});
	}
	return tokens;
}

void Assembler::assemble_line(int line_no, std::string_view line) {
	auto tokens = tokenize(line_no, line);
	if (tokens.empty()) return;

	std::size_t first = 0;
	if (tokens[0].text.back() == ':') {
		define_label(tokens[0]);
		first = 1;
	}
	if (first < tokens.size()) emit_instruction(line_no, tokens, first);
}

void Assembler::define_label(const Token& token) {
	auto name = token.text.substr(0, token.text.size() - 1);
	if (not is_label_name(name))
		throw AssemblyError(token.loc, "invalid label name `" + std::string(name) + "'");
	if (m_labels.contains(name))
		throw AssemblyError(token.loc, "label `" + std::string(name) + "' defined twice");
	m_labels.emplace(std::string(name), m_program.size());
	m_program.add_label(std::string(name));
}

void Assembler::emit_instruction(
	int line_no, const std::vector<Token>& tokens, std::size_t first
) {
	const auto& head = tokens[first];
	const auto* entry = find_mnemonic(head.text);
	if (entry == nullptr)
		throw AssemblyError(head.loc, "unknown mnemonic `" + std::string(head.text) + "'");

	std::size_t expected = mnemonic_operand_count(entry->opcode);
	std::size_t given = tokens.size() - first - 1;
	if (given != expected) {
		Location loc = head.loc;
		loc.end = tokens.back().loc.end;
		throw AssemblyError(
			loc,
			std::string(entry->name) + " takes " + std::to_string(expected)
				+ " operand(s), got " + std::to_string(given)
		);
	}

	const Token* operands = &tokens[first + 1];
	switch (entry->opcode) {
		case OpKind::PUSH:
			m_program.emit(
				OpKind::PUSH, parse_span(operands[0]), parse_magnitude(operands[1])
			);
			break;
		case OpKind::COMBINE:
			m_program.emit_combine(entry->arith, parse_span(operands[0]));
			break;
		case OpKind::JUMP_IF_NONPOSITIVE: {
			auto span = parse_span(operands[0]);
			m_program.emit(entry->opcode, span, parse_target(operands[1]));
			break;
		}
		case OpKind::JUMP_ALWAYS:
			m_program.emit(entry->opcode, 0, parse_target(operands[0]));
			break;
		case OpKind::TERMINATE: m_program.emit(entry->opcode); break;
		default: m_program.emit(entry->opcode, parse_span(operands[0])); break;
	}
	m_program.with_origin((std::size_t)line_no + 1);
}

std::size_t Assembler::parse_span(const Token& token) const {
	std::size_t span = 0;
	if (not parse_unsigned(token.text, span))
		throw AssemblyError(token.loc, "malformed span `" + std::string(token.text) + "'");
	return span;
}

std::uint64_t Assembler::parse_magnitude(const Token& token) const {
	std::uint64_t magnitude = 0;
	if (not parse_unsigned(token.text, magnitude))
		throw AssemblyError(
			token.loc, "malformed magnitude `" + std::string(token.text) + "'"
		);
	return magnitude;
}

// labels are resolved once the whole listing is read
std::uint64_t Assembler::parse_target(const Token& token) {
	if (is_label_name(token.text)) {
		m_fixups.push_back(Fixup {m_program.size(), token});
		return 0;
	}
	std::uint64_t target = 0;
	if (not parse_unsigned(token.text, target))
		throw AssemblyError(token.loc, "malformed target `" + std::string(token.text) + "'");
	return target;
}

Program assemble(Reader* reader) {
	Assembler assembler {reader};
	return assembler.assemble();
}

} // namespace sigil
