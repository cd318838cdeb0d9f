#include "stream_port.hpp"

#include <cctype>
#include <cstdio>

namespace sigil {

namespace {

constexpr std::uint8_t LEAD_MASK[4] = {0x7f, 0x1f, 0x0f, 0x07};
// smallest value each sequence length may encode, anything below is overlong
constexpr std::uint32_t MIN_ENCODED[4] = {0x0, 0x80, 0x800, 0x10000};
constexpr std::uint32_t MAX_CODEPOINT = 0x10ffff;

bool is_space(int c) { return std::isspace(c) != 0; }

// number of continuation bytes announced by a lead byte, -1 if invalid
int continuation_count(std::uint8_t lead) {
	if ((lead & 0x80) == 0) return 0;
	if ((lead & 0xe0) == 0xc0) return 1;
	if ((lead & 0xf0) == 0xe0) return 2;
	if ((lead & 0xf8) == 0xf0) return 3;
	return -1;
}

} // namespace

std::optional<std::string> StreamPort::read_number() {
	int c = input.peek();
	while (c != EOF and is_space(c)) {
		input.get();
		c = input.peek();
	}
	if (c == EOF) return {};

	std::string token {};
	while (c != EOF and not is_space(c)) {
		token.push_back((char)input.get());
		c = input.peek();
	}
	return token;
}

std::optional<std::uint32_t> StreamPort::read_codepoint() {
	int first = input.get();
	if (first == EOF) return {};

	auto lead = (std::uint8_t)first;
	int count = continuation_count(lead);
	if (count < 0) return {};

	std::uint32_t codepoint = lead & LEAD_MASK[count];
	for (int i = 0; i < count; i++) {
		int next = input.peek();
		if (next == EOF or ((std::uint8_t)next & 0xc0) != 0x80) return {};
		input.get();
		codepoint = (codepoint << 6) | ((std::uint8_t)next & 0x3f);
	}

	if (codepoint < MIN_ENCODED[count] or codepoint > MAX_CODEPOINT) return {};
	if (codepoint >= 0xd800 and codepoint <= 0xdfff) return {};
	return codepoint;
}

void StreamPort::write_text(const std::string& text) { output << text; }

void StreamPort::write_codepoint(std::uint32_t codepoint) {
	std::string encoded {};
	encode_utf8(codepoint, encoded);
	output << encoded;
}

void encode_utf8(std::uint32_t codepoint, std::string& out) {
	if (codepoint < 0x80) {
		out.push_back((char)codepoint);
	} else if (codepoint < 0x800) {
		out.push_back((char)(0xc0 | (codepoint >> 6)));
		out.push_back((char)(0x80 | (codepoint & 0x3f)));
	} else if (codepoint < 0x10000) {
		out.push_back((char)(0xe0 | (codepoint >> 12)));
		out.push_back((char)(0x80 | ((codepoint >> 6) & 0x3f)));
		out.push_back((char)(0x80 | (codepoint & 0x3f)));
	} else {
		out.push_back((char)(0xf0 | (codepoint >> 18)));
		out.push_back((char)(0x80 | ((codepoint >> 12) & 0x3f)));
		out.push_back((char)(0x80 | ((codepoint >> 6) & 0x3f)));
		out.push_back((char)(0x80 | (codepoint & 0x3f)));
	}
}

} // namespace sigil
