#include <gtest/gtest.h>

#include <cstdint>
#include <sstream>
#include <string>

#include "stream_port.hpp"

using namespace sigil;

TEST(StreamPortTest, numbers_are_whitespace_separated) {
	std::istringstream input {"  12\t-3/4\n\n0.5 "};
	std::ostringstream output {};
	StreamPort port {input, output};

	EXPECT_EQ(port.read_number(), "12");
	EXPECT_EQ(port.read_number(), "-3/4");
	EXPECT_EQ(port.read_number(), "0.5");
	EXPECT_FALSE(port.read_number().has_value());
	EXPECT_FALSE(port.read_number().has_value());
}

TEST(StreamPortTest, codepoints_are_decoded) {
	std::istringstream input {"a\xc2\xa2\xe2\x82\xac\xf0\x90\x8d\x88"};
	std::ostringstream output {};
	StreamPort port {input, output};

	EXPECT_EQ(port.read_codepoint(), 0x61u);
	EXPECT_EQ(port.read_codepoint(), 0xa2u);
	EXPECT_EQ(port.read_codepoint(), 0x20acu);
	EXPECT_EQ(port.read_codepoint(), 0x10348u);
	EXPECT_FALSE(port.read_codepoint().has_value());
}

TEST(StreamPortTest, invalid_sequences_read_as_end_of_input) {
	{
		std::istringstream input {"\x80z"};
		std::ostringstream output {};
		StreamPort port {input, output};
		EXPECT_FALSE(port.read_codepoint().has_value());
		EXPECT_EQ(port.read_codepoint(), (std::uint32_t)'z');
	}
	{
		// truncated two byte sequence
		std::istringstream input {"\xc3z"};
		std::ostringstream output {};
		StreamPort port {input, output};
		EXPECT_FALSE(port.read_codepoint().has_value());
		EXPECT_EQ(port.read_codepoint(), (std::uint32_t)'z');
	}
	{
		// surrogate, past U+10FFFF, overlong NUL
		std::istringstream input {"\xed\xa0\x80" "\xf7\xbf\xbf\xbf" "\xc0\x80" "z"};
		std::ostringstream output {};
		StreamPort port {input, output};
		EXPECT_FALSE(port.read_codepoint().has_value());
		EXPECT_FALSE(port.read_codepoint().has_value());
		EXPECT_FALSE(port.read_codepoint().has_value());
		EXPECT_EQ(port.read_codepoint(), (std::uint32_t)'z');
	}
	{
		// overlong three byte form of '/'
		std::istringstream input {"\xe0\x80\xaf\xf4\x8f\xbf\xbf"};
		std::ostringstream output {};
		StreamPort port {input, output};
		EXPECT_FALSE(port.read_codepoint().has_value());
		EXPECT_EQ(port.read_codepoint(), 0x10ffffu);
	}
}

TEST(StreamPortTest, writes_go_to_output) {
	std::istringstream input {};
	std::ostringstream output {};
	StreamPort port {input, output};

	port.write_text("-1/2");
	port.write_codepoint(0x20ac);
	port.write_codepoint('!');
	EXPECT_EQ(output.str(), "-1/2\xe2\x82\xac!");
}

TEST(StreamPortTest, encode_utf8_lengths) {
	std::string out {};
	encode_utf8(0x7f, out);
	EXPECT_EQ(out.size(), 1);
	encode_utf8(0x7ff, out);
	EXPECT_EQ(out.size(), 3);
	encode_utf8(0xffff, out);
	EXPECT_EQ(out.size(), 6);
	encode_utf8(0x10ffff, out);
	EXPECT_EQ(out, "\x7f\xdf\xbf\xef\xbf\xbf\xf4\x8f\xbf\xbf");
}
