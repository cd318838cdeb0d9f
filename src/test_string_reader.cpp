#include <gtest/gtest.h>

#include <cstring>
#include <memory>

#include "string_reader.hpp"

using namespace sigil;

TEST(StringReaderTest, empty_string) {
	auto reader = std::make_shared<StringReader>("");
	EXPECT_EQ(reader->at_eof(), true);
	char buf[50];
	size_t read = reader->read_at_most(buf, 50);
	EXPECT_EQ(read, 0);
	EXPECT_EQ(reader->get_path(), "<string>");
}

TEST(StringReaderTest, sample_listing) {
	std::string source =
		"loop: jle 1 done\n"
		"\tputn 2 ; print\n"
		"\tjmp loop\n"
		"done:\n";
	EXPECT_EQ(source.size(), 49);
	auto reader = std::make_shared<StringReader>(source, "count.sgl");
	char buf[49];
	memset(buf, '\0', 49);
	size_t read = reader->read_at_most(buf, 48);
	EXPECT_EQ(read, 48);
	EXPECT_STREQ(buf, "loop: jle 1 done\n\tputn 2 ; print\n\tjmp loop\ndone:");
	EXPECT_EQ(reader->at_eof(), false);
	memset(buf, '\0', 49);
	read = reader->read_at_most(buf, 48);
	EXPECT_EQ(read, 1);
	EXPECT_STREQ(buf, "\n");
	EXPECT_EQ(reader->at_eof(), true);
	EXPECT_EQ(reader->get_path(), "count.sgl");
}

TEST(StringReaderTest, read_to_end_drains_the_reader) {
	StringReader reader {std::string(5000, 'x') + "end"};
	auto text = reader.read_to_end();
	EXPECT_EQ(text.size(), 5003);
	EXPECT_EQ(text.substr(5000), "end");
	EXPECT_TRUE(reader.at_eof());
	EXPECT_EQ(reader.read_to_end(), "");
}
