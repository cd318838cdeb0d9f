#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <string>
#include <variant>

#include "assembler.hpp"
#include "file_reader.hpp"
#include "machine.hpp"
#include "rational.hpp"
#include "stream_port.hpp"
#include "string_reader.hpp"

using namespace sigil;

namespace {

Program assemble_text(const std::string& text) {
	StringReader reader {text};
	return assemble(&reader);
}

// location of the error raised while assembling text
Location error_location(const std::string& text) {
	try {
		assemble_text(text);
	} catch (const AssemblyError& e) {
		return e.loc;
	}
	ADD_FAILURE() << "listing assembled without error";
	return {};
}

const char* COUNTDOWN =
	"; prints 321\n"
	"\tpush 2 1\n"
	"\tpush 2 1\n"
	"\tpush 2 1\n"
	"\tpush 1 3\n"
	"loop:\n"
	"\tjle 1 done\n"
	"\tspread 2\n"
	"\tputn 2\n"
	"\tsub 2\n"
	"\tenqueue 2\n"
	"\tdequeue 1\n"
	"\tjmp loop\n"
	"done:\n";

} // namespace

TEST(AssemblerTest, every_mnemonic) {
	auto program = assemble_text(
		"push 3 7\nadd 2\nsub 2\nmul 2\ndiv 4\nenqueue 1\ndequeue 5\nspread 3\n"
		"jle 2 0\njmp 1\nputn 1\nputc 1\ngetn 2\ngetc 2\nhalt\n"
	);
	ASSERT_EQ(program.size(), 15);

	EXPECT_EQ(program.at(0).opcode, OpKind::PUSH);
	EXPECT_EQ(program.at(0).span, 3);
	EXPECT_EQ(program.at(0).magnitude, 7);
	EXPECT_EQ(program.at(1).arith, Arith::ADD);
	EXPECT_EQ(program.at(2).arith, Arith::SUB);
	EXPECT_EQ(program.at(3).arith, Arith::MUL);
	EXPECT_EQ(program.at(4).opcode, OpKind::COMBINE);
	EXPECT_EQ(program.at(4).arith, Arith::DIV);
	EXPECT_EQ(program.at(4).span, 4);
	EXPECT_EQ(program.at(5).opcode, OpKind::TRANSFER_TO_QUEUE);
	EXPECT_EQ(program.at(6).opcode, OpKind::TRANSFER_FROM_QUEUE);
	EXPECT_EQ(program.at(6).span, 5);
	EXPECT_EQ(program.at(7).opcode, OpKind::DUPLICATE_SPREAD);
	EXPECT_EQ(program.at(8).opcode, OpKind::JUMP_IF_NONPOSITIVE);
	EXPECT_EQ(program.at(8).span, 2);
	EXPECT_EQ(program.at(8).magnitude, 0);
	EXPECT_EQ(program.at(9).opcode, OpKind::JUMP_ALWAYS);
	EXPECT_EQ(program.at(9).magnitude, 1);
	EXPECT_EQ(program.at(10).opcode, OpKind::OUTPUT_NUMBER);
	EXPECT_EQ(program.at(11).opcode, OpKind::OUTPUT_CHAR);
	EXPECT_EQ(program.at(12).opcode, OpKind::INPUT_NUMBER);
	EXPECT_EQ(program.at(13).opcode, OpKind::INPUT_CHAR);
	EXPECT_EQ(program.at(14).opcode, OpKind::TERMINATE);
}

TEST(AssemblerTest, origins_are_listing_lines) {
	auto program = assemble_text("; header\n\npush 1 1 ; trailing\n  putn 1\n");
	ASSERT_EQ(program.size(), 2);
	EXPECT_EQ(program.at(0).origin, 3);
	EXPECT_EQ(program.at(1).origin, 4);
}

TEST(AssemblerTest, labels_resolve_forwards_and_backwards) {
	auto program = assemble_text(COUNTDOWN);
	ASSERT_EQ(program.size(), 11);
	EXPECT_EQ(program.at(4).opcode, OpKind::JUMP_IF_NONPOSITIVE);
	EXPECT_EQ(program.at(4).magnitude, 11);
	EXPECT_EQ(program.at(10).opcode, OpKind::JUMP_ALWAYS);
	EXPECT_EQ(program.at(10).magnitude, 4);

	ASSERT_EQ(program.labels.size(), 2);
	EXPECT_EQ(program.labels.find(4)->second, "loop");
	EXPECT_EQ(program.labels.find(11)->second, "done");
}

TEST(AssemblerTest, label_and_instruction_share_a_line) {
	auto program = assemble_text("start: putn 1\njmp start\n");
	ASSERT_EQ(program.size(), 2);
	EXPECT_EQ(program.at(1).magnitude, 0);
}

TEST(AssemblerTest, unknown_mnemonic) {
	auto loc = error_location("push 1 1\n  pop 1\n");
	EXPECT_EQ(loc.begin.line, 1);
	EXPECT_EQ(loc.begin.column, 2);
	EXPECT_EQ(loc.end.column, 4);
}

TEST(AssemblerTest, operand_count_mismatch) {
	auto loc = error_location("push 1\n");
	EXPECT_EQ(loc.begin.line, 0);
	EXPECT_EQ(loc.begin.column, 0);
	EXPECT_EQ(loc.end.column, 5);

	loc = error_location("halt 1\n");
	EXPECT_EQ(loc.begin.line, 0);
}

TEST(AssemblerTest, malformed_operands) {
	auto loc = error_location("putn -1\n");
	EXPECT_EQ(loc.begin.column, 5);

	loc = error_location("push 1 x2\n");
	EXPECT_EQ(loc.begin.column, 7);

	loc = error_location("push 1 18446744073709551616\n");
	EXPECT_EQ(loc.begin.column, 7);
}

TEST(AssemblerTest, undefined_label) {
	auto loc = error_location("putn 1\njmp nowhere\n");
	EXPECT_EQ(loc.begin.line, 1);
	EXPECT_EQ(loc.begin.column, 4);
	EXPECT_EQ(loc.end.column, 10);
}

TEST(AssemblerTest, duplicate_label) {
	auto loc = error_location("a:\nputn 1\na:\n");
	EXPECT_EQ(loc.begin.line, 2);
	EXPECT_THROW(assemble_text("9lives:\n"), AssemblyError);
}

TEST(AssemblerTest, error_keeps_lines_for_diagnostics) {
	StringReader reader {"push 1 1\nbogus\n"};
	Assembler assembler {&reader};
	EXPECT_THROW(assembler.assemble(), AssemblyError);
	auto lines = assembler.get_lines();
	ASSERT_EQ(lines.size(), 2);
	EXPECT_EQ(lines[1], "bogus");
}

TEST(AssemblerTest, printed_listing_assembles_back) {
	auto program = assemble_text(COUNTDOWN);

	FILE* fd = tmpfile();
	ASSERT_NE(fd, nullptr);
	print_program(fd, program);
	rewind(fd);

	Program reread {};
	{
		FileReader reader {fd, "<tmpfile>"};
		reread = assemble(&reader);
	}
	fclose(fd);

	ASSERT_EQ(reread.size(), program.size());
	for (std::size_t i = 0; i < program.size(); i++) {
		EXPECT_EQ(reread.at(i).opcode, program.at(i).opcode) << i;
		EXPECT_EQ(reread.at(i).arith, program.at(i).arith) << i;
		EXPECT_EQ(reread.at(i).span, program.at(i).span) << i;
		EXPECT_EQ(reread.at(i).magnitude, program.at(i).magnitude) << i;
	}
	EXPECT_EQ(reread.labels, program.labels);
}

TEST(AssemblerTest, countdown_runs) {
	auto program = assemble_text(COUNTDOWN);

	std::istringstream input {};
	std::ostringstream output {};
	StreamPort port {input, output};
	auto result = run_program<BoundedRational>(program, port);

	ASSERT_TRUE(std::holds_alternative<Completed>(result));
	EXPECT_EQ(std::get<Completed>(result).curses, 0);
	EXPECT_EQ(output.str(), "321");
}
