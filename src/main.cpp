#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "assembler.hpp"
#include "file.hpp"
#include "file_reader.hpp"
#include "instruction.hpp"
#include "logger.hpp"
#include "machine.hpp"
#include "options.hpp"
#include "rational.hpp"
#include "stream_port.hpp"

using namespace sigil;

namespace {

enum ExitStatus {
	EXIT_COMPLETED = 0,
	EXIT_USAGE = 1,
	EXIT_ABORTED = 2,
	EXIT_STEP_LIMIT = 3,
};

void usage() {
	printf(
		"Usage:\n"
		"\tsigil <mode> [<options> ...] <filepath>\n"
		"\n"
		"Filepath:\n"
		"\tinstruction listing. if <filepath> is \"-\", the listing is read from "
		"stdin\n"
		"\n"
		"Options:\n"
		"\t-V          verbose output. use multiple times to increase verbosity\n"
		"\t-o <path>   output file path for -d. if no path is provided, stdout is "
		"used\n"
		"\t-b <name>   numeric backend. one of: bounded, big\n"
		"\t-s <n>      stop after <n> instructions. 0 means no limit\n"
		"\t-t          trace every executed instruction to stderr\n"
		"\n"
		"Modes:\n"
		"\t-d          disassemble\n"
		"\t-i          interpret\n"
	);
}

void print_phase(const Options& opts, std::string phase) {
	if (opts.verbosity >= 1)
		std::cerr << ANSI_COLOR_YELLOW << "INFO" << ANSI_COLOR_RESET << ": "
							<< phase << "..." << '\n';
}

std::unique_ptr<Reader> open_listing(const Options& opts) {
	if (opts.from_stdin) return std::make_unique<FileReader>(stdin, "<stdin>");
	return std::make_unique<FileReader>(opts.argv[0]);
}

std::optional<Program> load(const Options& opts) {
	print_phase(opts, "loading");
	auto reader = open_listing(opts);
	Assembler assembler {reader.get()};
	try {
		return assembler.assemble();
	} catch (const AssemblyError& e) {
		Logger logger {"LISTING", reader->get_path(), assembler.get_lines()};
		logger.err(e.loc, e.what());
		return {};
	}
}

int disassemble(const Options& opts, const Program& program) {
	File output = (opts.output_path) ? File(opts.output_path, "w") : File(stdout);

	print_phase(opts, "saving output");
	print_program(output.get_descriptor(), program);
	return EXIT_COMPLETED;
}

template<typename Number>
int interpret(const Options& opts, const Program& program) {
	print_phase(opts, std::string("interpreting(") + backend_repr(opts.backend) + ")");

	StreamPort port {std::cin, std::cout};
	Interpreter<Number> interpreter {program, port};
	interpreter.trace = opts.trace;

	std::uint64_t steps = 0;
	while (interpreter.is_running()) {
		bool fetching = interpreter.pointer < program.size();
		if (fetching and opts.step_limit != 0 and steps == opts.step_limit) break;
		interpreter.step();
		steps++;
	}
	std::cout.flush();

	if (opts.verbosity >= 3) print_machine(stderr, interpreter.machine);

	if (interpreter.is_running()) {
		report(
			WARN,
			"RUN",
			"step limit of %llu reached before instruction %zu",
			(unsigned long long)opts.step_limit,
			interpreter.pointer
		);
		return EXIT_STEP_LIMIT;
	}

	auto result = interpreter.result();
	if (const auto* aborted = std::get_if<Aborted>(&result)) {
		report(
			ERROR,
			"RUN",
			"%s %llu at instruction %zu (line %zu)",
			abort_reason_repr(aborted->reason),
			(unsigned long long)aborted->target,
			aborted->index,
			program.at(aborted->index).origin
		);
		return EXIT_ABORTED;
	}

	if (opts.verbosity >= 1)
		report(
			INFO,
			"RUN",
			"completed with %llu curse(s)",
			(unsigned long long)std::get<Completed>(result).curses
		);
	return EXIT_COMPLETED;
}

} // namespace

int main(int argc, char* argv[]) {
	Options opts = parse_args(argc, argv);
	if (opts.is_invalid) {
		usage();
		return EXIT_USAGE;
	}

	try {
		auto program = load(opts);
		if (not program.has_value()) return EXIT_USAGE;

		if (opts.disassemble) return disassemble(opts, *program);

		switch (opts.backend) {
			case Backend::BOUNDED: return interpret<BoundedRational>(opts, *program);
			case Backend::BIG: return interpret<BigRational>(opts, *program);
		}
	} catch (const std::domain_error& e) {
		report(ERROR, "IO", "%s", e.what());
		return EXIT_USAGE;
	}

	std::unreachable();
}
