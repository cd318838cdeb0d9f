#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <cstdint>

namespace sigil {

// numeric backend the run uses
enum class Backend {
	BOUNDED,
	BIG,
};

struct Options {
	Backend backend {Backend::BOUNDED};
	bool is_invalid {false};
	unsigned int verbosity {0};
	bool from_stdin {false};
	char* output_path {nullptr};
	bool disassemble {false};
	bool interpret {false};
	bool trace {false};
	std::uint64_t step_limit {0}; // 0 means unlimited
	char** argv {nullptr};
	int argc {0};
};

Options parse_args(int argc, char* argv[]);

const char* backend_repr(Backend backend);

} // namespace sigil

#endif
