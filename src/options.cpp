#include "options.hpp"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "logger.hpp"

namespace sigil {

const char* backend_repr(Backend backend) {
	switch (backend) {
		case Backend::BOUNDED: return "bounded";
		case Backend::BIG: return "big";
	}
	return "";
}

static bool parse_step_limit(const char* text, std::uint64_t& out) {
	if (text == nullptr or *text < '0' or *text > '9') return false;
	char* end = nullptr;
	errno = 0;
	unsigned long long value = strtoull(text, &end, 10);
	if (errno != 0 or *end != '\0') return false;
	out = value;
	return true;
}

Options parse_args(int argc, char* argv[]) {
	Options opts {};

	for (int c = 0; (c = getopt(argc, argv, "Vo:dits:b:")) != -1;)
		switch (c) {
			case 'V': opts.verbosity += 1; break;
			case 'o': opts.output_path = optarg; break;
			case 'd': opts.disassemble = true; break;
			case 'i': opts.interpret = true; break;
			case 't': opts.trace = true; break;
			case 's': {
				if (not parse_step_limit(optarg, opts.step_limit)) {
					report(ERROR, "OPTIONS", "Invalid step limit: %s", optarg);
					opts.is_invalid = true;
					return opts;
				}
				break;
			}
			case 'b': {
				if (strcmp(optarg, "bounded") == 0) {
					opts.backend = Backend::BOUNDED;
				} else if (strcmp(optarg, "big") == 0) {
					opts.backend = Backend::BIG;
				} else {
					report(ERROR, "OPTIONS", "Unknown backend: %s", optarg);
					opts.is_invalid = true;
					return opts;
				}
				break;
			}
			default: {
				opts.is_invalid = true;
				return opts;
			}
		}

	opts.argv = &argv[optind];
	opts.argc = argc - optind;

	if (opts.argc < 1) {
		opts.is_invalid = true;
		return opts;
	}

	if (strcmp(opts.argv[0], "-") == 0) opts.from_stdin = true;

	if (opts.disassemble == opts.interpret) opts.is_invalid = true;

	return opts;
}

} // namespace sigil
