#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <stdio.h>

#include <string>
#include <utility>
#include <vector>

#include "location.hpp"

#define ANSI_STYLE_BOLD "\x1b[1m"
#define ANSI_COLOR_RED "\x1b[31m"
#define ANSI_COLOR_GREEN "\x1b[32m"
#define ANSI_COLOR_YELLOW "\x1b[33m"
#define ANSI_COLOR_BLUE "\x1b[34m"
#define ANSI_COLOR_MAGENTA "\x1b[35m"
#define ANSI_COLOR_CYAN "\x1b[36m"
#define ANSI_COLOR_RESET "\x1b[0m"

namespace sigil {

enum LogLevel {
	WARN,
	ERROR,
	INFO,
};

inline const char* log_level_repr(LogLevel level) {
	switch (level) {
		case WARN: return ANSI_COLOR_MAGENTA "WARNING" ANSI_COLOR_RESET;
		case ERROR: return ANSI_COLOR_RED "ERROR" ANSI_COLOR_RESET;
		case INFO: return ANSI_COLOR_YELLOW "INFO" ANSI_COLOR_RESET;
	}
	return "";
}

// Diagnostics tied to a listing, printed with the offending line in context
struct Logger {
	Logger(
		std::string domain, std::string file_name, std::vector<std::string> lines
	)
	: domain {std::move(domain)},
		file_name {std::move(file_name)},
		lines {std::move(lines)} {}

 private:
	void print_lines(Location loc) {
		if (loc.begin.line < 0 or (size_t)loc.begin.line >= lines.size()) return;

		if (loc.begin.line > 0) {
			const auto& prev_line = lines[(size_t)loc.begin.line - 1];
			fprintf(stderr, "     |\t%s\n", prev_line.c_str());
		}

		const auto& line = lines[(size_t)loc.begin.line];
		fprintf(stderr, " %3d |\t", loc.begin.line + 1);
		for (size_t i = 0; i < line.size(); i++) {
			if ((int)i == loc.begin.column) fprintf(stderr, ANSI_STYLE_BOLD);
			fprintf(stderr, "%c", line[i]);
			if (loc.begin.line == loc.end.line and (int)i == loc.end.column)
				fprintf(stderr, ANSI_COLOR_RESET);
		}
		fprintf(stderr, ANSI_COLOR_RESET "\n");

		fprintf(stderr, "     |\t");
		for (size_t i = 0; i < line.size(); i++) {
			bool marked = (int)i >= loc.begin.column and (int)i <= loc.end.column;
			fprintf(stderr, "%c", marked ? '^' : ' ');
		}
		fprintf(stderr, "\n");
	}

 public:
	template<typename... Args>
	void log(LogLevel level, Location loc, const std::string& format, Args... args) {
		fprintf(
			stderr,
			ANSI_STYLE_BOLD "%s:%d:%d: " ANSI_COLOR_RESET "%s %s: ",
			file_name.c_str(),
			loc.begin.line + 1,
			loc.begin.column + 1,
			domain.c_str(),
			log_level_repr(level)
		);
		if constexpr (sizeof...(args) == 0)
			fprintf(stderr, "%s", format.c_str());
		else
			fprintf(stderr, format.c_str(), args...);
		fprintf(stderr, "\n");
		print_lines(loc);
	}

	template<typename... Args>
	void err(Location loc, const std::string& format, Args... args) {
		log(ERROR, loc, format, args...);
	}

 private:
	std::string domain;
	std::string file_name;
	std::vector<std::string> lines;
};

// diagnostics without a listing location
template<typename... Args>
void report(LogLevel level, const char* domain, const char* format, Args... args) {
	fprintf(stderr, "%s %s: ", domain, log_level_repr(level));
	if constexpr (sizeof...(args) == 0)
		fprintf(stderr, "%s", format);
	else
		fprintf(stderr, format, args...);
	fprintf(stderr, "\n");
}

} // namespace sigil

#endif
