#ifndef FILE_HPP
#define FILE_HPP

#include <stdio.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace sigil {

// Output file, closed on destruction when owned
struct File {
	File(const char* path, const char* mode)
	: m_fd {fopen(path, mode)}, m_name {path} {
		if (m_fd == nullptr)
			throw std::domain_error("Could not open file " + std::string(path));
	}
	File(FILE* fd) : m_fd {fd}, m_owned {false}, m_name {"<stdout>"} {}
	~File() {
		if (m_owned && m_fd != nullptr) fclose(m_fd);
	}

	File& operator=(const File& other) = delete;
	File& operator=(File&& other) = delete;
	File(const File& other) = delete;
	File(File&& other)
	: m_fd {other.m_fd}, m_owned {other.m_owned}, m_name {std::move(other.m_name)} {
		other.m_owned = false;
	}

	FILE* get_descriptor() { return m_fd; }
	std::string get_name() const { return m_name; }

 private:
	FILE* m_fd;
	bool m_owned {true};
	std::string m_name {};
};

} // namespace sigil

#endif
