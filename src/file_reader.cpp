#include "file_reader.hpp"

#include <stdexcept>
#include <utility>

namespace sigil {

FileReader::FileReader(const char* path)
: m_fd {fopen(path, "rb")}, m_name {path} {
	if (m_fd == nullptr)
		throw std::domain_error("Could not open file " + std::string(path));
}

FileReader::FileReader(FILE* fd, std::string name)
: m_fd {fd}, m_owned {false}, m_name {std::move(name)} {}

FileReader::~FileReader() {
	if (m_owned && m_fd != nullptr) fclose(m_fd);
}

FileReader::FileReader(FileReader&& other)
: m_fd {other.m_fd}, m_owned {other.m_owned}, m_name {std::move(other.m_name)} {
	other.m_owned = false;
}

std::string FileReader::get_path() const { return m_name; }
bool FileReader::at_eof() const { return feof(m_fd) or ferror(m_fd); }

std::size_t FileReader::read_at_most(char* buffer, std::size_t limit) {
	return fread(buffer, sizeof(char), limit, m_fd);
}

} // namespace sigil
