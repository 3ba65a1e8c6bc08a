#include "internal/migration/file_system.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

namespace sqlmigrate::migration {

std::vector<DirectoryEntry> LocalFileSystem::ListDirectory(const std::filesystem::path& directory) const {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    if (!ec) {
      ec = std::make_error_code(std::errc::not_a_directory);
    }
    throw std::filesystem::filesystem_error("cannot list migration directory", directory, ec);
  }

  std::vector<DirectoryEntry> entries;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    throw std::filesystem::filesystem_error("cannot list migration directory", directory, ec);
  }

  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      throw std::filesystem::filesystem_error("cannot list migration directory", directory, ec);
    }

    std::error_code type_ec;
    DirectoryEntry  entry;
    entry.name         = it->path().filename().string();
    entry.regular_file = it->is_regular_file(type_ec) && !type_ec;
    entries.push_back(std::move(entry));
  }
  if (ec) {
    throw std::filesystem::filesystem_error("cannot list migration directory", directory, ec);
  }

  return entries;
}

std::string LocalFileSystem::ReadFile(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    throw std::filesystem::filesystem_error("cannot open migration file", path, std::error_code(errno, std::generic_category()));
  }

  std::ostringstream body;
  body << in.rdbuf();
  if (in.bad()) {
    throw std::filesystem::filesystem_error("cannot read migration file", path, std::make_error_code(std::errc::io_error));
  }
  return body.str();
}

} // namespace sqlmigrate::migration
