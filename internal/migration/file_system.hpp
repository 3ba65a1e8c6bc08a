#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sqlmigrate::migration {

struct DirectoryEntry {
  std::string name;
  bool        regular_file = false;
};

/*
  Filesystem capability used by MigrationSource.

  Both calls throw std::runtime_error (std::filesystem::filesystem_error for
  the local implementation) when the path cannot be read.
*/
class FileSystem {
 public:
  virtual ~FileSystem() = default;

  virtual std::vector<DirectoryEntry> ListDirectory(const std::filesystem::path& directory) const = 0;
  virtual std::string                 ReadFile(const std::filesystem::path& path) const          = 0;
};

class LocalFileSystem final : public FileSystem {
 public:
  std::vector<DirectoryEntry> ListDirectory(const std::filesystem::path& directory) const override;
  std::string                 ReadFile(const std::filesystem::path& path) const override;
};

} // namespace sqlmigrate::migration
