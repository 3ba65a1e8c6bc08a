#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/migration/file_system.hpp"
#include "internal/migration/migration_types.hpp"

namespace sqlmigrate::migration {

inline constexpr std::string_view kDefaultExtension = ".sql";

/*
  Pure selection step: keeps regular files whose name ends in `extension`
  and returns them sorted by filename, byte-wise ascending.
*/
std::vector<MigrationFile> SelectCandidates(const std::filesystem::path& directory, const std::vector<DirectoryEntry>& listing,
                                            std::string_view extension = kDefaultExtension);

/*
  MigrationSource

  Deterministic discovery of candidate migrations in one directory.

  ListCandidates() throws util::SourceUnavailable, ReadBody() throws
  util::ReadError. A directory with no matching file is not an error.
*/
class MigrationSource {
 public:
  explicit MigrationSource(std::shared_ptr<const FileSystem> fs, std::string extension = std::string(kDefaultExtension));

  std::vector<MigrationFile> ListCandidates(const std::filesystem::path& directory) const;

  std::string ReadBody(const MigrationFile& file) const;

  const std::string& Extension() const {
    return extension_;
  }

 private:
  std::shared_ptr<const FileSystem> fs_;
  std::string                       extension_;
};

} // namespace sqlmigrate::migration
