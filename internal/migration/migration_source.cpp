#include "internal/migration/migration_source.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace sqlmigrate::migration {

namespace {

bool HasExtension(const std::string& name, std::string_view extension) {
  // the extension alone (".sql") is not a migration name
  return name.size() > extension.size() && name.compare(name.size() - extension.size(), extension.size(), extension) == 0;
}

} // namespace

std::vector<MigrationFile> SelectCandidates(const std::filesystem::path& directory, const std::vector<DirectoryEntry>& listing,
                                            std::string_view extension) {
  std::vector<MigrationFile> candidates;
  for (const auto& entry : listing) {
    if (!entry.regular_file || !HasExtension(entry.name, extension)) {
      continue;
    }
    candidates.push_back(MigrationFile{entry.name, directory / entry.name});
  }

  // std::string compares through char_traits<char>, i.e. as unsigned bytes
  std::sort(candidates.begin(), candidates.end(), [](const MigrationFile& a, const MigrationFile& b) { return a.filename < b.filename; });
  return candidates;
}

MigrationSource::MigrationSource(std::shared_ptr<const FileSystem> fs, std::string extension)
    : fs_(std::move(fs)), extension_(std::move(extension)) {
  if (!fs_) {
    throw std::invalid_argument("MigrationSource requires a filesystem");
  }
  if (extension_.empty()) {
    throw std::invalid_argument("migration file extension must not be empty");
  }
}

std::vector<MigrationFile> MigrationSource::ListCandidates(const std::filesystem::path& directory) const {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(directory, ec);
  if (ec) {
    absolute = directory;
  }

  std::vector<DirectoryEntry> listing;
  try {
    listing = fs_->ListDirectory(absolute);
  } catch (const std::exception& e) {
    throw util::SourceUnavailable("migration directory '" + directory.string() + "' is unavailable: " + e.what());
  }

  return SelectCandidates(absolute, listing, extension_);
}

std::string MigrationSource::ReadBody(const MigrationFile& file) const {
  try {
    return fs_->ReadFile(file.path);
  } catch (const std::exception& e) {
    throw util::ReadError(file.filename, e.what());
  }
}

} // namespace sqlmigrate::migration
