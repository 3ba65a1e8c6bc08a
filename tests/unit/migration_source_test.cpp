#include "internal/migration/migration_source.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using sqlmigrate::migration::DirectoryEntry;
using sqlmigrate::migration::FileSystem;
using sqlmigrate::migration::LocalFileSystem;
using sqlmigrate::migration::MigrationFile;
using sqlmigrate::migration::MigrationSource;
using sqlmigrate::migration::SelectCandidates;

// In-memory listing; ReadFile serves `files`, anything else is "unreadable".
class FakeFileSystem final : public FileSystem {
 public:
  std::vector<DirectoryEntry>        listing;
  std::map<std::string, std::string> files;
  bool                               fail_listing = false;

  std::vector<DirectoryEntry> ListDirectory(const std::filesystem::path& directory) const override {
    if (fail_listing) {
      throw std::runtime_error("permission denied: " + directory.string());
    }
    return listing;
  }

  std::string ReadFile(const std::filesystem::path& path) const override {
    auto it = files.find(path.filename().string());
    if (it == files.end()) {
      throw std::runtime_error("no such file: " + path.string());
    }
    return it->second;
  }
};

std::vector<std::string> Names(const std::vector<MigrationFile>& files) {
  std::vector<std::string> names;
  for (const auto& f : files) {
    names.push_back(f.filename);
  }
  return names;
}

void TestSelectFiltersByExtensionAndSortsByteWise() {
  const std::vector<DirectoryEntry> listing = {
      {"0002_b.sql", true}, {"README.md", true}, {"0001_a.sql", true}, {"0010_c.sql", true},
      {"0003_d.SQL", true}, {"0004_e.sql.bak", true}, {".sql", true}, {"Z_upper.sql", true},
  };

  const auto selected = SelectCandidates("/migrations", listing);

  // case-sensitive suffix; digits (0x30-0x39) sort before 'Z' (0x5a)
  const std::vector<std::string> expected = {"0001_a.sql", "0002_b.sql", "0010_c.sql", "Z_upper.sql"};
  assert(Names(selected) == expected);
  assert(selected[0].path == std::filesystem::path("/migrations/0001_a.sql"));
}

void TestSelectSkipsDirectoriesAndOtherEntries() {
  const std::vector<DirectoryEntry> listing = {{"0001_dir.sql", false}, {"0002_file.sql", true}};

  const auto selected = SelectCandidates("/m", listing);
  assert(selected.size() == 1);
  assert(selected[0].filename == "0002_file.sql");
}

void TestSelectUsesUnsignedByteOrder() {
  // 0xC3 (UTF-8 lead byte) must sort after ASCII 'z'
  const std::vector<DirectoryEntry> listing = {{"\xC3\xA9t\xC3\xA9.sql", true}, {"zeta.sql", true}, {"alpha.sql", true}};

  const auto selected = SelectCandidates("/m", listing);
  assert(selected.size() == 3);
  assert(selected[0].filename == "alpha.sql");
  assert(selected[1].filename == "zeta.sql");
  assert(selected[2].filename == "\xC3\xA9t\xC3\xA9.sql");
}

void TestSelectHonoursCustomExtension() {
  const std::vector<DirectoryEntry> listing = {{"0001_a.sql", true}, {"0001_a.pgsql", true}};

  const auto selected = SelectCandidates("/m", listing, ".pgsql");
  assert(selected.size() == 1);
  assert(selected[0].filename == "0001_a.pgsql");
}

void TestEmptyListingIsNotAnError() {
  auto fs = std::make_shared<FakeFileSystem>();
  fs->listing.push_back({"notes.txt", true});

  MigrationSource source(fs);
  assert(source.ListCandidates("/anywhere").empty());
}

void TestListingFailureIsSourceUnavailable() {
  auto fs          = std::make_shared<FakeFileSystem>();
  fs->fail_listing = true;

  MigrationSource source(fs);
  bool            threw = false;
  try {
    (void)source.ListCandidates("/locked");
  } catch (const sqlmigrate::util::SourceUnavailable& e) {
    threw = true;
    assert(e.Kind() == sqlmigrate::util::ErrorKind::kSourceUnavailable);
    assert(std::string(e.what()).find("/locked") != std::string::npos);
  }
  assert(threw && "listing failure must surface as SourceUnavailable");
}

void TestReadBodyAndReadError() {
  auto fs = std::make_shared<FakeFileSystem>();
  fs->listing.push_back({"0001_a.sql", true});
  fs->listing.push_back({"0002_gone.sql", true});
  fs->files["0001_a.sql"] = "CREATE TABLE a (id INT);";

  MigrationSource source(fs);
  const auto      candidates = source.ListCandidates("/m");
  assert(candidates.size() == 2);
  assert(source.ReadBody(candidates[0]) == "CREATE TABLE a (id INT);");

  bool threw = false;
  try {
    (void)source.ReadBody(candidates[1]);
  } catch (const sqlmigrate::util::ReadError& e) {
    threw = true;
    assert(e.Filename() == "0002_gone.sql");
    assert(e.Kind() == sqlmigrate::util::ErrorKind::kReadError);
  }
  assert(threw && "vanished file must surface as ReadError");
}

std::filesystem::path MakeTempDir(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto dir   = std::filesystem::temp_directory_path() / ("sqlmigrate_source_tests_" + name + "_" + std::to_string(stamp));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestLocalFileSystemEndToEnd() {
  const auto dir = MakeTempDir("local");
  std::ofstream(dir / "0002_b.sql") << "SELECT 2;";
  std::ofstream(dir / "0001_a.sql") << "SELECT 1;";
  std::ofstream(dir / "notes.txt") << "ignored";
  std::filesystem::create_directories(dir / "0003_subdir.sql");

  MigrationSource source(std::make_shared<LocalFileSystem>());
  const auto      candidates = source.ListCandidates(dir);
  assert(Names(candidates) == (std::vector<std::string>{"0001_a.sql", "0002_b.sql"}));
  assert(candidates[0].path.is_absolute());
  assert(source.ReadBody(candidates[1]) == "SELECT 2;");

  std::filesystem::remove(dir / "0001_a.sql");
  bool threw = false;
  try {
    (void)source.ReadBody(candidates[0]);
  } catch (const sqlmigrate::util::ReadError&) {
    threw = true;
  }
  assert(threw);

  std::filesystem::remove_all(dir);
}

void TestLocalFileSystemMissingDirectory() {
  MigrationSource source(std::make_shared<LocalFileSystem>());
  bool            threw = false;
  try {
    (void)source.ListCandidates(std::filesystem::temp_directory_path() / "sqlmigrate_definitely_missing_dir");
  } catch (const sqlmigrate::util::SourceUnavailable&) {
    threw = true;
  }
  assert(threw && "missing directory must surface as SourceUnavailable");
}

} // namespace

int main() {
  TestSelectFiltersByExtensionAndSortsByteWise();
  TestSelectSkipsDirectoriesAndOtherEntries();
  TestSelectUsesUnsignedByteOrder();
  TestSelectHonoursCustomExtension();
  TestEmptyListingIsNotAnError();
  TestListingFailureIsSourceUnavailable();
  TestReadBodyAndReadError();
  TestLocalFileSystemEndToEnd();
  TestLocalFileSystemMissingDirectory();

  std::cout << "sqlmigrate_unit_migration_source: pass\n";
  return 0;
}
