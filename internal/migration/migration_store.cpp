#include "internal/migration/migration_store.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sqlmigrate::migration {

namespace {

std::string Describe(const db::Result& result) {
  return std::string(db::ToString(result.code)) + ": " + result.message;
}

} // namespace

MigrationStore::MigrationStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("MigrationStore requires a repository");
  }
}

void MigrationStore::EnsureSchema() {
  const auto& table = repository_->TrackingTable();
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->CreateTrackingTable(*tx);
    if (!result) {
      throw util::StoreUnavailable("cannot create tracking table '" + table + "': " + Describe(result));
    }
    tx->Commit();
  } catch (const util::MigrationError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreUnavailable("cannot create tracking table '" + table + "': " + e.what());
  }
}

std::vector<db::model::MigrationRecord> MigrationStore::ListRecords() {
  const auto& table = repository_->TrackingTable();
  std::vector<db::model::MigrationRecord> records;
  try {
    auto tx     = repository_->Begin();
    auto result = repository_->ListMigrationRecords(*tx, records);
    if (!result) {
      throw util::StoreUnavailable("cannot read tracking table '" + table + "': " + Describe(result));
    }
    tx->Commit();
  } catch (const util::MigrationError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreUnavailable("cannot read tracking table '" + table + "': " + e.what());
  }
  return records;
}

std::unordered_set<std::string> MigrationStore::ListApplied() {
  std::unordered_set<std::string> applied;
  for (auto& record : ListRecords()) {
    applied.insert(std::move(record.filename));
  }
  return applied;
}

void MigrationStore::RecordApplied(db::Transaction& tx, const std::string& filename) {
  db::model::MigrationRecord record;
  record.filename      = filename;
  record.applied_at_ms = util::ToUnixMillis(util::Now());

  auto result = repository_->InsertMigrationRecord(tx, record);
  if (result) {
    return;
  }
  if (result.code == db::ErrorCode::AlreadyExists) {
    throw util::DuplicateRecord(filename, "already recorded in '" + repository_->TrackingTable() + "': " + result.message);
  }
  throw util::ApplyError(filename, "cannot record migration: " + Describe(result));
}

} // namespace sqlmigrate::migration
