#include "internal/migration/migration_reporter.hpp"

#include "internal/observability/logging.hpp"

namespace sqlmigrate::migration {

using observability::IntField;
using observability::StringField;

void LoggingReporter::OnSchemaReady(const std::string& tracking_table) {
  SQLMIGRATE_LOG_INFO("tracking table ready", {StringField("table", tracking_table)});
}

void LoggingReporter::OnSkipped(const MigrationFile& file) {
  SQLMIGRATE_LOG_DEBUG("already applied", {StringField("filename", file.filename)});
}

void LoggingReporter::OnApplying(const MigrationFile& file, std::size_t index, std::size_t pending) {
  SQLMIGRATE_LOG_INFO("applying migration", {StringField("filename", file.filename), IntField("position", static_cast<std::int64_t>(index + 1)),
                                             IntField("pending", static_cast<std::int64_t>(pending))});
}

void LoggingReporter::OnApplied(const MigrationFile& file, std::chrono::milliseconds elapsed) {
  SQLMIGRATE_LOG_INFO("migration applied", {StringField("filename", file.filename), IntField("elapsed_ms", elapsed.count())});
}

void LoggingReporter::OnFailed(const util::MigrationError& error) {
  if (const auto* file_error = dynamic_cast<const util::FileError*>(&error)) {
    SQLMIGRATE_LOG_ERROR("migration failed", {StringField("kind", util::ToString(error.Kind())), StringField("filename", file_error->Filename()),
                                              StringField("error", file_error->Cause())});
    return;
  }
  SQLMIGRATE_LOG_ERROR("migration failed", {StringField("kind", util::ToString(error.Kind())), StringField("error", error.what())});
}

void LoggingReporter::OnSummary(const MigrationSummary& summary) {
  SQLMIGRATE_LOG_INFO("migration summary", {IntField("total", static_cast<std::int64_t>(summary.total_candidates)),
                                            IntField("already_applied", static_cast<std::int64_t>(summary.already_applied)),
                                            IntField("newly_applied", static_cast<std::int64_t>(summary.newly_applied))});
  if (summary.newly_applied == 0) {
    SQLMIGRATE_LOG_INFO("database is up to date");
  }
}

} // namespace sqlmigrate::migration
