#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/migration/migration_reporter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using sqlmigrate::observability::IntField;
using sqlmigrate::observability::StringField;

namespace {

constexpr int kExitOk     = 0;
constexpr int kExitUsage  = 1;
constexpr int kExitFailed = 2;

struct CliOptions {
  std::string config_path = "sqlmigrate.yaml";
  std::string directory;
  std::string command = "up";
  bool        dry_run = false;
};

void Usage() {
  std::cerr << "Usage:\n"
            << "  sqlmigrate [--config <config.yaml>] [--dir <migrations_dir>] [--dry-run] [up]\n"
            << "  sqlmigrate [--config <config.yaml>] [--dir <migrations_dir>] status\n"
            << "\n"
            << "  up       apply every pending migration in filename order (default)\n"
            << "  status   list applied and pending migrations without applying anything\n";
}

bool ParseArgs(int argc, char** argv, CliOptions& options) {
  bool command_seen = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if ((arg == "--dir" || arg == "-d") && i + 1 < argc) {
      options.directory = argv[++i];
    } else if (arg == "--dry-run") {
      options.dry_run = true;
    } else if ((arg == "up" || arg == "status") && !command_seen) {
      options.command = arg;
      command_seen    = true;
    } else {
      return false;
    }
  }
  return !(options.dry_run && options.command == "status");
}

void PrintStatus(sqlmigrate::migration::MigrationRunner& runner, const sqlmigrate::migration::MigrationPlan& plan) {
  const auto records = runner.Store().ListRecords();

  std::unordered_set<std::string> on_disk;
  for (const auto& file : plan.candidates) {
    on_disk.insert(file.filename);
  }

  std::unordered_set<std::string> pending;
  for (const auto& file : plan.pending) {
    pending.insert(file.filename);
  }

  std::cout << std::left << std::setw(48) << "MIGRATION" << "STATUS\n";
  for (const auto& file : plan.candidates) {
    std::cout << std::setw(48) << file.filename;
    if (pending.count(file.filename)) {
      std::cout << "pending\n";
      continue;
    }
    for (const auto& record : records) {
      if (record.filename == file.filename) {
        std::cout << "applied " << sqlmigrate::util::FormatUnixMillis(record.applied_at_ms) << "\n";
        break;
      }
    }
  }

  // recorded in the database, gone from the directory
  for (const auto& record : records) {
    if (!on_disk.count(record.filename)) {
      std::cout << std::setw(48) << record.filename << "applied " << sqlmigrate::util::FormatUnixMillis(record.applied_at_ms)
                << " (file missing)\n";
    }
  }

  std::cout << "\nTotal migrations: " << plan.candidates.size() << "\n"
            << "Already applied:  " << plan.already_applied << "\n"
            << "Pending:          " << plan.pending.size() << "\n";
}

} // namespace

int main(int argc, char** argv) {
  CliOptions options;
  if (!ParseArgs(argc, argv, options)) {
    Usage();
    return kExitUsage;
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------
  sqlmigrate::runtime::config::RuntimeConfig config;
  try {
    config = sqlmigrate::config::ConfigLoader::LoadFromYaml(options.config_path);
  } catch (const std::exception& e) {
    std::cerr << "sqlmigrate: " << e.what() << std::endl;
    return kExitUsage;
  }
  if (!options.directory.empty()) {
    config.mutable_migrations()->set_directory(options.directory);
  }

  sqlmigrate::observability::InitializeLogging(config);

  int exit_code = kExitOk;
  try {
    // ------------------------------------------------------------
    // Build application (opens the database connection)
    // ------------------------------------------------------------
    auto        app       = sqlmigrate::factory::Build(config, std::make_shared<sqlmigrate::migration::LoggingReporter>());
    const auto& directory = config.migrations().directory();

    SQLMIGRATE_LOG_INFO("migration runner started", {StringField("backend", app.repository->BackendName()),
                                                     StringField("directory", directory), StringField("command", options.command)});

    if (options.command == "status") {
      PrintStatus(*app.runner, app.runner->Plan(directory));
    } else if (options.dry_run) {
      const auto plan = app.runner->Plan(directory);
      for (const auto& file : plan.pending) {
        SQLMIGRATE_LOG_INFO("would apply", {StringField("filename", file.filename)});
      }
      SQLMIGRATE_LOG_INFO("dry run complete", {IntField("total", static_cast<std::int64_t>(plan.candidates.size())),
                                               IntField("already_applied", static_cast<std::int64_t>(plan.already_applied)),
                                               IntField("pending", static_cast<std::int64_t>(plan.pending.size()))});
    } else {
      app.runner->Run(directory);
    }
  } catch (const sqlmigrate::util::MigrationError&) {
    // already reported with filename and cause by the LoggingReporter
    exit_code = kExitFailed;
  } catch (const std::exception& e) {
    SQLMIGRATE_LOG_ERROR("fatal error", {StringField("error", e.what())});
    exit_code = kExitFailed;
  }

  sqlmigrate::observability::ShutdownLogging();
  return exit_code;
}
