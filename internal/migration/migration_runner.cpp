#include "internal/migration/migration_runner.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace sqlmigrate::migration {

MigrationRunner::MigrationRunner(std::shared_ptr<db::Repository> repository, std::shared_ptr<const MigrationSource> source,
                                 std::shared_ptr<MigrationReporter> reporter)
    : repository_(repository),
      source_(std::move(source)),
      reporter_(reporter ? std::move(reporter) : std::make_shared<MigrationReporter>()),
      store_(std::move(repository)) {
  if (!source_) {
    throw std::invalid_argument("MigrationRunner requires a migration source");
  }
}

void MigrationRunner::Transition(RunState next) {
  const auto previous = state_;
  state_              = next;
  reporter_->OnStateChange(previous, next);
}

MigrationPlan MigrationRunner::Scan(const std::filesystem::path& directory) {
  Transition(RunState::kScanning);

  const auto applied = store_.ListApplied();

  MigrationPlan plan;
  plan.candidates = source_->ListCandidates(directory);
  for (const auto& file : plan.candidates) {
    if (applied.count(file.filename)) {
      ++plan.already_applied;
      reporter_->OnSkipped(file);
      continue;
    }
    plan.pending.push_back(file);
  }
  return plan;
}

MigrationPlan MigrationRunner::Plan(const std::filesystem::path& directory) {
  state_ = RunState::kIdle;
  try {
    store_.EnsureSchema();
    Transition(RunState::kSchemaReady);
    reporter_->OnSchemaReady(repository_->TrackingTable());

    auto plan = Scan(directory);
    Transition(RunState::kDone);
    return plan;
  } catch (const util::MigrationError& e) {
    Transition(RunState::kFailed);
    reporter_->OnFailed(e);
    throw;
  }
}

MigrationSummary MigrationRunner::Run(const std::filesystem::path& directory) {
  state_ = RunState::kIdle;
  try {
    store_.EnsureSchema();
    Transition(RunState::kSchemaReady);
    reporter_->OnSchemaReady(repository_->TrackingTable());

    const auto plan = Scan(directory);

    MigrationSummary summary;
    summary.total_candidates = plan.candidates.size();
    summary.already_applied  = plan.already_applied;

    for (std::size_t i = 0; i < plan.pending.size(); ++i) {
      Apply(plan.pending[i], i, plan.pending.size());
      ++summary.newly_applied;
    }

    Transition(RunState::kDone);
    reporter_->OnSummary(summary);
    return summary;
  } catch (const util::MigrationError& e) {
    Transition(RunState::kFailed);
    reporter_->OnFailed(e);
    throw;
  }
}

void MigrationRunner::Apply(const MigrationFile& file, std::size_t index, std::size_t pending) {
  Transition(RunState::kApplying);
  reporter_->OnApplying(file, index, pending);

  // read before the transaction opens; a vanished file aborts the run here
  const std::string body    = source_->ReadBody(file);
  const auto        started = util::Now();

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const std::exception& e) {
    throw util::ApplyError(file.filename, std::string("cannot begin transaction: ") + e.what());
  }

  auto result = repository_->ExecuteScript(*tx, body);
  if (!result) {
    RollBack(*tx, file);
    throw util::ApplyError(file.filename, result.message.empty() ? std::string(db::ToString(result.code)) : result.message);
  }

  try {
    store_.RecordApplied(*tx, file.filename);
  } catch (const util::ApplyError&) {
    RollBack(*tx, file);
    throw;
  }

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    RollBack(*tx, file);
    throw util::ApplyError(file.filename, std::string("commit failed: ") + e.what());
  }

  Transition(RunState::kCommitted);
  reporter_->OnApplied(file, std::chrono::duration_cast<std::chrono::milliseconds>(util::Now() - started));
}

void MigrationRunner::RollBack(db::Transaction& tx, const MigrationFile& file) {
  try {
    tx.Rollback();
  } catch (const std::exception& e) {
    // the transaction destructor retries; the original failure is what gets reported
    SQLMIGRATE_LOG_WARN("rollback failed", {observability::StringField("filename", file.filename), observability::StringField("error", e.what())});
  }
  Transition(RunState::kRolledBack);
}

} // namespace sqlmigrate::migration
