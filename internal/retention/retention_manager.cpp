#include "retention_manager.hpp"

#include <string>
#include <vector>

#include "internal/core/transact.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace forecast::retention {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

} // namespace

RetentionManager::RetentionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<archive::ArchivalBackend> backend,
                                   std::shared_ptr<util::TimeSource> clock, RetentionOptions options)
    : repository_(std::move(repository)), backend_(std::move(backend)), clock_(std::move(clock)), options_(std::move(options)) {
  if (options_.archival_enabled && !backend_) {
    throw util::ConfigurationError("archival is enabled but no archival backend is configured");
  }
  if (options_.batch_size == 0) {
    throw util::ConfigurationError("retention batch size must be positive");
  }
}

int64_t RetentionManager::Cutoff(int64_t now_ms) const {
  return now_ms - static_cast<int64_t>(options_.retention_days) * kMillisPerDay;
}

RetentionSummary RetentionManager::Run(std::stop_token stop, std::optional<bool> dry_run) {
  observability::SpanScope span("retention.run");

  const auto started  = std::chrono::steady_clock::now();
  const bool time_box = options_.run_timeout.count() > 0;
  const auto deadline = started + options_.run_timeout;

  RetentionSummary summary;
  summary.dry_run   = dry_run.value_or(options_.dry_run);
  summary.cutoff_ms = Cutoff(clock_->NowMillis());

  summary.eligible =
      core::Transact(*repository_, [&](db::Transaction& tx) { return repository_->CountRawIntakeBefore(tx, summary.cutoff_ms); });

  const auto finish = [&] {
    summary.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordRetentionRecords("archived", summary.archived);
    metrics.RecordRetentionRecords("deleted", summary.deleted);
    metrics.RecordRetentionRecords("errors", summary.errors);
    metrics.ObserveRetentionDurationMs(static_cast<double>(summary.duration_ms));

    FORECAST_LOG_INFO("Retention run finished",
                      {IntField("eligible", static_cast<int64_t>(summary.eligible)), IntField("archived", static_cast<int64_t>(summary.archived)),
                       IntField("deleted", static_cast<int64_t>(summary.deleted)), IntField("errors", static_cast<int64_t>(summary.errors)),
                       IntField("batches", summary.batches), IntField("failed_batches", summary.failed_batches),
                       BoolField("dry_run", summary.dry_run), BoolField("cancelled", summary.cancelled),
                       IntField("duration_ms", summary.duration_ms)});
    return summary;
  };

  if (summary.eligible == 0) {
    return finish();
  }

  std::optional<db::model::IntakeCursor> cursor;
  while (true) {
    if (stop.stop_requested() || (time_box && std::chrono::steady_clock::now() >= deadline)) {
      summary.cancelled = true;
      break;
    }

    const auto batch = core::Transact(*repository_, [&](db::Transaction& tx) {
      return repository_->ListRawIntakeBefore(tx, summary.cutoff_ms, cursor, options_.batch_size);
    });
    if (batch.empty()) {
      break;
    }

    // Advance first so a failed batch is skipped rather than re-read.
    cursor = db::model::IntakeCursor{batch.back().ingested_at_ms, batch.back().id};
    ++summary.batches;

    if (summary.dry_run) {
      continue;
    }

    if (options_.archival_enabled) {
      try {
        const auto receipt = backend_->ArchiveBatch(batch);
        summary.archived += batch.size();
        span.AddEvent("archived " + receipt.archive_id);
      } catch (const std::exception& ex) {
        summary.errors += batch.size();
        ++summary.failed_batches;
        FORECAST_LOG_ERROR("Archiving retention batch failed, batch kept",
                           {IntField("batch", summary.batches), IntField("records", static_cast<int64_t>(batch.size())),
                            StringField("error", ex.what())});
        continue;
      }
    }

    std::vector<std::string> ids;
    ids.reserve(batch.size());
    for (const auto& record : batch) {
      ids.push_back(record.id);
    }

    try {
      core::Transact(*repository_, [&](db::Transaction& tx) { core::ThrowIfDbError(repository_->DeleteRawIntake(tx, ids), "delete raw intake"); });
      summary.deleted += batch.size();
    } catch (const std::exception& ex) {
      summary.errors += batch.size();
      ++summary.failed_batches;
      FORECAST_LOG_ERROR("Deleting retention batch failed",
                         {IntField("batch", summary.batches), IntField("records", static_cast<int64_t>(batch.size())),
                          StringField("error", ex.what())});
    }
  }

  return finish();
}

RetentionStats RetentionManager::GetRetentionStats() {
  const auto cutoff = Cutoff(clock_->NowMillis());
  const auto stats  = core::Transact(*repository_, [&](db::Transaction& tx) { return repository_->GetIntakeStats(tx, cutoff); });

  return RetentionStats{
      .eligible         = stats.eligible,
      .total            = stats.total,
      .oldest_ingest_ms = stats.oldest_ingest_ms,
      .newest_ingest_ms = stats.newest_ingest_ms,
      .cutoff_ms        = cutoff,
      .retention_days   = options_.retention_days,
  };
}

} // namespace forecast::retention
