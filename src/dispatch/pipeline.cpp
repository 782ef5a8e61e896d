#include "dispatch/pipeline.hpp"

#include "core/errors/failure_class.hpp"
#include "core/logging/logger.hpp"
#include "core/shutdown_signal.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"
#include "loads/fingerprint.hpp"
#include "notify/notifier.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace loadwatch::dispatch {

namespace {

// How often the waiting caller re-checks the shutdown signal.
constexpr auto kStopPollInterval = std::chrono::milliseconds(50);

struct Candidate {
  loads::RawLoad load;
  loads::ProfitabilityAnalysis analysis;
  loads::LoadFingerprint fingerprint;
};

enum class ItemStatus {
  kUnresolved,
  kSent,
  kNotifyFailed,
};

struct ItemResult {
  ItemStatus status = ItemStatus::kUnresolved;
  MarkSentStatus persist_status = MarkSentStatus::kFailed;
  std::string notify_error;
  std::string persist_error;
};

struct PersistOutcome {
  MarkSentStatus status = MarkSentStatus::kFailed;
  std::string error;
};

PersistOutcome PersistRecord(ISentStore& store, const SentRecord& record) {
  PersistOutcome outcome;
  try {
    outcome.status = store.MarkSent(record, outcome.error);
  } catch (const std::exception& ex) {
    outcome.status = MarkSentStatus::kFailed;
    outcome.error = std::string("sent store threw: ") + ex.what();
  }
  return outcome;
}

// Tracks concurrent items so tests and logs can see the bound hold.
class InFlightGauge {
public:
  void Enter() {
    const std::uint32_t now = current_.fetch_add(1U) + 1U;
    std::uint32_t seen = peak_.load();
    while (now > seen && !peak_.compare_exchange_weak(seen, now)) {
    }
  }
  void Leave() {
    current_.fetch_sub(1U);
  }
  std::uint32_t peak() const {
    return peak_.load();
  }

private:
  std::atomic<std::uint32_t> current_{0};
  std::atomic<std::uint32_t> peak_{0};
};

// State shared between ProcessBatch() and its workers. Owned jointly so a
// worker still stuck in Notify() after the grace period never touches a dead
// stack frame.
struct BatchWork {
  std::vector<Candidate> items;
  std::chrono::system_clock::time_point sent_at;
  std::atomic<std::size_t> next_index{0};
  InFlightGauge gauge;

  std::mutex mu;
  std::condition_variable done_cv;
  // Guarded by `mu`.
  std::vector<ItemResult> results;
  std::size_t live_workers = 0;
  // Set by ProcessBatch() before it stops waiting. Once set, workers must not
  // touch the shutdown signal, which may already be gone.
  bool caller_gone = false;
};

ItemResult DispatchOne(const Candidate& candidate, std::chrono::system_clock::time_point sent_at,
                       ISentStore& store, notify::INotifier& notifier) {
  ItemResult result;
  const SentRecord record =
      BuildSentRecord(candidate.load, candidate.analysis, candidate.fingerprint, sent_at);
  std::future<PersistOutcome> persist =
      std::async(std::launch::async, PersistRecord, std::ref(store), std::cref(record));

  bool notified = false;
  try {
    notified = notifier.Notify(candidate.load, candidate.analysis, result.notify_error);
  } catch (const std::exception& ex) {
    result.notify_error = std::string("notifier threw: ") + ex.what();
  }

  PersistOutcome persisted = persist.get();
  result.persist_status = persisted.status;
  result.persist_error = std::move(persisted.error);
  result.status = notified ? ItemStatus::kSent : ItemStatus::kNotifyFailed;
  return result;
}

void RunWorker(const std::shared_ptr<BatchWork>& work, ISentStore& store,
               notify::INotifier& notifier, const core::ShutdownSignal& shutdown) {
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(work->mu);
      if (work->caller_gone || shutdown.StopRequested()) {
        break;
      }
    }
    const std::size_t index = work->next_index.fetch_add(1U);
    if (index >= work->items.size()) {
      break;
    }
    work->gauge.Enter();
    ItemResult result = DispatchOne(work->items[index], work->sent_at, store, notifier);
    work->gauge.Leave();

    std::lock_guard<std::mutex> lock(work->mu);
    work->results[index] = std::move(result);
  }

  {
    std::lock_guard<std::mutex> lock(work->mu);
    --work->live_workers;
  }
  work->done_cv.notify_all();
}

} // namespace

DispatchPipeline::DispatchPipeline(ISentStore& store, notify::INotifier& notifier,
                                   events::Emitter& emitter, core::logging::Logger& logger,
                                   const core::ShutdownSignal& shutdown, PipelineOptions options,
                                   WallClockFn wall_clock)
    : store_(store), notifier_(notifier), emitter_(emitter), logger_(logger), shutdown_(shutdown),
      options_(std::move(options)), wall_clock_(std::move(wall_clock)) {
  if (options_.max_in_flight == 0U) {
    options_.max_in_flight = 1U;
  }
  if (!wall_clock_) {
    wall_clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

DispatchSummary DispatchPipeline::ProcessBatch(const loads::LoadBatch& loads,
                                               const SearchCriteria& criteria) {
  DispatchSummary summary;
  std::vector<Candidate> pending;
  std::set<std::string> batch_fingerprints;

  for (const loads::RawLoad& load : loads) {
    const FilterVerdict verdict = ApplyCriteria(load, criteria);
    if (verdict != FilterVerdict::kAccepted) {
      ++summary.filtered_out;
      logger_.Debug("load filtered", {{"external_id", load.external_id},
                                      {"reason", ToString(verdict)}});
      continue;
    }

    Candidate candidate;
    candidate.analysis = loads::Evaluate(load, options_.estimator);
    if (!candidate.analysis.is_profitable) {
      ++summary.unprofitable;
      continue;
    }
    ++summary.attempted;

    candidate.fingerprint = loads::ComputeFingerprint(load);
    if (!batch_fingerprints.insert(candidate.fingerprint.hex).second) {
      ++summary.duplicates;
      continue;
    }

    bool known = false;
    std::string lookup_error;
    if (!store_.IsKnown(candidate.fingerprint, load.external_id, known, lookup_error)) {
      ++summary.failed;
      logger_.Warn("sent-store lookup failed; skipping load",
                   {{"class", core::errors::ToStableCode(core::errors::FailureClass::kItemDispatch)},
                    {"external_id", load.external_id},
                    {"fingerprint", candidate.fingerprint.hex},
                    {"error", lookup_error}});
      std::string emit_error;
      if (!emitter_.EmitDispatchOutcome(
              events::Emitter::DispatchOutcomeEvent{
                  .ts = wall_clock_(),
                  .dispatched = false,
                  .external_id = load.external_id,
                  .fingerprint = candidate.fingerprint.hex,
                  .stage = "lookup",
                  .error = lookup_error,
              },
              emit_error)) {
        logger_.Warn("failed to append dispatch event", {{"error", emit_error}});
      }
      continue;
    }
    if (known) {
      ++summary.duplicates;
      continue;
    }
    candidate.load = load;
    pending.push_back(std::move(candidate));
  }

  if (pending.empty()) {
    return summary;
  }

  auto work = std::make_shared<BatchWork>();
  work->sent_at = wall_clock_();
  work->results.resize(pending.size());
  work->items = std::move(pending);

  const std::size_t worker_count =
      std::min<std::size_t>(options_.max_in_flight, work->items.size());
  work->live_workers = worker_count;
  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(RunWorker, work, std::ref(store_), std::ref(notifier_),
                         std::cref(shutdown_));
  }

  // Wait for every worker. After a stop request the wait is bounded by the
  // grace period; items still unresolved then are abandoned.
  std::vector<ItemResult> results;
  bool grace_expired = false;
  {
    std::unique_lock<std::mutex> lock(work->mu);
    std::optional<std::chrono::steady_clock::time_point> deadline;
    while (work->live_workers > 0U) {
      const auto now = std::chrono::steady_clock::now();
      if (!deadline.has_value() && shutdown_.StopRequested()) {
        deadline = now + std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                             std::chrono::duration<double>(options_.shutdown_grace_s));
      }
      if (deadline.has_value() && now >= *deadline) {
        grace_expired = true;
        break;
      }
      std::chrono::steady_clock::time_point wake = now + kStopPollInterval;
      if (deadline.has_value() && *deadline < wake) {
        wake = *deadline;
      }
      work->done_cv.wait_until(lock, wake);
    }
    work->caller_gone = true;
    results = work->results;
  }
  summary.peak_in_flight = work->gauge.peak();

  for (std::thread& thread : workers) {
    if (grace_expired) {
      thread.detach();
    } else {
      thread.join();
    }
  }
  if (grace_expired) {
    logger_.Warn("shutdown grace period expired; leaving dispatch workers behind",
                 {{"grace_s", core::FormatSeconds(std::chrono::duration<double>(
                                  options_.shutdown_grace_s))}});
  }

  const std::vector<Candidate>& items = work->items;
  for (std::size_t i = 0; i < items.size(); ++i) {
    const Candidate& candidate = items[i];
    const ItemResult& result = results[i];
    const loads::RawLoad& load = candidate.load;

    if (result.status == ItemStatus::kUnresolved) {
      ++summary.abandoned;
      continue;
    }

    if (result.persist_status == MarkSentStatus::kAlreadyExists) {
      logger_.Debug("fingerprint recorded concurrently",
                    {{"class", core::errors::ToStableCode(core::errors::FailureClass::kDedupConflict)},
                     {"external_id", load.external_id},
                     {"fingerprint", candidate.fingerprint.hex}});
    } else if (result.persist_status == MarkSentStatus::kFailed) {
      ++summary.persist_failures;
      logger_.Warn("failed to persist sent record",
                   {{"external_id", load.external_id},
                    {"fingerprint", candidate.fingerprint.hex},
                    {"error", result.persist_error}});
    }

    std::string emit_error;
    bool emitted = true;
    if (result.status == ItemStatus::kSent) {
      ++summary.sent;
      logger_.Info("load dispatched", {{"external_id", load.external_id},
                                       {"priority", loads::ToString(candidate.analysis.priority)},
                                       {"pickup", load.pickup},
                                       {"delivery", load.delivery}});
      emitted = emitter_.EmitDispatchOutcome(
          events::Emitter::DispatchOutcomeEvent{
              .ts = work->sent_at,
              .dispatched = true,
              .external_id = load.external_id,
              .fingerprint = candidate.fingerprint.hex,
              .priority = loads::ToString(candidate.analysis.priority),
              .rate_per_mile = candidate.analysis.rate_per_mile,
              .persisted = result.persist_status != MarkSentStatus::kFailed,
          },
          emit_error);
    } else {
      ++summary.failed;
      logger_.Warn("notify failed", {{"class", core::errors::ToStableCode(
                                                   core::errors::FailureClass::kItemDispatch)},
                                     {"external_id", load.external_id},
                                     {"fingerprint", candidate.fingerprint.hex},
                                     {"error", result.notify_error}});
      emitted = emitter_.EmitDispatchOutcome(
          events::Emitter::DispatchOutcomeEvent{
              .ts = work->sent_at,
              .dispatched = false,
              .external_id = load.external_id,
              .fingerprint = candidate.fingerprint.hex,
              .stage = "notify",
              .error = result.notify_error,
          },
          emit_error);
    }
    if (!emitted) {
      logger_.Warn("failed to append dispatch event", {{"error", emit_error}});
    }
  }

  if (summary.abandoned > 0U) {
    logger_.Warn("shutdown requested; dispatch items abandoned",
                 {{"abandoned", std::to_string(summary.abandoned)}});
  }
  return summary;
}

} // namespace loadwatch::dispatch
