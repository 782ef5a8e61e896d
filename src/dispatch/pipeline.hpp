#pragma once

#include "dispatch/search_criteria.hpp"
#include "dispatch/sent_store.hpp"
#include "loads/profitability.hpp"
#include "loads/raw_load.hpp"

#include <chrono>
#include <cstdint>
#include <functional>

namespace loadwatch::core {
class ShutdownSignal;
}

namespace loadwatch::core::logging {
class Logger;
}

namespace loadwatch::events {
class Emitter;
}

namespace loadwatch::notify {
class INotifier;
}

namespace loadwatch::dispatch {

constexpr std::uint32_t kDefaultMaxInFlight = 5U;
constexpr double kDefaultShutdownGraceS = 10.0;

// Per-batch accounting. `attempted` and `sent` are the headline numbers; the
// rest explain where the other candidates went.
struct DispatchSummary {
  // Candidates that passed the filter and were profitable (known ones included).
  std::uint64_t attempted = 0;
  // Items whose notify succeeded.
  std::uint64_t sent = 0;
  std::uint64_t filtered_out = 0;
  std::uint64_t unprofitable = 0;
  std::uint64_t duplicates = 0;
  // Lookup or notify failures.
  std::uint64_t failed = 0;
  // Notified but not recorded. Counted in `sent` as well.
  std::uint64_t persist_failures = 0;
  // Unresolved at shutdown: never started, or still in flight when the grace
  // period ran out.
  std::uint64_t abandoned = 0;
  // Highest number of items observed in flight at once.
  std::uint32_t peak_in_flight = 0;
};

struct PipelineOptions {
  std::uint32_t max_in_flight = kDefaultMaxInFlight;
  loads::EstimatorConfig estimator;
  // How long ProcessBatch() keeps waiting for in-flight items once shutdown
  // is requested.
  double shutdown_grace_s = kDefaultShutdownGraceS;
};

// Filter, score, dedup and dispatch one scan batch.
//
// Lookups run on the calling thread in batch order. New candidates are then
// drained by at most `max_in_flight` worker threads; for each item Notify()
// and MarkSent() run in parallel with each other. Workers only fill their own
// result slot; counters are aggregated on the calling thread afterwards.
//
// Without a stop request ProcessBatch() returns once every item resolved.
// After one, workers take no new items and the wait is capped at
// `shutdown_grace_s`; workers still blocked then are detached and their items
// count as abandoned. Detached workers keep using the store and notifier, so
// both must outlive the pipeline.
class DispatchPipeline {
public:
  using WallClockFn = std::function<std::chrono::system_clock::time_point()>;

  DispatchPipeline(ISentStore& store, notify::INotifier& notifier, events::Emitter& emitter,
                   core::logging::Logger& logger, const core::ShutdownSignal& shutdown,
                   PipelineOptions options = {}, WallClockFn wall_clock = {});

  DispatchSummary ProcessBatch(const loads::LoadBatch& loads, const SearchCriteria& criteria);

  const PipelineOptions& options() const {
    return options_;
  }

private:
  ISentStore& store_;
  notify::INotifier& notifier_;
  events::Emitter& emitter_;
  core::logging::Logger& logger_;
  const core::ShutdownSignal& shutdown_;
  PipelineOptions options_;
  WallClockFn wall_clock_;
};

} // namespace loadwatch::dispatch
