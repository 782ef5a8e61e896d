#pragma once

#include "loads/fingerprint.hpp"
#include "loads/raw_load.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>
#include <string>

namespace loadwatch::dispatch {

// Durable marker that a load was notified. Created once per fingerprint,
// never mutated, removed only by the retention sweep.
struct SentRecord {
  loads::LoadFingerprint fingerprint;
  std::string external_id;
  std::string pickup;
  std::string delivery;
  std::optional<double> rate;
  double miles = 0.0;
  double deadhead = 0.0;
  std::string equipment;
  std::optional<std::string> pickup_date;
  double profitability_score = 0.0;
  loads::PriorityTier priority = loads::PriorityTier::kLow;
  std::chrono::system_clock::time_point sent_at{};
};

SentRecord BuildSentRecord(const loads::RawLoad& load,
                           const loads::ProfitabilityAnalysis& analysis,
                           const loads::LoadFingerprint& fingerprint,
                           std::chrono::system_clock::time_point sent_at);

enum class MarkSentStatus {
  kInserted,
  // Unique constraint hit: another dispatcher recorded this fingerprint first.
  kAlreadyExists,
  kFailed,
};

const char* ToString(MarkSentStatus status);

// Persistence of the "already sent" set. The store itself enforces
// fingerprint uniqueness so a concurrent check-then-insert cannot produce two
// records for one load, even across process instances sharing the store.
class ISentStore {
public:
  virtual ~ISentStore() = default;

  // Sets `known` when a record with this fingerprint or external id exists.
  virtual bool IsKnown(const loads::LoadFingerprint& fingerprint, std::string_view external_id,
                       bool& known, std::string& error) = 0;

  // Safe to call concurrently with distinct fingerprints.
  virtual MarkSentStatus MarkSent(const SentRecord& record, std::string& error) = 0;

  // Deletes records with sent_at older than `cutoff`.
  virtual bool PurgeOlderThan(std::chrono::system_clock::time_point cutoff, std::uint64_t& removed,
                              std::string& error) = 0;
};

} // namespace loadwatch::dispatch
