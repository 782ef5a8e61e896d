#include "dispatch/sent_store.hpp"

namespace loadwatch::dispatch {

SentRecord BuildSentRecord(const loads::RawLoad& load,
                           const loads::ProfitabilityAnalysis& analysis,
                           const loads::LoadFingerprint& fingerprint,
                           const std::chrono::system_clock::time_point sent_at) {
  return SentRecord{
      .fingerprint = fingerprint,
      .external_id = load.external_id,
      .pickup = load.pickup,
      .delivery = load.delivery,
      .rate = load.rate,
      .miles = load.miles,
      .deadhead = load.deadhead,
      .equipment = load.equipment,
      .pickup_date = load.pickup_date,
      .profitability_score = analysis.profitability_score,
      .priority = analysis.priority,
      .sent_at = sent_at,
  };
}

const char* ToString(const MarkSentStatus status) {
  switch (status) {
  case MarkSentStatus::kInserted:
    return "inserted";
  case MarkSentStatus::kAlreadyExists:
    return "already_exists";
  case MarkSentStatus::kFailed:
    return "failed";
  }
  return "failed";
}

} // namespace loadwatch::dispatch
