#pragma once

#include "loads/raw_load.hpp"

#include <string>

namespace loadwatch::notify {

// Notification sink for new profitable loads. Implementations own their own
// retry and rate-limit handling; the pipeline calls Notify() once per new
// item and treats `false` as a non-fatal per-item failure.
//
// Must be safe to call from several dispatch workers at once.
class INotifier {
public:
  virtual ~INotifier() = default;

  virtual bool Notify(const loads::RawLoad& load, const loads::ProfitabilityAnalysis& analysis,
                      std::string& error) = 0;
};

} // namespace loadwatch::notify
