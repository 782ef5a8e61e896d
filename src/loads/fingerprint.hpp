#pragma once

#include "loads/raw_load.hpp"

#include <string>

namespace loadwatch::loads {

// Dedup key for one real-world load: 16 lowercase hex chars of FNV-1a 64 over
// `external_id|pickup|delivery|rate|miles|deadhead`.
struct LoadFingerprint {
  std::string hex;

  bool operator==(const LoadFingerprint& other) const = default;
  bool operator<(const LoadFingerprint& other) const {
    return hex < other.hex;
  }
};

// Canonical pre-hash text. Exposed for diagnostics and tests.
std::string BuildFingerprintSource(const RawLoad& load);

LoadFingerprint ComputeFingerprint(const RawLoad& load);

} // namespace loadwatch::loads
