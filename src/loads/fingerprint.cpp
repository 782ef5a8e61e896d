#include "loads/fingerprint.hpp"

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace loadwatch::loads {

namespace {

constexpr std::uint64_t kFnv1a64OffsetBasis = 14695981039346656037ULL;
constexpr std::uint64_t kFnv1a64Prime = 1099511628211ULL;

// Whole values up to here convert to long long exactly.
constexpr double kMaxIntegralDistance = 9.0e15;

// Whole mile counts render without a fraction so "450" and "450.0" hash alike.
// Anything larger keeps the fixed form rather than overflowing the cast.
std::string FormatDistance(const double value) {
  std::ostringstream out;
  if (std::isfinite(value) && std::floor(value) == value &&
      std::fabs(value) <= kMaxIntegralDistance) {
    out << static_cast<long long>(value);
  } else {
    out << std::fixed << std::setprecision(2) << value;
  }
  return out.str();
}

std::string FormatRate(const std::optional<double>& rate) {
  if (!rate.has_value()) {
    return "";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << rate.value();
  return out.str();
}

} // namespace

std::string BuildFingerprintSource(const RawLoad& load) {
  std::string source;
  source.reserve(load.external_id.size() + load.pickup.size() + load.delivery.size() + 32U);
  source += load.external_id;
  source += '|';
  source += load.pickup;
  source += '|';
  source += load.delivery;
  source += '|';
  source += FormatRate(load.rate);
  source += '|';
  source += FormatDistance(load.miles);
  source += '|';
  source += FormatDistance(load.deadhead);
  return source;
}

LoadFingerprint ComputeFingerprint(const RawLoad& load) {
  std::uint64_t hash = kFnv1a64OffsetBasis;
  for (const char c : BuildFingerprintSource(load)) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
    hash *= kFnv1a64Prime;
  }

  std::ostringstream out;
  out << std::hex << std::nouppercase << std::setw(16) << std::setfill('0') << hash;
  return LoadFingerprint{.hex = out.str()};
}

} // namespace loadwatch::loads
