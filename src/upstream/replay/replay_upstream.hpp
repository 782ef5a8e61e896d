#pragma once

#include "upstream/upstream.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace loadwatch::upstream::replay {

// Fault knobs for local soak runs and integration tests.
struct ReplayFaults {
  // Fail every Nth fetch (1-based). 0 disables.
  std::uint32_t fail_every_n = 0;
  // Fail the first N fetches.
  std::uint32_t fail_first_n = 0;
  std::string fail_error = "connection reset by peer";
  // Simulated fetch latency. Above the strategy timeout the fetch times out.
  std::uint32_t latency_ms = 0;
  // Session expires after this many successful fetches. 0 disables.
  std::uint32_t session_expires_after = 0;
  // Number of times each lifecycle step fails before it starts succeeding.
  std::uint32_t rebuild_failures = 0;
  std::uint32_t authenticate_failures = 0;
  std::uint32_t probe_failures = 0;
};

// Parsed fixture: scripted batches plus fault knobs.
struct ReplayFixture {
  std::vector<loads::LoadBatch> batches;
  // Wrap around after the last batch; otherwise later fetches return empty.
  bool loop = false;
  ReplayFaults faults;
};

// Fixture shape:
//   {
//     "loop": true,
//     "faults": {"fail_every_n": 0, "latency_ms": 0, ...},
//     "batches": [[{"external_id": "A1", "pickup": "Dallas, TX",
//                   "delivery": "Atlanta, GA", "miles": 780 | "780 mi",
//                   "deadhead": 20 | "20 DH", "rate": 1900 | "$1,900" | null,
//                   "equipment": "Van", "pickup_date": "10/21"}]]
//   }
// String-valued miles/deadhead/rate go through the scraped-text parsers.
bool ParseReplayFixture(std::string_view text, ReplayFixture& fixture, std::string& error);
bool LoadReplayFixture(const std::filesystem::path& path, ReplayFixture& fixture,
                       std::string& error);

// Deterministic fixture-driven upstream with session lifecycle.
//
// Strict about session state so the recovery path is exercised for real:
// FetchBatch() fails until Rebuild() and Authenticate() have both succeeded,
// and Teardown() drops the session again.
class ReplayUpstream final : public IUpstream, public ISessionLifecycle {
public:
  using WallClockFn = std::function<std::chrono::system_clock::time_point()>;

  explicit ReplayUpstream(ReplayFixture fixture, WallClockFn wall_clock = {});

  bool FetchBatch(const adaptive::ScanStrategy& strategy, loads::LoadBatch& loads,
                  std::string& error) override;

  bool Teardown(std::string& error) override;
  bool Rebuild(std::string& error) override;
  bool Authenticate(std::string& error) override;
  bool Probe(std::string& error) override;

  std::uint64_t fetch_count() const;
  bool session_ready() const;

private:
  ReplayFixture fixture_;
  WallClockFn wall_clock_;
  mutable std::mutex mu_;
  bool built_ = false;
  bool authenticated_ = false;
  std::uint64_t fetch_count_ = 0;
  std::uint64_t next_batch_ = 0;
  std::uint32_t fetches_since_auth_ = 0;
  std::uint32_t rebuild_failures_seen_ = 0;
  std::uint32_t authenticate_failures_seen_ = 0;
  std::uint32_t probe_failures_seen_ = 0;
};

} // namespace loadwatch::upstream::replay
