#pragma once

#include "notify/notifier.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>

namespace loadwatch::notify {

// Writes one structured notification per line to an outbox file. A separate
// chat relay tails the outbox and owns formatting and delivery retries.
class JsonlOutboxNotifier final : public INotifier {
public:
  using WallClockFn = std::function<std::chrono::system_clock::time_point()>;

  explicit JsonlOutboxNotifier(std::filesystem::path outbox_path, WallClockFn wall_clock = {});

  bool Notify(const loads::RawLoad& load, const loads::ProfitabilityAnalysis& analysis,
              std::string& error) override;

  const std::filesystem::path& outbox_path() const {
    return outbox_path_;
  }

private:
  std::filesystem::path outbox_path_;
  WallClockFn wall_clock_;
  std::mutex mu_;
};

// One outbox line (no trailing newline). Exposed for tests.
std::string BuildOutboxJson(const loads::RawLoad& load,
                            const loads::ProfitabilityAnalysis& analysis,
                            std::chrono::system_clock::time_point queued_at);

} // namespace loadwatch::notify
