#ifndef LOADWATCH_TESTS_COMMON_FAKES_HPP_
#define LOADWATCH_TESTS_COMMON_FAKES_HPP_

#include "core/clock.hpp"
#include "core/shutdown_signal.hpp"
#include "dispatch/sent_store.hpp"
#include "loads/raw_load.hpp"
#include "notify/alert_sink.hpp"
#include "notify/notifier.hpp"
#include "upstream/upstream.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace loadwatch::tests::common {

inline loads::RawLoad MakeLoad(std::string external_id, std::string pickup, std::string delivery,
                               const double miles, const double deadhead,
                               const std::optional<double> rate,
                               std::string equipment = "Dry Van") {
  loads::RawLoad load;
  load.external_id = std::move(external_id);
  load.pickup = std::move(pickup);
  load.delivery = std::move(delivery);
  load.miles = miles;
  load.deadhead = deadhead;
  load.rate = rate;
  load.equipment = std::move(equipment);
  return load;
}

// Clock whose SleepFor() advances time instantly. Stops early when the
// shutdown signal is already set or `on_sleep` requests it.
class ManualClock final : public core::Clock {
public:
  explicit ManualClock(WallTimePoint wall_start = WallTimePoint(std::chrono::hours(24 * 365 * 50)))
      : wall_start_(wall_start) {}

  TimePoint Now() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return TimePoint(elapsed_);
  }

  WallTimePoint WallNow() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return wall_start_ + std::chrono::duration_cast<std::chrono::system_clock::duration>(elapsed_);
  }

  bool SleepFor(Duration duration, const core::ShutdownSignal& shutdown) override {
    if (shutdown.StopRequested()) {
      return false;
    }
    std::function<void(Duration)> hook;
    {
      std::lock_guard<std::mutex> lock(mu_);
      elapsed_ += duration;
      sleeps_.push_back(duration);
      hook = on_sleep;
    }
    if (hook) {
      hook(duration);
    }
    return !shutdown.StopRequested();
  }

  void Advance(Duration duration) {
    std::lock_guard<std::mutex> lock(mu_);
    elapsed_ += duration;
  }

  std::vector<double> SleepSeconds() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<double> seconds;
    seconds.reserve(sleeps_.size());
    for (const auto& sleep : sleeps_) {
      seconds.push_back(std::chrono::duration<double>(sleep).count());
    }
    return seconds;
  }

  // Invoked after each sleep, outside the clock lock.
  std::function<void(Duration)> on_sleep;

private:
  mutable std::mutex mu_;
  WallTimePoint wall_start_;
  Duration elapsed_{0};
  std::vector<Duration> sleeps_;
};

// Upstream and session lifecycle driven by a script. Fetches past the end of
// the script return `fallback` (empty by default).
class ScriptedUpstream final : public upstream::IUpstream, public upstream::ISessionLifecycle {
public:
  struct FetchStep {
    bool ok = true;
    std::string error;
    loads::LoadBatch loads;
    // Simulated response time added to the clock before returning.
    double response_time_s = 0.0;
  };

  explicit ScriptedUpstream(ManualClock* clock = nullptr) : clock_(clock) {}

  bool FetchBatch(const adaptive::ScanStrategy& /*strategy*/, loads::LoadBatch& batch,
                  std::string& error) override {
    ++fetch_calls;
    FetchStep step;
    if (!fetch_script.empty()) {
      step = std::move(fetch_script.front());
      fetch_script.pop_front();
    } else {
      step = fallback;
    }
    if (clock_ != nullptr && step.response_time_s > 0.0) {
      clock_->Advance(core::SecondsToDuration(step.response_time_s));
    }
    if (!step.ok) {
      error = step.error;
      return false;
    }
    error.clear();
    batch = std::move(step.loads);
    return true;
  }

  bool Teardown(std::string& error) override {
    return Step("teardown", teardown_failures, "teardown failed", error);
  }
  bool Rebuild(std::string& error) override {
    return Step("rebuild", rebuild_failures, "connection refused", error);
  }
  bool Authenticate(std::string& error) override {
    return Step("authenticate", authenticate_failures, "access denied: login rejected", error);
  }
  bool Probe(std::string& error) override {
    return Step("probe", probe_failures, "probe timed out", error);
  }

  std::deque<FetchStep> fetch_script;
  FetchStep fallback;
  std::uint32_t fetch_calls = 0;

  // Remaining failures per lifecycle step.
  std::uint32_t teardown_failures = 0;
  std::uint32_t rebuild_failures = 0;
  std::uint32_t authenticate_failures = 0;
  std::uint32_t probe_failures = 0;
  std::vector<std::string> lifecycle_calls;
  // Runs at the start of each lifecycle step.
  std::function<void(std::string_view)> on_lifecycle;

private:
  bool Step(std::string_view name, std::uint32_t& failures_left, std::string_view failure,
            std::string& error) {
    lifecycle_calls.emplace_back(name);
    if (on_lifecycle) {
      on_lifecycle(name);
    }
    if (failures_left > 0U) {
      --failures_left;
      error = std::string(failure);
      return false;
    }
    error.clear();
    return true;
  }

  ManualClock* clock_ = nullptr;
};

// Records notifications and tracks how many Notify() calls overlapped.
class RecordingNotifier final : public notify::INotifier {
public:
  bool Notify(const loads::RawLoad& load, const loads::ProfitabilityAnalysis& /*analysis*/,
              std::string& error) override {
    const std::uint32_t now_active = active_.fetch_add(1U) + 1U;
    std::uint32_t seen = max_concurrent_.load();
    while (now_active > seen && !max_concurrent_.compare_exchange_weak(seen, now_active)) {
    }
    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    if (on_notify) {
      on_notify(load);
    }

    bool ok = true;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (fail_ids.count(load.external_id) != 0U) {
        ok = false;
      } else {
        notified_ids_.push_back(load.external_id);
      }
    }
    active_.fetch_sub(1U);
    if (!ok) {
      error = "notification channel rejected " + load.external_id;
      return false;
    }
    error.clear();
    return true;
  }

  std::vector<std::string> NotifiedIds() const {
    std::lock_guard<std::mutex> lock(mu_);
    return notified_ids_;
  }

  std::uint32_t MaxConcurrent() const {
    return max_concurrent_.load();
  }

  std::set<std::string> fail_ids;
  std::chrono::milliseconds delay{0};
  std::function<void(const loads::RawLoad&)> on_notify;

private:
  mutable std::mutex mu_;
  std::vector<std::string> notified_ids_;
  std::atomic<std::uint32_t> active_{0};
  std::atomic<std::uint32_t> max_concurrent_{0};
};

// Notifier whose calls block until Release(). `on_enter` runs as each call
// starts, before blocking.
class GatedNotifier final : public notify::INotifier {
public:
  bool Notify(const loads::RawLoad& load, const loads::ProfitabilityAnalysis& /*analysis*/,
              std::string& error) override {
    if (on_enter) {
      on_enter(load);
    }
    std::unique_lock<std::mutex> lock(mu_);
    ++entered_;
    cv_.notify_all();
    cv_.wait(lock, [this] { return released_; });
    ++returned_;
    cv_.notify_all();
    error.clear();
    return true;
  }

  void Release() {
    std::lock_guard<std::mutex> lock(mu_);
    released_ = true;
    cv_.notify_all();
  }

  // Waits until `count` calls have returned, up to `timeout`.
  bool WaitReturned(std::uint32_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [&] { return returned_ >= count; });
  }

  std::uint32_t Entered() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entered_;
  }

  std::function<void(const loads::RawLoad&)> on_enter;

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool released_ = false;
  std::uint32_t entered_ = 0;
  std::uint32_t returned_ = 0;
};

// ISentStore with the same unique constraint as the file-backed store, plus
// failure injection.
class InMemorySentStore final : public dispatch::ISentStore {
public:
  bool IsKnown(const loads::LoadFingerprint& fingerprint, std::string_view external_id,
               bool& known, std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (fail_is_known) {
      error = "sent store unavailable";
      return false;
    }
    known = records_.count(fingerprint.hex) != 0U ||
            (!external_id.empty() && external_ids_.count(std::string(external_id)) != 0U);
    error.clear();
    return true;
  }

  dispatch::MarkSentStatus MarkSent(const dispatch::SentRecord& record,
                                    std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++mark_calls;
    if (fail_mark_sent) {
      error = "disk full";
      return dispatch::MarkSentStatus::kFailed;
    }
    if (conflict_on_mark_sent) {
      // Another process recorded the same load between IsKnown() and here.
      records_.emplace(record.fingerprint.hex, record);
      error.clear();
      return dispatch::MarkSentStatus::kAlreadyExists;
    }
    if (records_.count(record.fingerprint.hex) != 0U) {
      error.clear();
      return dispatch::MarkSentStatus::kAlreadyExists;
    }
    records_.emplace(record.fingerprint.hex, record);
    if (!record.external_id.empty()) {
      external_ids_.insert(record.external_id);
    }
    error.clear();
    return dispatch::MarkSentStatus::kInserted;
  }

  bool PurgeOlderThan(std::chrono::system_clock::time_point cutoff, std::uint64_t& removed,
                      std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    ++purge_calls;
    removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
      if (it->second.sent_at < cutoff) {
        external_ids_.erase(it->second.external_id);
        it = records_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    error.clear();
    return true;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return records_.size();
  }

  std::vector<dispatch::SentRecord> Records() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<dispatch::SentRecord> out;
    out.reserve(records_.size());
    for (const auto& [hex, record] : records_) {
      out.push_back(record);
    }
    return out;
  }

  bool fail_is_known = false;
  bool fail_mark_sent = false;
  bool conflict_on_mark_sent = false;
  std::uint32_t mark_calls = 0;
  std::uint32_t purge_calls = 0;

private:
  mutable std::mutex mu_;
  std::map<std::string, dispatch::SentRecord> records_;
  std::set<std::string> external_ids_;
};

class RecordingAlertSink final : public notify::IAlertSink {
public:
  bool RaiseAlert(notify::AlertSeverity severity, std::string_view message,
                  std::string& error) override {
    std::lock_guard<std::mutex> lock(mu_);
    alerts_.emplace_back(severity, std::string(message));
    error.clear();
    return true;
  }

  std::vector<std::pair<notify::AlertSeverity, std::string>> Alerts() const {
    std::lock_guard<std::mutex> lock(mu_);
    return alerts_;
  }

  std::size_t CountSeverity(notify::AlertSeverity severity) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<std::size_t>(
        std::count_if(alerts_.begin(), alerts_.end(),
                      [severity](const auto& alert) { return alert.first == severity; }));
  }

private:
  mutable std::mutex mu_;
  std::vector<std::pair<notify::AlertSeverity, std::string>> alerts_;
};

} // namespace loadwatch::tests::common

#endif // LOADWATCH_TESTS_COMMON_FAKES_HPP_
