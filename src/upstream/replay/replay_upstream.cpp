#include "upstream/replay/replay_upstream.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "loads/text_parse.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <thread>
#include <utility>

namespace loadwatch::upstream::replay {

namespace {

using JsonValue = core::json::Value;

bool ParseUnsigned(const JsonValue& object, std::string_view key, std::uint32_t& value,
                   std::string& error) {
  const JsonValue* field = object.Find(key);
  if (field == nullptr) {
    return true;
  }
  std::uint64_t count = 0;
  if (!core::json::TryGetCount(*field, count)) {
    error = "faults." + std::string(key) + " must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint32_t>(count);
  return true;
}

// Numbers pass through; strings are scraped display text.
bool ParseDistance(const JsonValue* field, bool deadhead, double& value, std::string& error) {
  if (field == nullptr || field->IsNull()) {
    value = 0.0;
    return true;
  }
  if (field->IsNumber()) {
    value = field->number_value;
    return true;
  }
  if (field->IsString()) {
    const std::optional<double> parsed = deadhead ? loads::ParseDeadheadText(field->string_value)
                                                  : loads::ParseMilesText(field->string_value);
    value = parsed.value_or(0.0);
    return true;
  }
  error = std::string(deadhead ? "deadhead" : "miles") + " must be a number or string";
  return false;
}

bool ParseLoad(const JsonValue& object, loads::RawLoad& load, std::string& error) {
  if (!object.IsObject()) {
    error = "each load must be an object";
    return false;
  }
  const JsonValue* id = object.Find("external_id");
  if (id == nullptr || !id->IsString() || id->string_value.empty()) {
    error = "load external_id must be a non-empty string";
    return false;
  }
  load.external_id = id->string_value;
  if (const JsonValue* pickup = object.Find("pickup"); pickup != nullptr && pickup->IsString()) {
    load.pickup = pickup->string_value;
  }
  if (const JsonValue* delivery = object.Find("delivery");
      delivery != nullptr && delivery->IsString()) {
    load.delivery = delivery->string_value;
  }
  if (const JsonValue* equipment = object.Find("equipment");
      equipment != nullptr && equipment->IsString()) {
    load.equipment = equipment->string_value;
  }
  if (const JsonValue* date = object.Find("pickup_date");
      date != nullptr && date->IsString() && !date->string_value.empty()) {
    load.pickup_date = date->string_value;
  }
  if (!ParseDistance(object.Find("miles"), false, load.miles, error) ||
      !ParseDistance(object.Find("deadhead"), true, load.deadhead, error)) {
    error = "load '" + load.external_id + "': " + error;
    return false;
  }

  const JsonValue* rate = object.Find("rate");
  if (rate != nullptr && rate->IsNumber()) {
    load.rate = rate->number_value;
  } else if (rate != nullptr && rate->IsString()) {
    load.rate = loads::ParseRateText(rate->string_value);
  } else if (rate != nullptr && !rate->IsNull()) {
    error = "load '" + load.external_id + "': rate must be a number, string or null";
    return false;
  }
  return true;
}

} // namespace

bool ParseReplayFixture(std::string_view text, ReplayFixture& fixture, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "replay fixture parse error: " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "replay fixture must be a JSON object";
    return false;
  }

  ReplayFixture parsed;
  if (const JsonValue* loop = root.Find("loop"); loop != nullptr) {
    if (!loop->IsBool()) {
      error = "replay fixture 'loop' must be a boolean";
      return false;
    }
    parsed.loop = loop->bool_value;
  }

  if (const JsonValue* faults = root.Find("faults"); faults != nullptr) {
    if (!faults->IsObject()) {
      error = "replay fixture 'faults' must be an object";
      return false;
    }
    ReplayFaults& f = parsed.faults;
    if (!ParseUnsigned(*faults, "fail_every_n", f.fail_every_n, error) ||
        !ParseUnsigned(*faults, "fail_first_n", f.fail_first_n, error) ||
        !ParseUnsigned(*faults, "latency_ms", f.latency_ms, error) ||
        !ParseUnsigned(*faults, "session_expires_after", f.session_expires_after, error) ||
        !ParseUnsigned(*faults, "rebuild_failures", f.rebuild_failures, error) ||
        !ParseUnsigned(*faults, "authenticate_failures", f.authenticate_failures, error) ||
        !ParseUnsigned(*faults, "probe_failures", f.probe_failures, error)) {
      return false;
    }
    if (const JsonValue* fail_error = faults->Find("fail_error"); fail_error != nullptr) {
      if (!fail_error->IsString()) {
        error = "faults.fail_error must be a string";
        return false;
      }
      f.fail_error = fail_error->string_value;
    }
  }

  const JsonValue* batches = root.Find("batches");
  if (batches == nullptr || !batches->IsArray()) {
    error = "replay fixture requires a 'batches' array";
    return false;
  }
  for (std::size_t i = 0; i < batches->array_value.size(); ++i) {
    const JsonValue& batch = batches->array_value[i];
    if (!batch.IsArray()) {
      error = "batches[" + std::to_string(i) + "] must be an array";
      return false;
    }
    loads::LoadBatch parsed_batch;
    for (const JsonValue& item : batch.array_value) {
      loads::RawLoad load;
      if (!ParseLoad(item, load, error)) {
        error = "batches[" + std::to_string(i) + "]: " + error;
        return false;
      }
      parsed_batch.push_back(std::move(load));
    }
    parsed.batches.push_back(std::move(parsed_batch));
  }

  fixture = std::move(parsed);
  return true;
}

bool LoadReplayFixture(const std::filesystem::path& path, ReplayFixture& fixture,
                       std::string& error) {
  std::string text;
  if (!core::ReadTextFile(path, text, error)) {
    return false;
  }
  if (!ParseReplayFixture(text, fixture, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

ReplayUpstream::ReplayUpstream(ReplayFixture fixture, WallClockFn wall_clock)
    : fixture_(std::move(fixture)), wall_clock_(std::move(wall_clock)) {
  if (!wall_clock_) {
    wall_clock_ = [] { return std::chrono::system_clock::now(); };
  }
}

bool ReplayUpstream::FetchBatch(const adaptive::ScanStrategy& strategy, loads::LoadBatch& loads,
                                std::string& error) {
  loads.clear();
  std::unique_lock<std::mutex> lock(mu_);
  ++fetch_count_;

  if (!built_ || !authenticated_) {
    error = "session expired: not authenticated";
    return false;
  }

  const ReplayFaults& faults = fixture_.faults;
  if (faults.latency_ms > 0U) {
    const auto latency = std::chrono::milliseconds(faults.latency_ms);
    const auto timeout =
        std::chrono::milliseconds(static_cast<std::int64_t>(strategy.timeout_s * 1000.0));
    lock.unlock();
    std::this_thread::sleep_for(std::min(latency, timeout));
    lock.lock();
    if (latency > timeout) {
      error = "fetch timed out after " + std::to_string(timeout.count()) + "ms";
      return false;
    }
  }

  if (fetch_count_ <= faults.fail_first_n ||
      (faults.fail_every_n > 0U && fetch_count_ % faults.fail_every_n == 0U)) {
    error = faults.fail_error;
    return false;
  }

  if (faults.session_expires_after > 0U && fetches_since_auth_ >= faults.session_expires_after) {
    authenticated_ = false;
    error = "session expired: login required";
    return false;
  }
  ++fetches_since_auth_;

  if (fixture_.batches.empty()) {
    return true;
  }
  std::uint64_t index = next_batch_++;
  if (index >= fixture_.batches.size()) {
    if (!fixture_.loop) {
      return true;
    }
    index %= fixture_.batches.size();
  }

  const auto captured_at = wall_clock_();
  loads = fixture_.batches[static_cast<std::size_t>(index)];
  for (loads::RawLoad& load : loads) {
    load.captured_at = captured_at;
  }
  return true;
}

bool ReplayUpstream::Teardown(std::string& error) {
  (void)error;
  std::lock_guard<std::mutex> lock(mu_);
  built_ = false;
  authenticated_ = false;
  return true;
}

bool ReplayUpstream::Rebuild(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (rebuild_failures_seen_ < fixture_.faults.rebuild_failures) {
    ++rebuild_failures_seen_;
    error = "connection refused while rebuilding session";
    return false;
  }
  built_ = true;
  authenticated_ = false;
  return true;
}

bool ReplayUpstream::Authenticate(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!built_) {
    error = "cannot authenticate before the session is rebuilt";
    return false;
  }
  if (authenticate_failures_seen_ < fixture_.faults.authenticate_failures) {
    ++authenticate_failures_seen_;
    error = "access denied: login rejected";
    return false;
  }
  authenticated_ = true;
  fetches_since_auth_ = 0;
  return true;
}

bool ReplayUpstream::Probe(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!built_ || !authenticated_) {
    error = "probe failed: session not authenticated";
    return false;
  }
  if (probe_failures_seen_ < fixture_.faults.probe_failures) {
    ++probe_failures_seen_;
    error = "probe timed out";
    return false;
  }
  return true;
}

std::uint64_t ReplayUpstream::fetch_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fetch_count_;
}

bool ReplayUpstream::session_ready() const {
  std::lock_guard<std::mutex> lock(mu_);
  return built_ && authenticated_;
}

} // namespace loadwatch::upstream::replay
