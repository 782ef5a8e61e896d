#include "dispatch/jsonl_sent_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace loadwatch::dispatch {

namespace {

using JsonValue = core::json::Value;

// Advisory lock on `<path>.lock`, shared for lookups and exclusive for
// mutations. The lock file also carries the purge generation: every rewrite
// bumps it so other handles know their byte offset is meaningless.
class ScopedFileLock {
public:
  enum class Mode { kShared, kExclusive };

  ScopedFileLock(const fs::path& lock_path, Mode mode) {
    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      error_ = std::strerror(errno);
      return;
    }
    int rc = 0;
    do {
      rc = ::flock(fd_, mode == Mode::kExclusive ? LOCK_EX : LOCK_SH);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
      error_ = std::strerror(errno);
      ::close(fd_);
      fd_ = -1;
    }
  }

  ~ScopedFileLock() {
    if (fd_ >= 0) {
      (void)::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }

  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  bool locked() const {
    return fd_ >= 0;
  }

  const std::string& error() const {
    return error_;
  }

  // An empty or unreadable lock file is generation 0.
  std::uint64_t ReadGeneration() const {
    char buffer[32] = {};
    const ssize_t n = ::pread(fd_, buffer, sizeof(buffer) - 1U, 0);
    if (n <= 0) {
      return 0;
    }
    return std::strtoull(buffer, nullptr, 10);
  }

  // Requires kExclusive.
  bool WriteGeneration(std::uint64_t generation, std::string& error) const {
    const std::string text = std::to_string(generation) + "\n";
    if (::ftruncate(fd_, 0) != 0 ||
        ::pwrite(fd_, text.data(), text.size(), 0) != static_cast<ssize_t>(text.size())) {
      error = std::string("failed to record sent store generation: ") + std::strerror(errno);
      return false;
    }
    return true;
  }

private:
  int fd_ = -1;
  std::string error_;
};

std::string LockFailure(const fs::path& lock_path, const ScopedFileLock& lock) {
  return "failed to lock sent store '" + lock_path.string() + "': " + lock.error();
}

bool ReadStringField(const JsonValue& root, std::string_view key, std::string& value,
                     std::string& error) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr || !field->IsString()) {
    error = "sent record field '" + std::string(key) + "' must be a string";
    return false;
  }
  value = field->string_value;
  return true;
}

bool ReadNumberField(const JsonValue& root, std::string_view key, double& value,
                     std::string& error) {
  const JsonValue* field = root.Find(key);
  if (field == nullptr || !field->IsNumber()) {
    error = "sent record field '" + std::string(key) + "' must be a number";
    return false;
  }
  value = field->number_value;
  return true;
}

} // namespace

std::string SentRecordToJson(const SentRecord& record) {
  std::ostringstream out;
  out << "{"
      << "\"fingerprint\":" << core::QuoteJson(record.fingerprint.hex) << ","
      << "\"external_id\":" << core::QuoteJson(record.external_id) << ","
      << "\"pickup\":" << core::QuoteJson(record.pickup) << ","
      << "\"delivery\":" << core::QuoteJson(record.delivery) << ","
      << "\"rate\":" << (record.rate.has_value() ? core::FormatJsonNumber(*record.rate, 2) : "null")
      << ","
      << "\"miles\":" << core::FormatJsonNumber(record.miles, 1) << ","
      << "\"deadhead\":" << core::FormatJsonNumber(record.deadhead, 1) << ","
      << "\"equipment\":" << core::QuoteJson(record.equipment) << ","
      << "\"pickup_date\":"
      << (record.pickup_date.has_value() ? core::QuoteJson(*record.pickup_date) : "null") << ","
      << "\"profitability_score\":" << core::FormatJsonNumber(record.profitability_score, 3) << ","
      << "\"priority\":" << core::QuoteJson(loads::ToString(record.priority)) << ","
      << "\"sent_at_epoch_ms\":" << core::ToEpochMilliseconds(record.sent_at) << ","
      << "\"sent_at_utc\":" << core::QuoteJson(core::FormatUtcTimestamp(record.sent_at)) << "}";
  return out.str();
}

bool ParseSentRecordJson(std::string_view line, SentRecord& record, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(line, root, error)) {
    return false;
  }
  if (!root.IsObject()) {
    error = "sent record must be a JSON object";
    return false;
  }

  SentRecord parsed;
  if (!ReadStringField(root, "fingerprint", parsed.fingerprint.hex, error) ||
      !ReadStringField(root, "external_id", parsed.external_id, error)) {
    return false;
  }
  if (parsed.fingerprint.hex.empty()) {
    error = "sent record fingerprint cannot be empty";
    return false;
  }

  // Descriptive fields are best effort; only identity and timestamp are required.
  std::string ignored_error;
  (void)ReadStringField(root, "pickup", parsed.pickup, ignored_error);
  (void)ReadStringField(root, "delivery", parsed.delivery, ignored_error);
  (void)ReadStringField(root, "equipment", parsed.equipment, ignored_error);
  (void)ReadNumberField(root, "miles", parsed.miles, ignored_error);
  (void)ReadNumberField(root, "deadhead", parsed.deadhead, ignored_error);
  (void)ReadNumberField(root, "profitability_score", parsed.profitability_score, ignored_error);
  if (const JsonValue* rate = root.Find("rate"); rate != nullptr && rate->IsNumber()) {
    parsed.rate = rate->number_value;
  }
  if (const JsonValue* date = root.Find("pickup_date"); date != nullptr && date->IsString()) {
    parsed.pickup_date = date->string_value;
  }
  if (const JsonValue* priority = root.Find("priority"); priority != nullptr && priority->IsString()) {
    (void)loads::ParsePriorityTier(priority->string_value, parsed.priority);
  }

  double sent_at_ms = 0.0;
  if (!ReadNumberField(root, "sent_at_epoch_ms", sent_at_ms, error)) {
    return false;
  }
  if (!std::isfinite(sent_at_ms) || sent_at_ms < 0.0) {
    error = "sent record field 'sent_at_epoch_ms' must be a non-negative integer";
    return false;
  }
  parsed.sent_at = core::FromEpochMilliseconds(static_cast<std::int64_t>(sent_at_ms));

  record = std::move(parsed);
  return true;
}

JsonlSentStore::JsonlSentStore(fs::path records_path)
    : records_path_(std::move(records_path)), lock_path_(records_path_.string() + ".lock") {}

bool JsonlSentStore::Open(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!core::EnsureParentDirectory(records_path_, error)) {
    return false;
  }
  ScopedFileLock file_lock(lock_path_, ScopedFileLock::Mode::kShared);
  if (!file_lock.locked()) {
    error = LockFailure(lock_path_, file_lock);
    return false;
  }
  ResetIndexLocked();
  if (!RefreshLocked(file_lock.ReadGeneration(), error)) {
    return false;
  }
  opened_ = true;
  return true;
}

void JsonlSentStore::IndexLocked(const SentRecord& record) {
  fingerprints_.emplace(record.fingerprint.hex, record.sent_at);
  if (!record.external_id.empty()) {
    external_ids_.insert(record.external_id);
  }
}

void JsonlSentStore::ResetIndexLocked() {
  fingerprints_.clear();
  external_ids_.clear();
  read_offset_ = 0;
  file_size_ = 0;
  identity_ = FileIdentity{};
}

bool JsonlSentStore::RefreshLocked(const std::uint64_t generation, std::string& error) {
  struct stat info {};
  if (::stat(records_path_.c_str(), &info) != 0) {
    if (errno != ENOENT) {
      error = "failed to stat sent store '" + records_path_.string() + "': " +
              std::strerror(errno);
      return false;
    }
    ResetIndexLocked();
    generation_ = generation;
    return true;
  }

  const FileIdentity identity{static_cast<std::uint64_t>(info.st_dev),
                              static_cast<std::uint64_t>(info.st_ino)};
  const auto file_size = static_cast<std::uintmax_t>(info.st_size);
  // A purge elsewhere replaces the file. Offsets into the old one mean nothing
  // even if the new file has already grown past them.
  if (generation != generation_ || identity != identity_ || file_size < read_offset_) {
    ResetIndexLocked();
  }
  generation_ = generation;
  identity_ = identity;
  file_size_ = file_size;

  if (ReadAppendedLocked(error)) {
    return true;
  }
  if (read_offset_ == 0U) {
    return false;
  }
  // Landed mid-line in a file rewritten under an unchanged identity. Start
  // over from the top.
  ResetIndexLocked();
  identity_ = identity;
  file_size_ = file_size;
  error.clear();
  return ReadAppendedLocked(error);
}

bool JsonlSentStore::ReadAppendedLocked(std::string& error) {
  if (file_size_ <= read_offset_) {
    return true;
  }

  std::ifstream in(records_path_, std::ios::binary);
  if (!in) {
    error = "unable to read sent store '" + records_path_.string() + "'";
    return false;
  }
  in.seekg(static_cast<std::streamoff>(read_offset_));
  std::string chunk(static_cast<std::size_t>(file_size_ - read_offset_), '\0');
  in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  chunk.resize(static_cast<std::size_t>(in.gcount()));

  std::size_t line_start = 0;
  std::size_t line_number = 0;
  for (;;) {
    const std::size_t newline = chunk.find('\n', line_start);
    if (newline == std::string::npos) {
      // Partial trailing line: a writer is mid-append, or one crashed.
      break;
    }
    ++line_number;
    const std::string_view line(chunk.data() + line_start, newline - line_start);
    if (!line.empty()) {
      SentRecord record;
      std::string parse_error;
      if (!ParseSentRecordJson(line, record, parse_error)) {
        error = "sent store '" + records_path_.string() + "' has a corrupt record near line " +
                std::to_string(line_number) + ": " + parse_error;
        return false;
      }
      IndexLocked(record);
    }
    line_start = newline + 1;
  }
  read_offset_ += line_start;
  return true;
}

bool JsonlSentStore::RepairTailLocked(std::string& error) {
  if (file_size_ <= read_offset_) {
    return true;
  }

  std::ifstream in(records_path_, std::ios::binary);
  if (!in) {
    error = "unable to read sent store '" + records_path_.string() + "'";
    return false;
  }
  in.seekg(static_cast<std::streamoff>(read_offset_));
  std::string tail(static_cast<std::size_t>(file_size_ - read_offset_), '\0');
  in.read(tail.data(), static_cast<std::streamsize>(tail.size()));
  tail.resize(static_cast<std::size_t>(in.gcount()));
  in.close();

  // Only a crashed writer leaves bytes past the last newline while we hold
  // the exclusive lock. A complete record that lost its newline is kept.
  SentRecord record;
  std::string parse_error;
  if (ParseSentRecordJson(tail, record, parse_error)) {
    if (!core::AppendLine(records_path_, "", error)) {
      return false;
    }
    IndexLocked(record);
    file_size_ += 1U;
    read_offset_ = file_size_;
    return true;
  }

  std::error_code ec;
  fs::resize_file(records_path_, read_offset_, ec);
  if (ec) {
    error = "failed to drop partial record from sent store '" + records_path_.string() +
            "': " + ec.message();
    return false;
  }
  file_size_ = read_offset_;
  return true;
}

bool JsonlSentStore::IsKnown(const loads::LoadFingerprint& fingerprint,
                             std::string_view external_id, bool& known, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!opened_) {
    error = "sent store is not open";
    return false;
  }
  ScopedFileLock file_lock(lock_path_, ScopedFileLock::Mode::kShared);
  if (!file_lock.locked()) {
    error = LockFailure(lock_path_, file_lock);
    return false;
  }
  if (!RefreshLocked(file_lock.ReadGeneration(), error)) {
    return false;
  }
  known = fingerprints_.count(fingerprint.hex) != 0U ||
          (!external_id.empty() && external_ids_.count(std::string(external_id)) != 0U);
  return true;
}

MarkSentStatus JsonlSentStore::MarkSent(const SentRecord& record, std::string& error) {
  if (record.fingerprint.hex.empty()) {
    error = "cannot persist a record without a fingerprint";
    return MarkSentStatus::kFailed;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (!opened_) {
    error = "sent store is not open";
    return MarkSentStatus::kFailed;
  }

  ScopedFileLock file_lock(lock_path_, ScopedFileLock::Mode::kExclusive);
  if (!file_lock.locked()) {
    error = LockFailure(lock_path_, file_lock);
    return MarkSentStatus::kFailed;
  }
  if (!RefreshLocked(file_lock.ReadGeneration(), error) || !RepairTailLocked(error)) {
    return MarkSentStatus::kFailed;
  }
  if (fingerprints_.count(record.fingerprint.hex) != 0U) {
    error = "fingerprint " + record.fingerprint.hex + " already recorded";
    return MarkSentStatus::kAlreadyExists;
  }

  const std::string line = SentRecordToJson(record);
  if (!core::AppendLine(records_path_, line, error)) {
    return MarkSentStatus::kFailed;
  }
  file_size_ += line.size() + 1U;
  read_offset_ = file_size_;
  IndexLocked(record);
  return MarkSentStatus::kInserted;
}

bool JsonlSentStore::PurgeOlderThan(const std::chrono::system_clock::time_point cutoff,
                                    std::uint64_t& removed, std::string& error) {
  removed = 0;
  std::lock_guard<std::mutex> lock(mu_);
  if (!opened_) {
    error = "sent store is not open";
    return false;
  }

  ScopedFileLock file_lock(lock_path_, ScopedFileLock::Mode::kExclusive);
  if (!file_lock.locked()) {
    error = LockFailure(lock_path_, file_lock);
    return false;
  }
  const std::uint64_t generation = file_lock.ReadGeneration();
  if (!RefreshLocked(generation, error) || !RepairTailLocked(error)) {
    error = "refusing to purge sent store: " + error;
    return false;
  }
  if (file_size_ == 0U) {
    return true;
  }

  std::string contents;
  if (!core::ReadTextFile(records_path_, contents, error)) {
    return false;
  }

  std::string kept;
  std::vector<SentRecord> kept_records;
  std::istringstream lines(contents);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.empty()) {
      continue;
    }
    SentRecord record;
    if (!ParseSentRecordJson(line, record, error)) {
      error = "refusing to purge corrupt sent store: " + error;
      return false;
    }
    if (record.sent_at < cutoff) {
      ++removed;
      continue;
    }
    kept += line;
    kept += '\n';
    kept_records.push_back(std::move(record));
  }

  if (removed == 0U) {
    return true;
  }
  if (!core::WriteTextFileAtomic(records_path_, kept, error)) {
    return false;
  }
  if (!file_lock.WriteGeneration(generation + 1U, error)) {
    return false;
  }

  ResetIndexLocked();
  for (const SentRecord& record : kept_records) {
    IndexLocked(record);
  }
  struct stat info {};
  if (::stat(records_path_.c_str(), &info) == 0) {
    identity_ = FileIdentity{static_cast<std::uint64_t>(info.st_dev),
                             static_cast<std::uint64_t>(info.st_ino)};
  }
  generation_ = generation + 1U;
  file_size_ = kept.size();
  read_offset_ = kept.size();
  return true;
}

std::size_t JsonlSentStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fingerprints_.size();
}

} // namespace loadwatch::dispatch
