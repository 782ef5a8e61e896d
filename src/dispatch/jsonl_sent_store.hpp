#pragma once

#include "dispatch/sent_store.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace loadwatch::dispatch {

// Append-only JSONL implementation of the sent-record store.
//
// Uniqueness is enforced by the store: MarkSent() takes an exclusive advisory
// lock on `<path>.lock`, folds in lines other processes appended since the last
// read, and only then checks the fingerprint and appends. Lookups take the same
// lock shared. Purge rewrites the file atomically under the exclusive lock and
// bumps a generation counter kept in the lock file; a handle that sees a new
// generation or a new inode rebuilds its index from the top.
//
// A partial last line left by a crashed writer is dropped (or, if it is a
// complete record missing its newline, terminated) before the next append.
class JsonlSentStore final : public ISentStore {
public:
  explicit JsonlSentStore(std::filesystem::path records_path);

  JsonlSentStore(const JsonlSentStore&) = delete;
  JsonlSentStore& operator=(const JsonlSentStore&) = delete;

  // Loads existing records. Must succeed before any other call.
  bool Open(std::string& error);

  bool IsKnown(const loads::LoadFingerprint& fingerprint, std::string_view external_id,
               bool& known, std::string& error) override;

  MarkSentStatus MarkSent(const SentRecord& record, std::string& error) override;

  bool PurgeOlderThan(std::chrono::system_clock::time_point cutoff, std::uint64_t& removed,
                      std::string& error) override;

  std::size_t size() const;

  const std::filesystem::path& records_path() const {
    return records_path_;
  }

private:
  struct FileIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const FileIdentity&) const = default;
  };

  // All *Locked() members require `mu_` plus the file lock.
  // Brings the index up to date with the file; rebuilds from offset 0 when the
  // file was rewritten.
  bool RefreshLocked(std::uint64_t generation, std::string& error);
  // Indexes complete lines in [read_offset_, file_size_).
  bool ReadAppendedLocked(std::string& error);
  // Exclusive lock only. Removes bytes after the last complete line.
  bool RepairTailLocked(std::string& error);
  void ResetIndexLocked();
  void IndexLocked(const SentRecord& record);

  std::filesystem::path records_path_;
  std::filesystem::path lock_path_;
  mutable std::mutex mu_;
  bool opened_ = false;
  std::uintmax_t read_offset_ = 0;
  std::uintmax_t file_size_ = 0;
  std::uint64_t generation_ = 0;
  FileIdentity identity_;
  std::map<std::string, std::chrono::system_clock::time_point> fingerprints_;
  std::set<std::string> external_ids_;
};

// JSONL line (no trailing newline) for one record.
std::string SentRecordToJson(const SentRecord& record);

// Parses one JSONL line produced by SentRecordToJson().
bool ParseSentRecordJson(std::string_view line, SentRecord& record, std::string& error);

} // namespace loadwatch::dispatch
