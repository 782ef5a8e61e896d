#include "../common/assertions.hpp"
#include "../common/fakes.hpp"
#include "../common/temp_dir.hpp"
#include "dispatch/jsonl_sent_store.hpp"
#include "loads/fingerprint.hpp"
#include "loads/profitability.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using loadwatch::dispatch::JsonlSentStore;
using loadwatch::dispatch::MarkSentStatus;
using loadwatch::dispatch::SentRecord;
using loadwatch::tests::common::AssertContains;
using loadwatch::tests::common::AssertTrue;
using loadwatch::tests::common::Fail;

SentRecord MakeRecord(const std::string& id, std::chrono::system_clock::time_point sent_at) {
  const auto load = loadwatch::tests::common::MakeLoad(id, "Macon, GA", "Mobile, AL", 330.0,
                                                       25.0, 760.0);
  return loadwatch::dispatch::BuildSentRecord(load, loadwatch::loads::Evaluate(load),
                                              loadwatch::loads::ComputeFingerprint(load), sent_at);
}

void OpenOrFail(JsonlSentStore& store) {
  std::string error;
  if (!store.Open(error)) {
    Fail("failed to open sent store: " + error);
  }
}

bool Known(JsonlSentStore& store, const SentRecord& record) {
  bool known = false;
  std::string error;
  if (!store.IsKnown(record.fingerprint, record.external_id, known, error)) {
    Fail("IsKnown failed: " + error);
  }
  return known;
}

// One handle purges and then appends past where the other handle stopped
// reading. The other handle must rebuild instead of seeking into the middle
// of the new file.
void TestPurgeThenRegrowth(const fs::path& root, std::chrono::system_clock::time_point now) {
  const fs::path path = root / "regrowth" / "sent_records.jsonl";
  JsonlSentStore reader(path);
  JsonlSentStore writer(path);
  OpenOrFail(reader);
  OpenOrFail(writer);
  std::string error;

  std::vector<SentRecord> old_records;
  for (int i = 0; i < 5; ++i) {
    old_records.push_back(MakeRecord("old-" + std::to_string(i), now - std::chrono::hours(24 * 30)));
    AssertTrue(writer.MarkSent(old_records.back(), error) == MarkSentStatus::kInserted,
               "old insert");
  }
  AssertTrue(Known(reader, old_records.back()), "reader catches up before the purge");

  std::uint64_t removed = 0;
  AssertTrue(writer.PurgeOlderThan(now - std::chrono::hours(24 * 7), removed, error),
             "purge should succeed");
  AssertTrue(removed == 5U, "every old record purged");

  std::vector<SentRecord> fresh;
  for (int i = 0; i < 8; ++i) {
    fresh.push_back(MakeRecord("fresh-record-" + std::to_string(i), now));
    AssertTrue(writer.MarkSent(fresh.back(), error) == MarkSentStatus::kInserted, "fresh insert");
  }

  for (const SentRecord& record : fresh) {
    AssertTrue(Known(reader, record), "reader sees every record written after the purge");
  }
  AssertTrue(!Known(reader, old_records.front()), "reader forgets purged records");
  AssertTrue(reader.size() == 8U, "reader index matches the file");
  AssertTrue(reader.MarkSent(fresh.front(), error) == MarkSentStatus::kAlreadyExists,
             "reader refuses a record the writer already holds");
}

// The file is rewritten in place (same inode, no purge generation bump) and
// the old offset lands mid-line. The handle falls back to a full reload.
void TestInPlaceRewriteReloads(const fs::path& root, std::chrono::system_clock::time_point now) {
  const fs::path path = root / "inplace" / "sent_records.jsonl";
  JsonlSentStore store(path);
  OpenOrFail(store);
  std::string error;
  const SentRecord original = MakeRecord("short", now);
  AssertTrue(store.MarkSent(original, error) == MarkSentStatus::kInserted, "seed insert");

  const SentRecord longer = MakeRecord("a-considerably-longer-external-identifier-0001", now);
  const SentRecord next = MakeRecord("next", now);
  loadwatch::tests::common::WriteStringToFile(
      path, loadwatch::dispatch::SentRecordToJson(longer) + "\n" +
                loadwatch::dispatch::SentRecordToJson(next) + "\n");

  AssertTrue(Known(store, longer), "first rewritten record is indexed");
  AssertTrue(Known(store, next), "second rewritten record is indexed");
  AssertTrue(!Known(store, original), "records gone from the file are forgotten");
}

// A writer that died mid-append leaves a partial last line. The next insert
// must not glue its record onto it, and the store must reopen afterwards.
void TestCrashedAppendTail(const fs::path& root, std::chrono::system_clock::time_point now) {
  std::string error;
  {
    const fs::path path = root / "partial.jsonl";
    const SentRecord kept = MakeRecord("kept", now);
    loadwatch::tests::common::WriteStringToFile(
        path, loadwatch::dispatch::SentRecordToJson(kept) + "\n{\"fingerprint\":\"00");

    JsonlSentStore store(path);
    OpenOrFail(store);
    AssertTrue(store.size() == 1U, "complete lines load despite the partial tail");
    const SentRecord added = MakeRecord("added", now);
    AssertTrue(store.MarkSent(added, error) == MarkSentStatus::kInserted, "insert after crash");

    JsonlSentStore restarted(path);
    AssertTrue(restarted.Open(error), "store reopens after inserting over a partial tail");
    AssertTrue(restarted.size() == 2U, "partial fragment dropped, both records kept");
    AssertTrue(Known(restarted, added), "new record survives the restart");
  }

  {
    const fs::path path = root / "unterminated.jsonl";
    const SentRecord whole = MakeRecord("whole", now);
    loadwatch::tests::common::WriteStringToFile(path, loadwatch::dispatch::SentRecordToJson(whole));

    JsonlSentStore store(path);
    OpenOrFail(store);
    AssertTrue(store.MarkSent(whole, error) == MarkSentStatus::kAlreadyExists,
               "a complete record missing its newline still counts");
    const std::string contents = loadwatch::tests::common::ReadFileToString(path);
    AssertTrue(!contents.empty() && contents.back() == '\n', "the record is terminated");

    JsonlSentStore restarted(path);
    OpenOrFail(restarted);
    AssertTrue(restarted.size() == 1U, "terminated record loads on restart");
  }
}

} // namespace

int main() {
  const loadwatch::tests::common::ScopedTempDir scratch("loadwatch-sent-store");
  const fs::path& temp_root = scratch.path();
  const fs::path records_path = temp_root / "state" / "sent_records.jsonl";
  const auto now = std::chrono::system_clock::now();

  // Calls before Open() are rejected.
  {
    JsonlSentStore unopened(records_path);
    bool known = false;
    std::string error;
    AssertTrue(!unopened.IsKnown(MakeRecord("x", now).fingerprint, "x", known, error),
               "IsKnown must fail before Open");
    AssertContains(error, "not open");
  }

  JsonlSentStore first(records_path);
  OpenOrFail(first);
  AssertTrue(first.size() == 0U, "missing file opens empty");

  const SentRecord alpha = MakeRecord("alpha", now);
  std::string error;
  AssertTrue(first.MarkSent(alpha, error) == MarkSentStatus::kInserted, "first insert");
  AssertTrue(first.MarkSent(alpha, error) == MarkSentStatus::kAlreadyExists,
             "duplicate fingerprint must be a typed conflict");
  AssertContains(error, "already recorded");
  AssertTrue(Known(first, alpha), "inserted record is known");

  // A second handle on the same file behaves like another process.
  JsonlSentStore second(records_path);
  OpenOrFail(second);
  AssertTrue(second.size() == 1U, "second handle loads existing records");
  AssertTrue(second.MarkSent(alpha, error) == MarkSentStatus::kAlreadyExists,
             "uniqueness holds across handles");
  const SentRecord bravo = MakeRecord("bravo", now);
  AssertTrue(second.MarkSent(bravo, error) == MarkSentStatus::kInserted, "insert via second");
  AssertTrue(Known(first, bravo), "first handle sees records appended by the second");

  // Racing inserts of one fingerprint from both handles: exactly one wins.
  {
    const SentRecord charlie = MakeRecord("charlie", now);
    std::atomic<int> inserted{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> racers;
    for (int i = 0; i < 8; ++i) {
      racers.emplace_back([&, i]() {
        JsonlSentStore& store = (i % 2 == 0) ? first : second;
        std::string race_error;
        const MarkSentStatus status = store.MarkSent(charlie, race_error);
        if (status == MarkSentStatus::kInserted) {
          inserted.fetch_add(1);
        } else if (status == MarkSentStatus::kAlreadyExists) {
          conflicts.fetch_add(1);
        }
      });
    }
    for (std::thread& racer : racers) {
      racer.join();
    }
    AssertTrue(inserted.load() == 1, "exactly one racer inserts");
    AssertTrue(conflicts.load() == 7, "every other racer sees the conflict");
  }

  // Reload from disk.
  {
    JsonlSentStore reopened(records_path);
    OpenOrFail(reopened);
    AssertTrue(reopened.size() == 3U, "reopened store holds three records");
  }

  // Retention purge removes only records older than the cutoff.
  {
    const SentRecord stale = MakeRecord("stale", now - std::chrono::hours(24 * 10));
    AssertTrue(first.MarkSent(stale, error) == MarkSentStatus::kInserted, "insert stale");
    AssertTrue(Known(second, stale), "second sees stale before purge");

    std::uint64_t removed = 0;
    AssertTrue(first.PurgeOlderThan(now - std::chrono::hours(24 * 7), removed, error),
               "purge should succeed");
    AssertTrue(removed == 1U, "one record purged");
    AssertTrue(first.size() == 3U, "fresh records survive the purge");
    AssertTrue(!Known(first, stale), "purged record is forgotten");
    AssertTrue(!Known(second, stale), "other handles rebuild after a purge");
    AssertTrue(Known(second, alpha), "other handles keep surviving records");

    AssertTrue(first.PurgeOlderThan(now - std::chrono::hours(24 * 7), removed, error),
               "second purge should succeed");
    AssertTrue(removed == 0U, "nothing left to purge");
  }

  // Serialized form keeps optional fields.
  {
    SentRecord record = MakeRecord("delta", now);
    record.rate = std::nullopt;
    record.pickup_date = "10/22";
    SentRecord parsed;
    AssertTrue(loadwatch::dispatch::ParseSentRecordJson(
                   loadwatch::dispatch::SentRecordToJson(record), parsed, error),
               "serialized record should parse");
    AssertTrue(parsed.fingerprint == record.fingerprint, "fingerprint kept");
    AssertTrue(!parsed.rate.has_value(), "missing rate stays missing");
    AssertTrue(parsed.pickup_date == record.pickup_date, "pickup date kept");
    AssertTrue(parsed.priority == record.priority, "priority kept");
  }

  // A corrupt file refuses to open rather than silently forgetting records.
  {
    const fs::path corrupt_path = temp_root / "corrupt.jsonl";
    loadwatch::tests::common::WriteStringToFile(corrupt_path, "{\"fingerprint\":\n");
    JsonlSentStore corrupt(corrupt_path);
    AssertTrue(!corrupt.Open(error), "corrupt store must not open");
    AssertContains(error, "corrupt record");
  }

  TestPurgeThenRegrowth(temp_root, now);
  TestInPlaceRewriteReloads(temp_root, now);
  TestCrashedAppendTail(temp_root, now);
  return 0;
}
