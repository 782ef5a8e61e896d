#include "events/jsonl_writer.hpp"

#include "core/fs_utils.hpp"

namespace loadwatch::events {

bool AppendEventJsonl(const Event& event, const std::filesystem::path& events_path,
                      std::string& error) {
  if (events_path.empty()) {
    error = "event log path cannot be empty";
    return false;
  }
  return core::AppendLine(events_path, ToJson(event), error);
}

} // namespace loadwatch::events
