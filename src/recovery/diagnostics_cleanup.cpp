#include "recovery/diagnostics_cleanup.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace loadwatch::recovery {

bool CleanupStaleDiagnostics(const fs::path& dir, const std::chrono::seconds max_age,
                             std::uint64_t& removed, std::string& error) {
  removed = 0;
  if (dir.empty()) {
    return true;
  }

  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return true;
  }
  if (!fs::is_directory(dir, ec)) {
    error = "diagnostics path is not a directory: " + dir.string();
    return false;
  }

  const auto now = fs::file_time_type::clock::now();
  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = "failed to list diagnostics directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  for (const fs::directory_entry& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }
    const auto written = entry.last_write_time(entry_ec);
    if (entry_ec || now - written <= max_age) {
      continue;
    }
    const bool deleted = fs::remove(entry.path(), entry_ec);
    if (entry_ec) {
      error = "failed to remove stale diagnostic '" + entry.path().string() + "'";
      return false;
    }
    if (deleted) {
      ++removed;
    }
  }
  return true;
}

} // namespace loadwatch::recovery
