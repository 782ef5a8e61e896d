#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace loadwatch::recovery {

// Deletes regular files directly under `dir` whose last write is older than
// `max_age`. A missing directory is treated as already clean.
bool CleanupStaleDiagnostics(const std::filesystem::path& dir, std::chrono::seconds max_age,
                             std::uint64_t& removed, std::string& error);

} // namespace loadwatch::recovery
