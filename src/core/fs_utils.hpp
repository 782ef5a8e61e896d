#ifndef LOADWATCH_CORE_FS_UTILS_HPP_
#define LOADWATCH_CORE_FS_UTILS_HPP_

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace loadwatch::core {

namespace detail {

// "<name>.tmp.<pid>.<seq>" beside the target, so the final rename never
// crosses a filesystem.
inline std::filesystem::path SiblingTempPath(const std::filesystem::path& target) {
  static std::atomic<std::uint64_t> sequence{0};
  std::filesystem::path temp = target;
  temp += ".tmp." + std::to_string(static_cast<long long>(::getpid())) + "." +
          std::to_string(sequence.fetch_add(1U, std::memory_order_relaxed));
  return temp;
}

} // namespace detail

inline bool EnsureDirectory(const std::filesystem::path& dir, std::string& error) {
  if (dir.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  return EnsureDirectory(output_path.parent_path(), error);
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "unable to read text file: " + path.string();
    return false;
  }
  contents.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  return true;
}

// Status snapshots are published with write-temp-then-rename so a reader never
// sees a half-written file. The temp file is removed on every failure path.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::SiblingTempPath(output_path);
  const auto discard_temp = [&temp_path]() {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
  };

  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      out.close();
      discard_temp();
      return false;
    }
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, output_path, ec);
  if (ec) {
    discard_temp();
    error = "failed to publish output file '" + output_path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Appends one line (newline added) to a file, creating parents as needed.
inline bool AppendLine(const std::filesystem::path& path, std::string_view line,
                       std::string& error) {
  if (!EnsureParentDirectory(path, error)) {
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::app);
  if (!out) {
    error = "failed to open '" + path.string() + "' for append";
    return false;
  }
  out << line << '\n';
  if (!out) {
    error = "failed while appending to '" + path.string() + "'";
    return false;
  }
  return true;
}

} // namespace loadwatch::core

#endif // LOADWATCH_CORE_FS_UTILS_HPP_
