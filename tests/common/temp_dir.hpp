#ifndef LOADWATCH_TESTS_COMMON_TEMP_DIR_HPP_
#define LOADWATCH_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace loadwatch::tests::common {

// Owns a fresh directory under the system temp root and removes it, with
// everything inside, when the test scope ends.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) {
    static std::atomic<std::uint32_t> sequence{0};
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(static_cast<long long>(::getpid())) + "-" +
             std::to_string(sequence.fetch_add(1U)));

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    ec.clear();
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      Fail("failed to create temp dir " + path_.string() + ": " + ec.message());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace loadwatch::tests::common

#endif // LOADWATCH_TESTS_COMMON_TEMP_DIR_HPP_
