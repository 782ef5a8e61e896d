#pragma once

#include "core/logging/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace loadwatch::core {
class ShutdownSignal;
}

namespace loadwatch::cli {

// Options for `loadwatch run`. CLI flags override the matching config fields.
struct RunOptions {
  std::filesystem::path config_path;
  std::optional<std::filesystem::path> state_dir;
  std::optional<std::uint64_t> max_cycles;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs the monitor in-process until `shutdown` fires, max cycles elapse, or
// recovery escalates. Exposed so tests can drive a run without signals.
// Log lines go to `log_out`.
int ExecuteMonitorRun(const RunOptions& options, core::ShutdownSignal& shutdown,
                      std::ostream& log_out);

// Routes `loadwatch` subcommands and returns process exit codes with a stable
// contract for supervisors:
//   0  => success (including a graceful stop on SIGINT/SIGTERM)
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config failed validation
//   20 => upstream session could not be established at startup
//   30 => recovery escalated; operator restart required
int Dispatch(int argc, char** argv);

} // namespace loadwatch::cli
