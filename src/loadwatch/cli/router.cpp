#include "loadwatch/cli/router.hpp"

#include "adaptive/controller.hpp"
#include "config/model.hpp"
#include "config/validator.hpp"
#include "core/clock.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/shutdown_signal.hpp"
#include "core/time_utils.hpp"
#include "dispatch/jsonl_sent_store.hpp"
#include "dispatch/pipeline.hpp"
#include "events/emitter.hpp"
#include "loads/profitability.hpp"
#include "loads/text_parse.hpp"
#include "notify/jsonl_alert_sink.hpp"
#include "notify/jsonl_outbox_notifier.hpp"
#include "recovery/recovery_manager.hpp"
#include "scheduler/scan_scheduler.hpp"
#include "upstream/error_mapper.hpp"
#include "upstream/replay/replay_upstream.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace loadwatch::cli {

namespace {

constexpr std::string_view kVersion = "loadwatch 0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitUpstreamUnavailable =
    core::errors::ToInt(core::errors::ExitCode::kUpstreamUnavailable);
constexpr int kExitRecoveryEscalated =
    core::errors::ToInt(core::errors::ExitCode::kRecoveryEscalated);

// Target of SIGINT/SIGTERM while a run is active.
core::ShutdownSignal* g_active_shutdown = nullptr;

void HandleStopSignal(int /*signal_number*/) {
  if (g_active_shutdown != nullptr) {
    g_active_shutdown->RequestStopFromSignalHandler();
  }
}

// Installs stop handlers for the lifetime of one run and restores the
// previous handlers afterwards.
class ScopedStopSignalHandlers {
public:
  explicit ScopedStopSignalHandlers(core::ShutdownSignal& shutdown) {
    g_active_shutdown = &shutdown;
    previous_int_ = std::signal(SIGINT, HandleStopSignal);
    previous_term_ = std::signal(SIGTERM, HandleStopSignal);
  }

  ~ScopedStopSignalHandlers() {
    std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
    g_active_shutdown = nullptr;
  }

  ScopedStopSignalHandlers(const ScopedStopSignalHandlers&) = delete;
  ScopedStopSignalHandlers& operator=(const ScopedStopSignalHandlers&) = delete;

private:
  using Handler = void (*)(int);
  Handler previous_int_ = SIG_DFL;
  Handler previous_term_ = SIG_DFL;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  loadwatch run <config.json> [--state-dir <dir>] [--max-cycles <n>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  loadwatch validate <config.json>\n"
      << "  loadwatch evaluate --miles <n> --deadhead <n> [--rate <text>] "
         "[--equipment <type>] [--pickup-date <text>]\n"
      << "  loadwatch purge <config.json> --older-than-days <n>\n"
      << "  loadwatch version\n";
}

// Filesystem preflight runs before field validation so path problems and
// config problems are reported separately.
bool ValidateConfigPath(const fs::path& config_path, std::string& error) {
  if (config_path.empty()) {
    error = "config path cannot be empty";
    return false;
  }
  std::error_code ec;
  if (!fs::exists(config_path, ec) || ec) {
    error = "config file not found: " + config_path.string();
    return false;
  }
  if (!fs::is_regular_file(config_path, ec) || ec) {
    error = "config path must point to a regular file: " + config_path.string();
    return false;
  }
  if (config_path.extension() != ".json") {
    error = "config file must use .json extension: " + config_path.string();
    return false;
  }
  return true;
}

bool ParseUnsigned(std::string_view text, std::uint64_t& value) {
  if (text.empty()) {
    return false;
  }
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

bool ParseDouble(std::string_view text, double& value) {
  if (text.empty()) {
    return false;
  }
  const std::string owned(text);
  char* end = nullptr;
  value = std::strtod(owned.c_str(), &end);
  return end != nullptr && *end == '\0';
}

// Accepts a plain number or board-style text such as "1,250 mi".
bool ParseDistance(std::string_view text, std::optional<double> (*parse_text)(std::string_view),
                   double& value) {
  if (ParseDouble(text, value)) {
    return true;
  }
  const std::optional<double> parsed = parse_text(text);
  if (!parsed.has_value()) {
    return false;
  }
  value = *parsed;
  return true;
}

// Validates and loads a config. Returns an exit code, kExitSuccess when the
// config is ready to use.
int LoadValidatedConfig(const fs::path& config_path, config::AppConfig& app_config) {
  std::string error;
  if (!ValidateConfigPath(config_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::ValidationReport report;
  if (!config::ValidateConfigFile(config_path, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    std::cerr << "invalid config: " << config_path.string() << '\n';
    for (const auto& issue : report.issues) {
      std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
    }
    return kExitConfigInvalid;
  }

  if (!config::LoadConfigFile(config_path, app_config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  return kExitSuccess;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1U) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }
  const fs::path config_path(args.front());
  config::AppConfig app_config;
  const int status = LoadValidatedConfig(config_path, app_config);
  if (status != kExitSuccess) {
    return status;
  }
  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

// `run` args:
// - one config path
// - optional `--state-dir <dir>`, `--max-cycles <n>`, `--log-level <level>`
// Unknown flags and duplicate positionals are usage errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--state-dir" || token == "--max-cycles" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[++i];
      if (token == "--state-dir") {
        if (value.empty()) {
          error = "--state-dir cannot be empty";
          return false;
        }
        options.state_dir = fs::path(value);
      } else if (token == "--max-cycles") {
        std::uint64_t cycles = 0;
        if (!ParseUnsigned(value, cycles)) {
          error = "--max-cycles must be a non-negative integer";
          return false;
        }
        options.max_cycles = cycles;
      } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.config_path.empty()) {
      error = "unexpected positional argument: " + std::string(token);
      return false;
    }
    options.config_path = fs::path(token);
  }

  if (options.config_path.empty()) {
    error = "run requires a config path";
    return false;
  }
  return true;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  core::ShutdownSignal shutdown;
  ScopedStopSignalHandlers handlers(shutdown);
  return ExecuteMonitorRun(options, shutdown, std::cerr);
}

int CommandEvaluate(const std::vector<std::string_view>& args) {
  loads::RawLoad load;
  load.external_id = "cli";
  bool has_miles = false;
  bool has_deadhead = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (i + 1 >= args.size()) {
      std::cerr << "error: missing value for " << token << '\n';
      return kExitUsage;
    }
    const std::string_view value = args[++i];
    if (token == "--miles") {
      if (!ParseDistance(value, loads::ParseMilesText, load.miles)) {
        std::cerr << "error: --miles must be a number\n";
        return kExitUsage;
      }
      has_miles = true;
    } else if (token == "--deadhead") {
      if (!ParseDistance(value, loads::ParseDeadheadText, load.deadhead)) {
        std::cerr << "error: --deadhead must be a number\n";
        return kExitUsage;
      }
      has_deadhead = true;
    } else if (token == "--rate") {
      load.rate = loads::ParseRateText(value);
      if (!load.rate.has_value()) {
        std::cerr << "error: --rate has no numeric value: " << value << '\n';
        return kExitUsage;
      }
    } else if (token == "--equipment") {
      load.equipment = std::string(value);
    } else if (token == "--pickup-date") {
      load.pickup_date = std::string(value);
    } else {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
  }

  if (!has_miles || !has_deadhead) {
    std::cerr << "error: evaluate requires --miles and --deadhead\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  if (load.miles < 0.0 || load.deadhead < 0.0) {
    std::cerr << "error: distances must be non-negative\n";
    return kExitUsage;
  }

  const loads::ProfitabilityAnalysis analysis = loads::Evaluate(load);
  std::cout << "total_miles: " << core::FormatJsonNumber(analysis.total_miles, 1) << '\n'
            << "rate: " << core::FormatJsonNumber(analysis.rate, 2)
            << (analysis.rate_synthesized ? " (synthesized)" : "") << '\n'
            << "rate_per_mile: " << core::FormatJsonNumber(analysis.rate_per_mile, 3) << '\n'
            << "deadhead_ratio: " << core::FormatJsonNumber(analysis.deadhead_ratio, 3) << '\n'
            << "fuel_cost: " << core::FormatJsonNumber(analysis.fuel_cost, 2) << '\n'
            << "gross_profit: " << core::FormatJsonNumber(analysis.gross_profit, 2) << '\n'
            << "net_profit_margin_percent: "
            << core::FormatJsonNumber(analysis.net_profit_margin_percent, 1) << '\n'
            << "quality_score: " << analysis.quality_score << '\n'
            << "priority: " << loads::ToString(analysis.priority) << '\n'
            << "profitability_score: " << core::FormatJsonNumber(analysis.profitability_score, 3)
            << '\n'
            << "is_profitable: " << (analysis.is_profitable ? "true" : "false") << '\n';
  return kExitSuccess;
}

int CommandPurge(const std::vector<std::string_view>& args) {
  fs::path config_path;
  std::optional<std::uint64_t> older_than_days;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--older-than-days") {
      std::uint64_t days = 0;
      if (i + 1 >= args.size() || !ParseUnsigned(args[i + 1], days)) {
        std::cerr << "error: --older-than-days requires a non-negative integer\n";
        return kExitUsage;
      }
      older_than_days = days;
      ++i;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    if (!config_path.empty()) {
      std::cerr << "error: unexpected positional argument: " << token << '\n';
      return kExitUsage;
    }
    config_path = fs::path(token);
  }
  if (config_path.empty() || !older_than_days.has_value()) {
    std::cerr << "error: purge requires <config.json> and --older-than-days <n>\n";
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  config::AppConfig app_config;
  const int status = LoadValidatedConfig(config_path, app_config);
  if (status != kExitSuccess) {
    return status;
  }

  const config::StatePaths paths = config::ResolveStatePaths(app_config);
  dispatch::JsonlSentStore store(paths.sent_records_jsonl);
  std::string error;
  if (!store.Open(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  const auto cutoff = std::chrono::system_clock::now() -
                      std::chrono::hours(24) * static_cast<std::int64_t>(*older_than_days);
  std::uint64_t removed = 0;
  if (!store.PurgeOlderThan(cutoff, removed, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  std::cout << "removed: " << removed << '\n'
            << "remaining: " << store.size() << '\n';
  return kExitSuccess;
}

} // namespace

int ExecuteMonitorRun(const RunOptions& options, core::ShutdownSignal& shutdown,
                      std::ostream& log_out) {
  config::AppConfig app_config;
  const int config_status = LoadValidatedConfig(options.config_path, app_config);
  if (config_status != kExitSuccess) {
    return config_status;
  }
  if (options.state_dir.has_value()) {
    app_config.paths.state_dir = *options.state_dir;
  }
  if (options.max_cycles.has_value()) {
    app_config.scheduler.max_cycles = *options.max_cycles;
  }

  core::logging::Logger logger(options.log_level, log_out);
  logger.SetInstanceId(app_config.instance_id);

  const config::StatePaths paths = config::ResolveStatePaths(app_config);
  std::string error;
  if (!core::EnsureDirectory(app_config.paths.state_dir, error) ||
      !core::EnsureDirectory(paths.diagnostics_dir, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  events::Emitter emitter(paths.events_jsonl);

  dispatch::JsonlSentStore store(paths.sent_records_jsonl);
  if (!store.Open(error)) {
    std::cerr << "error: failed to open sent store: " << error << '\n';
    return kExitFailure;
  }
  logger.Info("sent store opened", {{"path", paths.sent_records_jsonl.string()},
                                    {"records", std::to_string(store.size())}});

  upstream::replay::ReplayFixture fixture;
  if (!upstream::replay::LoadReplayFixture(app_config.upstream.replay_path, fixture, error)) {
    std::cerr << "error: failed to load replay fixture: " << error << '\n';
    return kExitFailure;
  }
  upstream::replay::ReplayUpstream upstream(std::move(fixture));

  // The initial session is established once up front; later losses are the
  // recovery manager's job.
  if (!upstream.Rebuild(error) || !upstream.Authenticate(error)) {
    const std::string formatted = upstream::FormatUpstreamError("session setup", error);
    logger.Error("upstream session setup failed", {{"error", formatted}});
    std::cerr << "error: " << formatted << '\n';
    return kExitUpstreamUnavailable;
  }

  notify::JsonlOutboxNotifier notifier(paths.outbox_jsonl);
  notify::JsonlAlertSink alerts(paths.alerts_jsonl, logger, &emitter);
  core::SteadyClock clock;
  adaptive::Controller controller;

  recovery::RecoveryManager recovery(
      upstream, alerts, emitter, logger, clock,
      recovery::RecoveryConfig{
          .max_attempts = app_config.recovery.max_attempts,
          .base_delay_s = app_config.recovery.base_delay_s,
          .cooldown_s = app_config.recovery.cooldown_s,
          .diagnostics_max_age_s = app_config.recovery.diagnostics_max_age_s,
          .diagnostics_dir = paths.diagnostics_dir,
      });

  dispatch::DispatchPipeline pipeline(store, notifier, emitter, logger, shutdown,
                                      dispatch::PipelineOptions{
                                          .max_in_flight = app_config.dispatch.max_in_flight,
                                          .estimator = app_config.estimator,
                                          .shutdown_grace_s = app_config.dispatch.shutdown_grace_s,
                                      });

  scheduler::ScanScheduler scan_scheduler(
      upstream, pipeline, controller, recovery, store, alerts, emitter, logger, clock, shutdown,
      scheduler::SchedulerOptions{
          .instance_id = app_config.instance_id,
          .criteria = app_config.search_criteria,
          .max_cycles = app_config.scheduler.max_cycles,
          .status_every_cycles = app_config.scheduler.status_every_cycles,
          .alert_interval_s = app_config.scheduler.alert_interval_s,
          .retention_days = app_config.retention.days,
          .retention_sweep_interval_s = app_config.retention.sweep_interval_s,
          .status_path = paths.status_json,
      });

  const scheduler::SchedulerResult result = scan_scheduler.Run();

  std::cout << "stopped: " << scheduler::ToString(result.exit) << '\n'
            << "cycles: " << result.cycles << '\n'
            << "loads_sent: " << result.stats.loads_sent_total << '\n'
            << "status: " << paths.status_json.string() << '\n';

  if (result.exit == scheduler::SchedulerExit::kEscalated) {
    std::cerr << "error: recovery escalated; operator restart required\n";
    return kExitRecoveryEscalated;
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "evaluate") {
    return CommandEvaluate(args);
  }
  if (command == "purge") {
    return CommandPurge(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace loadwatch::cli
