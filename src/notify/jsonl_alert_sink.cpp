#include "notify/jsonl_alert_sink.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"

#include <chrono>
#include <utility>

namespace loadwatch::notify {

JsonlAlertSink::JsonlAlertSink(std::filesystem::path alerts_path, core::logging::Logger& logger,
                               events::Emitter* emitter)
    : alerts_path_(std::move(alerts_path)), logger_(logger), emitter_(emitter) {}

bool JsonlAlertSink::RaiseAlert(const AlertSeverity severity, std::string_view message,
                                std::string& error) {
  const auto now = std::chrono::system_clock::now();
  const char* severity_text = ToString(severity);

  switch (severity) {
  case AlertSeverity::kInfo:
    logger_.Info("alert raised", {{"severity", severity_text}, {"message", message}});
    break;
  case AlertSeverity::kWarning:
    logger_.Warn("alert raised", {{"severity", severity_text}, {"message", message}});
    break;
  case AlertSeverity::kCritical:
  case AlertSeverity::kFatal:
    logger_.Error("alert raised", {{"severity", severity_text}, {"message", message}});
    break;
  }

  const std::string line = std::string("{\"ts\":") +
                           core::QuoteJson(core::FormatUtcTimestamp(now)) +
                           ",\"severity\":" + core::QuoteJson(severity_text) +
                           ",\"message\":" + core::QuoteJson(message) + "}";
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!alerts_path_.empty() && !core::AppendLine(alerts_path_, line, error)) {
      return false;
    }
  }

  if (emitter_ != nullptr) {
    return emitter_->EmitAlert(
        events::Emitter::AlertEvent{
            .ts = now,
            .severity = severity_text,
            .message = std::string(message),
        },
        error);
  }
  return true;
}

} // namespace loadwatch::notify
