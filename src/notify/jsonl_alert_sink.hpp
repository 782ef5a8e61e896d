#pragma once

#include "notify/alert_sink.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace loadwatch::core::logging {
class Logger;
}

namespace loadwatch::events {
class Emitter;
}

namespace loadwatch::notify {

// Alert sink that logs every alert, appends it to `alerts.jsonl` for the
// relay, and mirrors it onto the event timeline when an emitter is given.
class JsonlAlertSink final : public IAlertSink {
public:
  JsonlAlertSink(std::filesystem::path alerts_path, core::logging::Logger& logger,
                 events::Emitter* emitter = nullptr);

  bool RaiseAlert(AlertSeverity severity, std::string_view message, std::string& error) override;

private:
  std::filesystem::path alerts_path_;
  core::logging::Logger& logger_;
  events::Emitter* emitter_ = nullptr;
  std::mutex mu_;
};

} // namespace loadwatch::notify
