#pragma once

#include "events/event_model.hpp"

#include <filesystem>
#include <string>

namespace loadwatch::events {

// Appends one JSON-serialized event as a single line to `events_path`,
// creating parent directories on first use. Returns false with `error`
// populated on failure.
bool AppendEventJsonl(const Event& event, const std::filesystem::path& events_path,
                      std::string& error);

} // namespace loadwatch::events
