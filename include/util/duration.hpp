#pragma once

#include <chrono>
#include <string>

namespace lsm::util {

// Accepts "<N>d", "<N>w", "<N>mo", "<N>y" (day = 24h, week = 7d, month = 30d,
// year = 365d) or a sequence of h/m/s/ms/us/ns components such as "1h30m"
// or "1.5h"; components may carry a decimal fraction. The result is truncated
// to whole seconds. Case-insensitive. Throws InvalidArgumentError.
std::chrono::seconds parseDuration(const std::string& input);

// "N days", "N hours" or "N minutes": the largest whole unit
std::string formatRemaining(std::chrono::seconds d);

// "719h59m59s"; negative durations carry a leading '-'
std::string formatClock(std::chrono::seconds d);

}
