#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace lsm::types {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class ExpirationStatus : uint8_t {
    Valid,
    Expiring,
    Expired
};

// Expired once now is past expiresAt; Expiring when expiresAt falls within
// [now, now + threshold] (inclusive upper bound); Valid otherwise.
[[nodiscard]] ExpirationStatus classify(TimePoint expiresAt, std::chrono::seconds threshold,
                                        TimePoint now = Clock::now());

std::string_view to_string(ExpirationStatus status);

}
