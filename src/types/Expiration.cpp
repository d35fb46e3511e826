#include "types/Expiration.hpp"

namespace lsm::types {

ExpirationStatus classify(const TimePoint expiresAt, const std::chrono::seconds threshold, const TimePoint now) {
    if (now > expiresAt) return ExpirationStatus::Expired;
    if (now + threshold >= expiresAt) return ExpirationStatus::Expiring;
    return ExpirationStatus::Valid;
}

std::string_view to_string(const ExpirationStatus status) {
    switch (status) {
    case ExpirationStatus::Valid: return "valid";
    case ExpirationStatus::Expiring: return "expiring";
    case ExpirationStatus::Expired: return "expired";
    }
    return "unknown";
}

}
