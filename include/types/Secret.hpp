#pragma once

#include "types/Expiration.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lsm::types {

struct SecretMetadata {
    TimePoint created_at{}, expires_at{};

    // True when nothing is known about the secret (listing without a cache hit)
    [[nodiscard]] bool empty() const { return expires_at == TimePoint{}; }

    [[nodiscard]] ExpirationStatus status(std::chrono::seconds threshold, TimePoint now = Clock::now()) const;
};

// Owned exclusively by whoever retrieved it. The value buffer is wiped on
// zero(), on reassignment and on destruction.
struct Secret {
    std::vector<uint8_t> value;
    TimePoint created_at{}, expires_at{};

    Secret() = default;
    Secret(std::vector<uint8_t> value, TimePoint createdAt, TimePoint expiresAt);
    Secret(const Secret& other) = default;
    Secret(Secret&& other) noexcept = default;
    Secret& operator=(const Secret& other);
    Secret& operator=(Secret&& other) noexcept;
    ~Secret();

    void zero() noexcept;

    [[nodiscard]] std::string valueString() const { return {value.begin(), value.end()}; }
    [[nodiscard]] SecretMetadata metadata() const { return {created_at, expires_at}; }

    [[nodiscard]] std::chrono::seconds timeUntilExpiration(TimePoint now = Clock::now()) const;
    [[nodiscard]] bool isExpired(TimePoint now = Clock::now()) const { return now > expires_at; }
    [[nodiscard]] ExpirationStatus status(std::chrono::seconds threshold, TimePoint now = Clock::now()) const;

    // JSON: {"value": base64, "created_at": unix seconds, "expires_at": unix seconds}
    [[nodiscard]] std::vector<uint8_t> serialize() const;
    static Secret deserialize(const std::vector<uint8_t>& bytes);
};

}
