#include "types/Secret.hpp"
#include "crypto/util/encrypt.hpp"
#include "errors/Error.hpp"

#include <nlohmann/json.hpp>
#include <sodium.h>

using namespace std::chrono;
using json = nlohmann::json;

namespace lsm::types {

static int64_t toUnix(const TimePoint tp) {
    return duration_cast<seconds>(tp.time_since_epoch()).count();
}

static TimePoint fromUnix(const int64_t s) {
    return TimePoint{duration_cast<Clock::duration>(seconds(s))};
}

// Unix seconds that fit the clock's representation; anything else throws
static TimePoint readUnix(const json& field, const char* name) {
    static const int64_t kMax = duration_cast<seconds>(Clock::duration::max()).count();
    static const int64_t kMin = duration_cast<seconds>(Clock::duration::min()).count();

    if (field.is_number_unsigned()) {
        if (field.get<uint64_t>() > static_cast<uint64_t>(kMax))
            throw InvalidArgumentError(std::string("Secret payload ") + name + " is out of range");
        return fromUnix(static_cast<int64_t>(field.get<uint64_t>()));
    }

    const auto s = field.get<int64_t>();
    if (s > kMax || s < kMin) throw InvalidArgumentError(std::string("Secret payload ") + name + " is out of range");
    return fromUnix(s);
}

ExpirationStatus SecretMetadata::status(const seconds threshold, const TimePoint now) const {
    return classify(expires_at, threshold, now);
}

Secret::Secret(std::vector<uint8_t> value, const TimePoint createdAt, const TimePoint expiresAt)
    : value(std::move(value)), created_at(createdAt), expires_at(expiresAt) {}

Secret& Secret::operator=(const Secret& other) {
    if (this == &other) return *this;
    zero();
    value = other.value;
    created_at = other.created_at;
    expires_at = other.expires_at;
    return *this;
}

Secret& Secret::operator=(Secret&& other) noexcept {
    if (this == &other) return *this;
    zero();
    value = std::move(other.value);
    other.value.clear();
    created_at = other.created_at;
    expires_at = other.expires_at;
    return *this;
}

Secret::~Secret() { zero(); }

void Secret::zero() noexcept {
    if (!value.empty()) sodium_memzero(value.data(), value.size());
    value.clear();
}

seconds Secret::timeUntilExpiration(const TimePoint now) const {
    return duration_cast<seconds>(expires_at - now);
}

ExpirationStatus Secret::status(const seconds threshold, const TimePoint now) const {
    return classify(expires_at, threshold, now);
}

std::vector<uint8_t> Secret::serialize() const {
    std::string encoded = crypto::util::b64_encode(value);
    const json j = {
        {"value", encoded},
        {"created_at", toUnix(created_at)},
        {"expires_at", toUnix(expires_at)}
    };
    sodium_memzero(encoded.data(), encoded.size());

    std::string dumped = j.dump();
    std::vector<uint8_t> out(dumped.begin(), dumped.end());
    sodium_memzero(dumped.data(), dumped.size());
    return out;
}

Secret Secret::deserialize(const std::vector<uint8_t>& bytes) {
    const json j = json::parse(bytes.begin(), bytes.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        throw InvalidArgumentError("Malformed secret payload");

    if (!j.contains("value") || !j["value"].is_string())
        throw InvalidArgumentError("Secret payload is missing its value");
    if (!j.contains("expires_at") || !j["expires_at"].is_number_integer())
        throw InvalidArgumentError("Secret payload is missing an explicit expiry");

    Secret secret;
    secret.value = crypto::util::b64_decode(j["value"].get_ref<const std::string&>());
    if (j.contains("created_at") && j["created_at"].is_number_integer())
        secret.created_at = readUnix(j["created_at"], "created_at");
    secret.expires_at = readUnix(j["expires_at"], "expires_at");
    return secret;
}

}
