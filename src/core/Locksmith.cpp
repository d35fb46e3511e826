#include "core/Locksmith.hpp"
#include "cache/DiskCache.hpp"
#include "concurrency/KeyedMutex.hpp"
#include "crypto/secrets/MasterKeyProvider.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"
#include "storage/CredentialStore.hpp"

#include <algorithm>
#include <sodium.h>

using namespace lsm::types;

namespace lsm::core {

Locksmith::Locksmith(std::shared_ptr<storage::CredentialStore> store,
                     std::unique_ptr<cache::DiskCache> cache,
                     Options options)
    : store_(std::move(store)), cache_(std::move(cache)), options_(std::move(options)) {
    if (!store_) throw InvalidArgumentError("Locksmith requires a credential store");
    if (!cache_) throw InvalidArgumentError("Locksmith requires a disk cache");
}

Locksmith::~Locksmith() = default;

std::unique_ptr<Locksmith> Locksmith::open(std::shared_ptr<storage::CredentialStore> store,
                                           const std::filesystem::path& cacheRoot,
                                           Options options) {
    crypto::secrets::MasterKeyProvider keyProvider(store, options.service);
    keyProvider.init();

    auto cache = std::make_unique<cache::DiskCache>(cacheRoot, keyProvider.getMasterKey());
    log::Registry::locksmith()->debug("[Locksmith] Opened cache at {} for service '{}'",
                                      cache->root().string(), options.service);

    return std::make_unique<Locksmith>(std::move(store), std::move(cache), std::move(options));
}

std::unique_ptr<Locksmith> Locksmith::open(std::shared_ptr<storage::CredentialStore> store,
                                           const std::filesystem::path& cacheRoot) {
    return open(std::move(store), cacheRoot, Options{});
}

void Locksmith::validateKey(const std::string& key) const {
    if (key.empty()) throw InvalidArgumentError("Secret key must not be empty");
    if (key == crypto::secrets::MasterKeyProvider::ACCOUNT)
        throw InvalidArgumentError("Secret key '" + key + "' is reserved");
    (void)cache_->resolvePath(key);
}

void Locksmith::set(const std::string& key, const std::string& value, const TimePoint expiresAt) {
    validateKey(key);
    if (expiresAt == TimePoint{}) throw InvalidArgumentError("Secret '" + key + "' requires an expiration");

    std::optional<concurrency::KeyedMutex::Guard> guard;
    if (options_.keyLocks) guard.emplace(*options_.keyLocks, key);

    const auto now = std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
    const Secret secret({value.begin(), value.end()}, now, expiresAt);

    auto payload = secret.serialize();
    try {
        store_->set(options_.service, key, payload, true);
    } catch (const Error&) {
        sodium_memzero(payload.data(), payload.size());
        throw;
    }
    sodium_memzero(payload.data(), payload.size());

    writeCache(key, secret);
    log::Registry::locksmith()->info("[Locksmith] Stored secret '{}'", key);
}

std::string Locksmith::get(const std::string& key) {
    auto secret = getWithMetadata(key);
    return secret.valueString();
}

Secret Locksmith::getWithMetadata(const std::string& key) {
    validateKey(key);

    std::optional<concurrency::KeyedMutex::Guard> guard;
    if (options_.keyLocks) guard.emplace(*options_.keyLocks, key);

    return readThrough(key);
}

Secret Locksmith::readThrough(const std::string& key) {
    if (auto cached = readCache(key)) {
        log::Registry::locksmith()->debug("[Locksmith] Cache hit for '{}'", key);
        return std::move(*cached);
    }

    auto payload = store_->get(options_.service, key, true, "Authentication required to access '" + key + "'");

    Secret secret;
    try {
        secret = Secret::deserialize(payload);
    } catch (const InvalidArgumentError& e) {
        sodium_memzero(payload.data(), payload.size());
        throw StoreFailureError("Corrupt credential store entry for '" + key + "': " + e.what());
    }
    sodium_memzero(payload.data(), payload.size());

    writeCache(key, secret);
    return secret;
}

std::optional<Secret> Locksmith::readCache(const std::string& key) const {
    try {
        if (cache_->isExpired(key, options_.cacheTTL)) return std::nullopt;
        return cache_->get(key);
    } catch (const Error& e) {
        log::Registry::locksmith()->warn("[Locksmith] Ignoring cache entry for '{}' ({}): {}",
                                         key, to_string(e.code), e.what());
        return std::nullopt;
    }
}

void Locksmith::writeCache(const std::string& key, const Secret& secret) const {
    try {
        cache_->set(key, secret);
    } catch (const Error& e) {
        log::Registry::locksmith()->warn("[Locksmith] Failed to cache '{}' ({}): {}",
                                         key, to_string(e.code), e.what());
    }
}

std::vector<std::string> Locksmith::list() {
    auto keys = store_->list(options_.service, true, "Authentication required to list secrets");
    std::erase(keys, std::string(crypto::secrets::MasterKeyProvider::ACCOUNT));
    std::ranges::sort(keys);
    return keys;
}

std::map<std::string, SecretMetadata> Locksmith::listWithMetadata() {
    std::map<std::string, SecretMetadata> out;
    for (const auto& key : list()) {
        auto& meta = out[key];
        if (const auto cached = readCache(key)) meta = cached->metadata();
    }
    return out;
}

void Locksmith::remove(const std::string& key) {
    validateKey(key);

    std::optional<concurrency::KeyedMutex::Guard> guard;
    if (options_.keyLocks) guard.emplace(*options_.keyLocks, key);

    try {
        cache_->remove(key);
    } catch (const Error& e) {
        log::Registry::locksmith()->warn("[Locksmith] Failed to drop cache entry for '{}': {}", key, e.what());
    }

    store_->remove(options_.service, key, true, "Authentication required to delete '" + key + "'");
    log::Registry::locksmith()->info("[Locksmith] Deleted secret '{}'", key);
}

}
