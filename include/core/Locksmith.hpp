#pragma once

#include "types/Secret.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lsm::storage {
class CredentialStore;
}

namespace lsm::cache {
class DiskCache;
}

namespace lsm::concurrency {
class KeyedMutex;
}

namespace lsm::core {

inline constexpr auto kDefaultService = "com.locksmith.keychain";
inline constexpr std::chrono::seconds kDefaultCacheTTL = std::chrono::hours(1);

// Two-tier secret store. The credential store is authoritative and every
// write or fallback read through it is gated. The encrypted disk cache
// serves reads without a prompt while its entry is younger than the TTL.
class Locksmith {
public:
    struct Options {
        std::string service = kDefaultService;
        std::chrono::seconds cacheTTL = kDefaultCacheTTL;
        std::shared_ptr<concurrency::KeyedMutex> keyLocks;  // null: same-key calls are not serialized
    };

    Locksmith(std::shared_ptr<storage::CredentialStore> store,
              std::unique_ptr<cache::DiskCache> cache,
              Options options);
    ~Locksmith();

    Locksmith(const Locksmith&) = delete;
    Locksmith& operator=(const Locksmith&) = delete;

    // Loads or creates the master key, then opens the cache at cacheRoot.
    // Throws KeyUnavailableError.
    static std::unique_ptr<Locksmith> open(std::shared_ptr<storage::CredentialStore> store,
                                           const std::filesystem::path& cacheRoot,
                                           Options options);
    static std::unique_ptr<Locksmith> open(std::shared_ptr<storage::CredentialStore> store,
                                           const std::filesystem::path& cacheRoot);

    void set(const std::string& key, const std::string& value, types::TimePoint expiresAt);

    [[nodiscard]] std::string get(const std::string& key);
    [[nodiscard]] types::Secret getWithMetadata(const std::string& key);

    [[nodiscard]] std::vector<std::string> list();
    [[nodiscard]] std::map<std::string, types::SecretMetadata> listWithMetadata();

    void remove(const std::string& key);

    [[nodiscard]] const Options& options() const { return options_; }
    [[nodiscard]] const cache::DiskCache& cache() const { return *cache_; }

private:
    std::shared_ptr<storage::CredentialStore> store_;
    std::unique_ptr<cache::DiskCache> cache_;
    Options options_;

    void validateKey(const std::string& key) const;
    types::Secret readThrough(const std::string& key);
    std::optional<types::Secret> readCache(const std::string& key) const;
    void writeCache(const std::string& key, const types::Secret& secret) const;
};

}
