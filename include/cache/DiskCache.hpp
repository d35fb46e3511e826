#pragma once

#include "types/Secret.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lsm::cache {

// Encrypted, TTL-bounded local mirror of secrets. One file per key at
// <root>/<key> holding nonce (12 bytes) || ciphertext || tag. Keys are
// untrusted: anything resolving outside the root, or naming "..", throws
// TraversalAttemptError and is never rewritten into a safe name.
class DiskCache {
public:
    DiskCache(const std::filesystem::path& root, std::vector<uint8_t> masterKey);
    ~DiskCache();

    DiskCache(const DiskCache&) = delete;
    DiskCache& operator=(const DiskCache&) = delete;

    void set(const std::string& key, const types::Secret& secret) const;

    // nullopt when nothing is cached; DecryptionFailureError on a tampered
    // entry or a changed master key.
    [[nodiscard]] std::optional<types::Secret> get(const std::string& key) const;

    void remove(const std::string& key) const;

    // File mtime is the only age signal. Invalid keys and missing entries
    // count as expired.
    [[nodiscard]] bool isExpired(const std::string& key, std::chrono::seconds ttl) const;

    [[nodiscard]] std::filesystem::path resolvePath(const std::string& key) const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::vector<uint8_t> masterKey_;

    void writeAtomically(const std::filesystem::path& path, const std::vector<uint8_t>& data) const;
};

}
