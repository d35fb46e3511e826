#include "storage/MemoryCredentialStore.hpp"
#include "auth/Authenticator.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <sodium.h>

namespace lsm::storage {

MemoryCredentialStore::MemoryCredentialStore(std::shared_ptr<auth::Authenticator> authenticator)
    : authenticator_(std::move(authenticator)) {}

MemoryCredentialStore::~MemoryCredentialStore() {
    for (auto& [_, item] : items_) wipe(item);
}

void MemoryCredentialStore::wipe(Item& item) {
    if (!item.bytes.empty()) sodium_memzero(item.bytes.data(), item.bytes.size());
    item.bytes.clear();
}

// Runs outside mutex_: the prompt may block for as long as the user takes.
void MemoryCredentialStore::authenticate(const std::string& prompt) const {
    if (!authenticator_) {
        log::Registry::store()->error("[MemoryCredentialStore] Authentication required but no authenticator configured");
        throw AuthFailedError("No authenticator configured");
    }
    authenticator_->authenticate(prompt);
}

void MemoryCredentialStore::set(const std::string& ns, const std::string& key,
                                const std::vector<uint8_t>& bytes, const bool requireAuth) {
    if (requireAuth) authenticate("Authentication required to store '" + key + "'");

    std::scoped_lock lock(mutex_);
    const auto id = std::make_pair(ns, key);
    if (const auto it = items_.find(id); it != items_.end()) {
        wipe(it->second);
        items_.erase(it);
    }
    items_.emplace(id, Item{bytes, requireAuth});
}

std::vector<uint8_t> MemoryCredentialStore::get(const std::string& ns, const std::string& key,
                                                const bool requireAuth, const std::string& prompt) {
    bool gated = requireAuth;
    {
        std::scoped_lock lock(mutex_);
        const auto it = items_.find({ns, key});
        if (it == items_.end()) throw NotFoundError("Secret '" + key + "' not found");
        gated = gated || it->second.gated;
    }

    if (gated) authenticate(prompt);

    std::scoped_lock lock(mutex_);
    const auto it = items_.find({ns, key});
    if (it == items_.end()) throw NotFoundError("Secret '" + key + "' not found");
    return it->second.bytes;
}

void MemoryCredentialStore::remove(const std::string& ns, const std::string& key,
                                   const bool requireAuth, const std::string& prompt) {
    if (requireAuth) authenticate(prompt);

    std::scoped_lock lock(mutex_);
    if (const auto it = items_.find({ns, key}); it != items_.end()) {
        wipe(it->second);
        items_.erase(it);
    }
}

std::vector<std::string> MemoryCredentialStore::list(const std::string& ns,
                                                     const bool requireAuth, const std::string& prompt) {
    if (requireAuth) authenticate(prompt);

    std::scoped_lock lock(mutex_);
    std::vector<std::string> keys;
    for (const auto& [id, _] : items_)
        if (id.first == ns) keys.push_back(id.second);
    return keys;
}

size_t MemoryCredentialStore::size() const {
    std::scoped_lock lock(mutex_);
    return items_.size();
}

}
