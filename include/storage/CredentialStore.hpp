#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lsm::storage {

// Platform credential store. Every call may block on a biometric or fallback
// prompt when authentication is required. Failures surface as lsm::Error:
// AuthCanceled, AuthFailed, NotFound (get only) or StoreFailure.
class CredentialStore {
public:
    virtual ~CredentialStore() = default;

    // Always deletes then re-adds the entry so overwrite is idempotent.
    virtual void set(const std::string& ns, const std::string& key,
                     const std::vector<uint8_t>& bytes, bool requireAuth) = 0;

    [[nodiscard]] virtual std::vector<uint8_t> get(const std::string& ns, const std::string& key,
                                                   bool requireAuth, const std::string& prompt) = 0;

    // Absence of the entry is not an error.
    virtual void remove(const std::string& ns, const std::string& key,
                        bool requireAuth, const std::string& prompt) = 0;

    [[nodiscard]] virtual std::vector<std::string> list(const std::string& ns,
                                                        bool requireAuth, const std::string& prompt) = 0;
};

}
