#pragma once

#include "storage/CredentialStore.hpp"

#include <memory>

namespace lsm::auth {
class Authenticator;
}

namespace lsm::storage {

// Linux adapter over the freedesktop Secret Service (libsecret). Items are
// keyed by service + account and remember whether they were written gated,
// so a gated item always goes through the authenticator before it is read.
class SecretServiceStore : public CredentialStore {
public:
    explicit SecretServiceStore(std::shared_ptr<auth::Authenticator> authenticator);

    void set(const std::string& ns, const std::string& key,
             const std::vector<uint8_t>& bytes, bool requireAuth) override;

    [[nodiscard]] std::vector<uint8_t> get(const std::string& ns, const std::string& key,
                                           bool requireAuth, const std::string& prompt) override;

    void remove(const std::string& ns, const std::string& key,
                bool requireAuth, const std::string& prompt) override;

    [[nodiscard]] std::vector<std::string> list(const std::string& ns,
                                                bool requireAuth, const std::string& prompt) override;

private:
    std::shared_ptr<auth::Authenticator> authenticator_;

    void authenticate(const std::string& prompt) const;
};

}
