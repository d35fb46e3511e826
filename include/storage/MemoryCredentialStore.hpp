#pragma once

#include "storage/CredentialStore.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace lsm::auth {
class Authenticator;
}

namespace lsm::storage {

// Process-local credential store. Entries written with requireAuth stay
// gated: reading them prompts even when the caller does not ask for it.
class MemoryCredentialStore : public CredentialStore {
public:
    explicit MemoryCredentialStore(std::shared_ptr<auth::Authenticator> authenticator);
    ~MemoryCredentialStore() override;

    void set(const std::string& ns, const std::string& key,
             const std::vector<uint8_t>& bytes, bool requireAuth) override;

    [[nodiscard]] std::vector<uint8_t> get(const std::string& ns, const std::string& key,
                                           bool requireAuth, const std::string& prompt) override;

    void remove(const std::string& ns, const std::string& key,
                bool requireAuth, const std::string& prompt) override;

    [[nodiscard]] std::vector<std::string> list(const std::string& ns,
                                                bool requireAuth, const std::string& prompt) override;

    [[nodiscard]] size_t size() const;

private:
    struct Item {
        std::vector<uint8_t> bytes;
        bool gated = false;
    };

    mutable std::mutex mutex_;
    std::shared_ptr<auth::Authenticator> authenticator_;
    std::map<std::pair<std::string, std::string>, Item> items_;

    void authenticate(const std::string& prompt) const;
    static void wipe(Item& item);
};

}
