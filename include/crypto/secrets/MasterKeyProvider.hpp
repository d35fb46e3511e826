#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lsm::storage {
class CredentialStore;
}

namespace lsm::crypto::secrets {

// Obtains the 32-byte cache key. Generated once per installation and kept in
// the credential store under a reserved account without a biometric gate, so
// the cache can be decrypted transparently on every start.
class MasterKeyProvider {
public:
    static constexpr std::string_view ACCOUNT = "locksmith-master-cache-key";

    MasterKeyProvider(std::shared_ptr<storage::CredentialStore> store, std::string service);
    ~MasterKeyProvider();

    MasterKeyProvider(const MasterKeyProvider&) = delete;
    MasterKeyProvider& operator=(const MasterKeyProvider&) = delete;

    void init();  // load or generate; throws KeyUnavailableError
    [[nodiscard]] const std::vector<uint8_t>& getMasterKey() const;

    [[nodiscard]] bool initialized() const { return !masterKey_.empty(); }

private:
    std::shared_ptr<storage::CredentialStore> store_;
    std::string service_;
    std::vector<uint8_t> masterKey_;

    void generate_and_store();
};

}
