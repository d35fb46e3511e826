#include "crypto/secrets/MasterKeyProvider.hpp"
#include "crypto/util/encrypt.hpp"
#include "storage/CredentialStore.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <sodium.h>

namespace lsm::crypto::secrets {

MasterKeyProvider::MasterKeyProvider(std::shared_ptr<storage::CredentialStore> store, std::string service)
    : store_(std::move(store)), service_(std::move(service)) {}

MasterKeyProvider::~MasterKeyProvider() {
    if (!masterKey_.empty()) sodium_memzero(masterKey_.data(), masterKey_.size());
}

void MasterKeyProvider::init() {
    if (!store_) throw KeyUnavailableError("No credential store available for the master key");

    try {
        auto key = store_->get(service_, std::string(ACCOUNT), false, "");
        if (key.size() != util::KEY_SIZE) {
            const auto size = key.size();
            sodium_memzero(key.data(), key.size());
            log::Registry::crypto()->error("[MasterKeyProvider] Stored master key has {} bytes, expected {}",
                                           size, util::KEY_SIZE);
            throw KeyUnavailableError("Stored master key has an invalid length");
        }
        masterKey_ = std::move(key);
        log::Registry::crypto()->debug("[MasterKeyProvider] Loaded master key for {}", service_);
        return;
    } catch (const NotFoundError&) {
        log::Registry::crypto()->info("[MasterKeyProvider] No master key for {}, generating one", service_);
    } catch (const KeyUnavailableError&) {
        throw;
    } catch (const Error& e) {
        log::Registry::crypto()->error("[MasterKeyProvider] Failed to read master key: {}", e.what());
        throw KeyUnavailableError(std::string("Failed to read master key: ") + e.what());
    }

    generate_and_store();
}

const std::vector<uint8_t>& MasterKeyProvider::getMasterKey() const {
    if (masterKey_.empty()) throw KeyUnavailableError("Master key requested before init()");
    return masterKey_;
}

void MasterKeyProvider::generate_and_store() {
    auto key = util::random_bytes(util::KEY_SIZE);

    try {
        store_->set(service_, std::string(ACCOUNT), key, false);
    } catch (const Error& e) {
        sodium_memzero(key.data(), key.size());
        log::Registry::crypto()->error("[MasterKeyProvider] Failed to persist master key: {}", e.what());
        throw KeyUnavailableError(std::string("Failed to persist master key: ") + e.what());
    }

    masterKey_ = std::move(key);
    log::Registry::crypto()->info("[MasterKeyProvider] Generated and stored a new master key for {}", service_);
}

}
