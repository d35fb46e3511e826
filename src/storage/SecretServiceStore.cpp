#include "storage/SecretServiceStore.hpp"
#include "auth/Authenticator.hpp"
#include "crypto/util/encrypt.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <libsecret/secret.h>
#include <sodium.h>
#include <cstring>
#include <memory>
#include <fmt/core.h>

namespace lsm::storage {

namespace {

const SecretSchema* schema() {
    static const SecretSchema s = {
        "com.locksmith.Secret", SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"account", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"gated", SECRET_SCHEMA_ATTRIBUTE_BOOLEAN},
            {nullptr, SecretSchemaAttributeType(0)}
        }
    };
    return &s;
}

struct GErrorDeleter {
    void operator()(GError* e) const { if (e) g_error_free(e); }
};
using ErrorPtr = std::unique_ptr<GError, GErrorDeleter>;

struct GListDeleter {
    void operator()(GList* l) const { if (l) g_list_free_full(l, g_object_unref); }
};
using ItemList = std::unique_ptr<GList, GListDeleter>;

struct HashTableDeleter {
    void operator()(GHashTable* t) const { if (t) g_hash_table_unref(t); }
};
using Attributes = std::unique_ptr<GHashTable, HashTableDeleter>;

[[noreturn]] void throwStoreError(const char* op, GError* raw) {
    const ErrorPtr err(raw);
    const std::string detail = err ? err->message : "unknown error";
    log::Registry::store()->error("[SecretServiceStore] {} failed: {}", op, detail);
    throw StoreFailureError(fmt::format("Secret Service {} failed: {}", op, detail));
}

ItemList search(const std::string& ns, const std::string* key) {
    GError* raw = nullptr;
    GList* items = key
        ? secret_password_search_sync(schema(), SECRET_SEARCH_ALL, nullptr, &raw,
                                      "service", ns.c_str(), "account", key->c_str(), nullptr)
        : secret_password_search_sync(schema(), SECRET_SEARCH_ALL, nullptr, &raw,
                                      "service", ns.c_str(), nullptr);
    if (raw) throwStoreError("search", raw);
    return ItemList(items);
}

std::string attribute(SecretRetrievable* item, const char* name) {
    const Attributes attrs(secret_retrievable_get_attributes(item));
    if (!attrs) return {};
    const auto* value = static_cast<const char*>(g_hash_table_lookup(attrs.get(), name));
    return value ? value : "";
}

}

SecretServiceStore::SecretServiceStore(std::shared_ptr<auth::Authenticator> authenticator)
    : authenticator_(std::move(authenticator)) {}

void SecretServiceStore::authenticate(const std::string& prompt) const {
    if (!authenticator_) throw AuthFailedError("No authenticator configured");
    authenticator_->authenticate(prompt);
}

void SecretServiceStore::set(const std::string& ns, const std::string& key,
                             const std::vector<uint8_t>& bytes, const bool requireAuth) {
    if (requireAuth) authenticate("Authentication required to store '" + key + "'");

    GError* raw = nullptr;
    secret_password_clear_sync(schema(), nullptr, &raw,
                               "service", ns.c_str(), "account", key.c_str(), nullptr);
    if (raw) throwStoreError("clear", raw);

    std::string encoded = crypto::util::b64_encode(bytes);
    const auto label = fmt::format("{} ({})", key, ns);
    const gboolean stored = secret_password_store_sync(
        schema(), SECRET_COLLECTION_DEFAULT, label.c_str(), encoded.c_str(), nullptr, &raw,
        "service", ns.c_str(), "account", key.c_str(), "gated", static_cast<gboolean>(requireAuth), nullptr);
    sodium_memzero(encoded.data(), encoded.size());

    if (raw) throwStoreError("store", raw);
    if (!stored) throw StoreFailureError("Secret Service refused to store '" + key + "'");
    log::Registry::store()->debug("[SecretServiceStore] Stored '{}' (gated: {})", key, requireAuth);
}

std::vector<uint8_t> SecretServiceStore::get(const std::string& ns, const std::string& key,
                                             const bool requireAuth, const std::string& prompt) {
    const auto items = search(ns, &key);
    if (!items) throw NotFoundError("Secret '" + key + "' not found");

    auto* item = static_cast<SecretRetrievable*>(items->data);
    if (requireAuth || attribute(item, "gated") == "true") authenticate(prompt);

    GError* raw = nullptr;
    SecretValue* value = secret_retrievable_retrieve_secret_sync(item, nullptr, &raw);
    if (raw) throwStoreError("retrieve", raw);
    if (!value) throw NotFoundError("Secret '" + key + "' has no value");

    const std::unique_ptr<SecretValue, decltype(&secret_value_unref)> guard(value, &secret_value_unref);
    const gchar* text = secret_value_get_text(value);
    if (!text) throw StoreFailureError("Secret '" + key + "' is not a text item");

    try {
        return crypto::util::b64_decode(text);
    } catch (const InvalidArgumentError&) {
        throw StoreFailureError("Secret '" + key + "' holds a malformed payload");
    }
}

void SecretServiceStore::remove(const std::string& ns, const std::string& key,
                                const bool requireAuth, const std::string& prompt) {
    if (requireAuth) authenticate(prompt);

    GError* raw = nullptr;
    const gboolean removed = secret_password_clear_sync(schema(), nullptr, &raw,
                                                        "service", ns.c_str(), "account", key.c_str(), nullptr);
    if (raw) throwStoreError("clear", raw);
    if (!removed) log::Registry::store()->debug("[SecretServiceStore] Nothing to remove for '{}'", key);
}

std::vector<std::string> SecretServiceStore::list(const std::string& ns,
                                                  const bool requireAuth, const std::string& prompt) {
    if (requireAuth) authenticate(prompt);

    const auto items = search(ns, nullptr);
    std::vector<std::string> keys;
    for (const GList* it = items.get(); it; it = it->next) {
        auto account = attribute(static_cast<SecretRetrievable*>(it->data), "account");
        if (!account.empty()) keys.push_back(std::move(account));
    }
    return keys;
}

}
