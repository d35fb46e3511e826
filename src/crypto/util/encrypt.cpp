#include "crypto/util/encrypt.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <cstring>
#include <mutex>

namespace lsm::crypto::util {

void init() {
    static std::once_flag flag;
    static bool ok = false;
    std::call_once(flag, [] { ok = sodium_init() >= 0; });
    if (!ok) throw std::runtime_error("libsodium failed to initialize");
}

std::vector<uint8_t> random_bytes(const size_t n) {
    init();
    std::vector<uint8_t> out(n);
    randombytes_buf(out.data(), out.size());
    return out;
}

std::vector<uint8_t> encrypt_chacha20poly1305(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_nonce)
{
    if (key.size() != KEY_SIZE) {
        log::Registry::crypto()->error("[encrypt_chacha20poly1305] Invalid key size: {} bytes", key.size());
        throw InvalidArgumentError("Invalid encryption key size");
    }

    out_nonce = random_bytes(NONCE_SIZE);

    std::vector<uint8_t> ciphertext(plaintext.size() + TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    crypto_aead_chacha20poly1305_ietf_encrypt(
        ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        nullptr, 0,  // no AAD
        nullptr, out_nonce.data(), key.data());

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> decrypt_chacha20poly1305(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce)
{
    if (key.size() != KEY_SIZE || nonce.size() != NONCE_SIZE) {
        log::Registry::crypto()->error("[decrypt_chacha20poly1305] Invalid key or nonce size: "
                                       "key size = {}, nonce size = {}",
                                       key.size(), nonce.size());
        throw InvalidArgumentError("Invalid key or nonce size");
    }

    if (ciphertext_with_tag.size() < TAG_SIZE)
        throw DecryptionFailureError("Ciphertext shorter than its authentication tag");

    init();

    std::vector<uint8_t> decrypted(ciphertext_with_tag.size() - TAG_SIZE);
    unsigned long long decrypted_len = 0;

    if (crypto_aead_chacha20poly1305_ietf_decrypt(
            decrypted.data(), &decrypted_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            nullptr, 0,  // no AAD
            nonce.data(), key.data()) != 0)
    {
        throw DecryptionFailureError("Decryption failed: authentication error");
    }

    decrypted.resize(decrypted_len);
    return decrypted;
}

std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const std::vector<uint8_t>& key) {
    std::vector<uint8_t> nonce;
    const auto ciphertext = encrypt_chacha20poly1305(plaintext, key, nonce);

    std::vector<uint8_t> out;
    out.reserve(nonce.size() + ciphertext.size());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    return out;
}

std::vector<uint8_t> open(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key) {
    if (sealed.size() < NONCE_SIZE + TAG_SIZE)
        throw DecryptionFailureError("Sealed data too short");

    const std::vector nonce(sealed.begin(), sealed.begin() + NONCE_SIZE);
    const std::vector ciphertext(sealed.begin() + NONCE_SIZE, sealed.end());
    return decrypt_chacha20poly1305(ciphertext, key, nonce);
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    init();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        throw InvalidArgumentError("Invalid base64 payload");
    }
    decoded.resize(out_len);
    return decoded;
}

}
