#pragma once

#include <vector>
#include <cstdint>
#include <string>

namespace lsm::crypto::util {

constexpr size_t KEY_SIZE   = 32;    // 256-bit
constexpr size_t NONCE_SIZE = 12;    // IETF ChaCha20-Poly1305 nonce
constexpr size_t TAG_SIZE   = 16;    // Poly1305 tag

// Initializes libsodium once per process. Throws on failure.
void init();

std::vector<uint8_t> random_bytes(size_t n);

std::vector<uint8_t> encrypt_chacha20poly1305(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_nonce);

std::vector<uint8_t> decrypt_chacha20poly1305(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce);

// nonce || ciphertext || tag, with a fresh random nonce on every call
std::vector<uint8_t> seal(const std::vector<uint8_t>& plaintext, const std::vector<uint8_t>& key);
std::vector<uint8_t> open(const std::vector<uint8_t>& sealed, const std::vector<uint8_t>& key);

std::string b64_encode(const std::vector<uint8_t>& data);

std::vector<uint8_t> b64_decode(const std::string& b64);

}
