#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace pkexport::crypto {

/**
 * AES-256-GCM authenticated encryption.
 *
 * Stateless. The caller supplies a nonce that is unique for the key; the
 * ECIES encrypter derives a fresh key per message, so a random nonce there is
 * never reused under the same key.
 *
 * Output layout of Encrypt: ciphertext || tag (16 bytes).
 */
class AesGcm {
public:
    explicit AesGcm(const CryptoBackend& backend) : backend_(backend) {}

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure>
    Encrypt(std::span<const uint8_t> key,
            std::span<const uint8_t> nonce,
            std::span<const uint8_t> plaintext,
            std::span<const uint8_t> associated_data = {}) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure>
    Decrypt(std::span<const uint8_t> key,
            std::span<const uint8_t> nonce,
            std::span<const uint8_t> ciphertext_with_tag,
            std::span<const uint8_t> associated_data = {}) const;

private:
    const CryptoBackend& backend_;
};
}
