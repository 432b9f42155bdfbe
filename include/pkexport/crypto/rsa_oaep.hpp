#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace pkexport::crypto {

/**
 * RSAES-OAEP with SHA-1 as both the OAEP digest and the MGF1 digest.
 *
 * SHA-1 here is a fixed interoperability requirement of the receiving side,
 * not a recommendation; switching to SHA-256 silently breaks decryption on
 * the other end. Do not make it configurable.
 */
class RsaOaep {
public:
    explicit RsaOaep(const CryptoBackend& backend) : backend_(backend) {}

    /**
     * Parses an RSA SubjectPublicKeyInfo given either as a PEM "PUBLIC KEY"
     * block or as raw DER. Anything else, including non-RSA keys, is a
     * KeyFormat failure.
     */
    [[nodiscard]] Result<EvpPkeyPtr, ExportFailure> LoadPublicKey(
        std::span<const uint8_t> encoded) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        EVP_PKEY* public_key,
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Decrypt(
        EVP_PKEY* private_key,
        std::span<const uint8_t> ciphertext) const;

    /**
     * Size in bytes of one OAEP block under @p key; the wrapped AES key at
     * the head of an RSA-AES payload has exactly this length.
     */
    [[nodiscard]] static size_t BlockSize(EVP_PKEY* key);

private:
    [[nodiscard]] Result<EvpPkeyCtxPtr, ExportFailure> PrepareContext(
        EVP_PKEY* key,
        bool encrypting) const;

    const CryptoBackend& backend_;
};
}
