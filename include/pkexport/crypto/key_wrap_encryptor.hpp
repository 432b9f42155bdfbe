#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/crypto/aes_key_wrap.hpp"
#include "pkexport/crypto/rsa_oaep.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace pkexport::crypto {

/**
 * CKM_RSA_AES_KEY_WRAP composite encryption.
 *
 * Output: [RSA-OAEP-SHA1(aes_key)] || [AES-KWP(aes_key, payload)]
 *
 * There is no length prefix. The boundary is the wrapping key's modulus size,
 * which the receiver knows out of band. The AES-256 key is drawn from the
 * libsodium CSPRNG into guarded memory on every call and wiped before
 * return, so encrypting the same payload twice never yields the same bytes.
 *
 * Failures are not retried here. Retrying with a fresh call is safe, since
 * it draws a new AES key, but that decision belongs to the caller.
 */
class KeyWrapEncryptor {
public:
    explicit KeyWrapEncryptor(const CryptoBackend& backend)
        : rsa_oaep_(backend), key_wrap_(backend) {}

    /**
     * @param wrapping_public_key RSA SubjectPublicKeyInfo as PEM or DER
     * @param payload bytes to protect (the PKCS#8 DER private key)
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        std::span<const uint8_t> wrapping_public_key,
        std::span<const uint8_t> payload) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        EVP_PKEY* wrapping_public_key,
        std::span<const uint8_t> payload) const;

private:
    RsaOaep rsa_oaep_;
    AesKeyWrap key_wrap_;
};
}
