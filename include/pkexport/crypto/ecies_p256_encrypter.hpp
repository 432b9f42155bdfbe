#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/crypto/aes_gcm.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/crypto/hkdf.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/interfaces/i_hybrid_encrypter.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace pkexport::crypto {

/**
 * ECIES over P-256, the default hybrid encryption service.
 *
 * Wire format:
 *   [0..64]    ephemeral public point, uncompressed SEC1
 *   [65..76]   AES-GCM nonce
 *   [77..]     AES-256-GCM ciphertext || tag (16 bytes)
 *
 * key = HKDF-SHA256(ikm = ECDH(ephemeral, recipient),
 *                   salt = ephemeral point,
 *                   info = "pkexport-ecies-p256-v1")
 *
 * Each call draws a new ephemeral key pair, so the derived key and the nonce
 * are never reused together.
 */
class EciesP256Encrypter final : public interfaces::IHybridEncrypter {
public:
    explicit EciesP256Encrypter(const CryptoBackend& backend)
        : backend_(backend), hkdf_(backend), aes_gcm_(backend) {}

    /**
     * @param recipient_public_key 65-byte uncompressed point or SPKI DER
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        std::span<const uint8_t> recipient_public_key,
        std::span<const uint8_t> plaintext) override;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Decrypt(
        EVP_PKEY* recipient_private_key,
        std::span<const uint8_t> ciphertext) const;

    [[nodiscard]] Result<EvpPkeyPtr, ExportFailure> LoadRecipientKey(
        std::span<const uint8_t> encoded) const;

    [[nodiscard]] static Result<std::vector<uint8_t>, ExportFailure> EncodePublicPoint(
        EVP_PKEY* key);

    static constexpr size_t HEADER_SIZE =
        Constants::EC_P256_UNCOMPRESSED_POINT_SIZE + Constants::AES_GCM_NONCE_SIZE;

private:
    [[nodiscard]] Result<EvpPkeyPtr, ExportFailure> PointToKey(
        std::span<const uint8_t> point) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> DeriveMessageKey(
        EVP_PKEY* own_key,
        EVP_PKEY* peer_key,
        std::span<const uint8_t> ephemeral_point) const;

    const CryptoBackend& backend_;
    Hkdf hkdf_;
    AesGcm aes_gcm_;
};
}
