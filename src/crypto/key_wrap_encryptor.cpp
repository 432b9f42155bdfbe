#include "pkexport/crypto/key_wrap_encryptor.hpp"
#include "pkexport/crypto/secure_memory_handle.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include "pkexport/debug/export_logger.hpp"

namespace pkexport::crypto {

Result<std::vector<uint8_t>, ExportFailure> KeyWrapEncryptor::Encrypt(
    std::span<const uint8_t> wrapping_public_key,
    std::span<const uint8_t> payload) const {
    auto key_result = rsa_oaep_.LoadPublicKey(wrapping_public_key);
    if (key_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(key_result).UnwrapErr());
    }
    const EvpPkeyPtr public_key = std::move(key_result).Unwrap();
    return Encrypt(public_key.get(), payload);
}

Result<std::vector<uint8_t>, ExportFailure> KeyWrapEncryptor::Encrypt(
    EVP_PKEY* wrapping_public_key,
    std::span<const uint8_t> payload) const {
    if (wrapping_public_key == nullptr) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::KeyFormat("Wrapping public key is null"));
    }

    auto aes_key_result = SodiumInterop::GenerateSecretKey(Constants::AES_KEY_SIZE);
    if (aes_key_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to generate AES key: {}", aes_key_result.UnwrapErr().message)));
    }
    const SecureMemoryHandle aes_key = std::move(aes_key_result).Unwrap();

    auto wrapped_result = aes_key.WithReadAccess(
        [this, wrapping_public_key, payload](std::span<const uint8_t> key)
            -> Result<std::vector<uint8_t>, ExportFailure> {
            auto wrapped_key = rsa_oaep_.Encrypt(wrapping_public_key, key);
            if (wrapped_key.IsErr()) {
                return wrapped_key;
            }
            auto wrapped_payload = key_wrap_.WrapWithPadding(key, payload);
            if (wrapped_payload.IsErr()) {
                return wrapped_payload;
            }

            std::vector<uint8_t> combined = std::move(wrapped_key).Unwrap();
            const std::vector<uint8_t> tail = std::move(wrapped_payload).Unwrap();
            combined.insert(combined.end(), tail.begin(), tail.end());
            return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(combined));
        });
    if (wrapped_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::FromSodiumFailure(wrapped_result.UnwrapErr()));
    }
    auto encrypted = std::move(wrapped_result).Unwrap();
    if (encrypted.IsOk()) {
        PKEXPORT_LOG_VALUE("KEY_WRAP", "rsa_block_size", RsaOaep::BlockSize(wrapping_public_key));
        PKEXPORT_LOG_VALUE("KEY_WRAP", "ciphertext_size", encrypted.Unwrap().size());
    }
    return encrypted;
}

} // namespace pkexport::crypto
