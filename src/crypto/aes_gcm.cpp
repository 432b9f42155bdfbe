#include "pkexport/crypto/aes_gcm.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
namespace pkexport::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    constexpr const char* kCipherName = "AES-256-GCM";

    Result<Unit, ExportFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != Constants::AES_KEY_SIZE) {
            return Result<Unit, ExportFailure>::Err(
                ExportFailure::Encryption(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        Constants::AES_KEY_SIZE, key.size())));
        }
        if (nonce.size() != Constants::AES_GCM_NONCE_SIZE) {
            return Result<Unit, ExportFailure>::Err(
                ExportFailure::Encryption(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        Constants::AES_GCM_NONCE_SIZE, nonce.size())));
        }
        return Result<Unit, ExportFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, ExportFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) const {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(valid).UnwrapErr());
    }
    EvpCipherPtr cipher(EVP_CIPHER_fetch(backend_.LibraryContext(), kCipherName, backend_.PropertyQuery()));
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!cipher || !ctx) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex2(ctx.get(), cipher.get(), key.data(), nonce.data(), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, ExportFailure>::Err(
                ExportFailure::Encryption(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + Constants::AES_GCM_TAG_SIZE);
    int ciphertext_len = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + Constants::AES_GCM_TAG_SIZE);
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, ExportFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) const {
    if (auto valid = ValidateKeyAndNonce(key, nonce); valid.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), Constants::AES_GCM_TAG_SIZE)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - Constants::AES_GCM_TAG_SIZE;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::vector<uint8_t> tag(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                             ciphertext_with_tag.end());

    EvpCipherPtr cipher(EVP_CIPHER_fetch(backend_.LibraryContext(), kCipherName, backend_.PropertyQuery()));
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!cipher || !ctx) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex2(ctx.get(), cipher.get(), key.data(), nonce.data(), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, ExportFailure>::Err(
                ExportFailure::Encryption(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(ciphertext_len);
    int plaintext_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(Constants::AES_GCM_TAG_SIZE),
                           tag.data()) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                "Authentication tag verification failed - data may have been tampered with"));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(output));
}
}
