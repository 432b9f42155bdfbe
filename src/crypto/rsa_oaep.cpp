#include "pkexport/crypto/rsa_oaep.hpp"
#include "pkexport/crypto/pem_codec.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include <openssl/rsa.h>
#include <string_view>
namespace pkexport::crypto {
namespace {
    constexpr const char* kOaepDigest = "SHA1";
}

Result<EvpPkeyPtr, ExportFailure> RsaOaep::LoadPublicKey(std::span<const uint8_t> encoded) const {
    if (encoded.empty()) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat("Encryption public key is empty"));
    }
    std::vector<uint8_t> der;
    if (PemCodec::LooksLikePem(encoded)) {
        auto der_result = PemCodec::FromPem(
            std::string_view(reinterpret_cast<const char*>(encoded.data()), encoded.size()),
            PemLabels::PUBLIC_KEY);
        if (der_result.IsErr()) {
            return Result<EvpPkeyPtr, ExportFailure>::Err(std::move(der_result).UnwrapErr());
        }
        der = std::move(der_result).Unwrap();
    } else {
        der.assign(encoded.begin(), encoded.end());
    }

    const unsigned char* cursor = der.data();
    EvpPkeyPtr key(d2i_PUBKEY_ex(nullptr, &cursor, static_cast<long>(der.size()),
                                 backend_.LibraryContext(), backend_.PropertyQuery()));
    if (!key) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Encryption public key is not a valid X.509 SubjectPublicKeyInfo: {}",
                    GetOpenSSLError())));
    }
    if (EVP_PKEY_is_a(key.get(), "RSA") != 1) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Encryption public key must be RSA, got {}",
                    EVP_PKEY_get0_type_name(key.get()) != nullptr
                        ? EVP_PKEY_get0_type_name(key.get())
                        : "unknown")));
    }
    return Result<EvpPkeyPtr, ExportFailure>::Ok(std::move(key));
}

size_t RsaOaep::BlockSize(EVP_PKEY* key) {
    const int size = EVP_PKEY_get_size(key);
    return size > 0 ? static_cast<size_t>(size) : 0;
}

Result<EvpPkeyCtxPtr, ExportFailure> RsaOaep::PrepareContext(EVP_PKEY* key, const bool encrypting) const {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(
        backend_.LibraryContext(), key, backend_.PropertyQuery()));
    if (!ctx) {
        return Result<EvpPkeyCtxPtr, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to create RSA context: {}", GetOpenSSLError())));
    }
    const int init = encrypting
        ? EVP_PKEY_encrypt_init(ctx.get())
        : EVP_PKEY_decrypt_init(ctx.get());
    if (init != OpenSSLConstants::SUCCESS ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) != OpenSSLConstants::SUCCESS ||
        EVP_PKEY_CTX_set_rsa_oaep_md_name(ctx.get(), kOaepDigest, nullptr) != OpenSSLConstants::SUCCESS ||
        EVP_PKEY_CTX_set_rsa_mgf1_md_name(ctx.get(), kOaepDigest, nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<EvpPkeyCtxPtr, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to configure RSA-OAEP-SHA1: {}", GetOpenSSLError())));
    }
    return Result<EvpPkeyCtxPtr, ExportFailure>::Ok(std::move(ctx));
}

Result<std::vector<uint8_t>, ExportFailure> RsaOaep::Encrypt(
    EVP_PKEY* public_key,
    std::span<const uint8_t> plaintext) const {
    auto ctx_result = PrepareContext(public_key, true);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    EvpPkeyCtxPtr ctx = std::move(ctx_result).Unwrap();

    size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len,
                         plaintext.data(), plaintext.size()) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("RSA-OAEP size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> ciphertext(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &out_len,
                         plaintext.data(), plaintext.size()) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("RSA-OAEP encryption failed: {}", GetOpenSSLError())));
    }
    ciphertext.resize(out_len);
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(ciphertext));
}

Result<std::vector<uint8_t>, ExportFailure> RsaOaep::Decrypt(
    EVP_PKEY* private_key,
    std::span<const uint8_t> ciphertext) const {
    auto ctx_result = PrepareContext(private_key, false);
    if (ctx_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(ctx_result).UnwrapErr());
    }
    EvpPkeyCtxPtr ctx = std::move(ctx_result).Unwrap();

    size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len,
                         ciphertext.data(), ciphertext.size()) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("RSA-OAEP size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> plaintext(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len,
                         ciphertext.data(), ciphertext.size()) != OpenSSLConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(plaintext));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("RSA-OAEP decryption failed: {}", GetOpenSSLError())));
    }
    plaintext.resize(out_len);
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(plaintext));
}
}
