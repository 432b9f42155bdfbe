#include "pkexport/crypto/signer.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include "pkexport/debug/export_logger.hpp"
#include <openssl/rsa.h>
namespace pkexport::crypto {

bool Signer::IsSupportedAlgorithm(const std::string_view key_algorithm) noexcept {
    return key_algorithm == SigningPolicy::ALGORITHM_RSA ||
           key_algorithm == SigningPolicy::ALGORITHM_DSA;
}

std::string Signer::SignatureAlgorithmName(const std::string_view key_algorithm) {
    return std::string(SigningPolicy::SIGNATURE_PREFIX) + std::string(key_algorithm);
}

Result<Signature, ExportFailure> Signer::Sign(
    std::span<const uint8_t> payload,
    const keystore::PrivateKeyHandle& signing_key,
    const std::string_view key_algorithm) const {
    if (!IsSupportedAlgorithm(key_algorithm)) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::UnsupportedAlgorithm(
                compat::format("{} (got {})",
                    ErrorMessages::UNSUPPORTED_SIGNING_ALGORITHM, key_algorithm)));
    }

    EVP_PKEY* key = signing_key.NativeKey();
    if (key == nullptr) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::Signing("Signing key is not available"));
    }

    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::Signing(
                compat::format("Failed to create digest context: {}", GetOpenSSLError())));
    }
    EVP_PKEY_CTX* pkey_ctx = nullptr;
    if (EVP_DigestSignInit_ex(md_ctx.get(), &pkey_ctx, SigningPolicy::DIGEST.data(),
                              backend_.LibraryContext(), backend_.PropertyQuery(),
                              key, nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::Signing(
                compat::format("Failed to initialize {}: {}",
                    SignatureAlgorithmName(key_algorithm), GetOpenSSLError())));
    }
    if (key_algorithm == SigningPolicy::ALGORITHM_RSA &&
        EVP_PKEY_CTX_set_rsa_padding(pkey_ctx, RSA_PKCS1_PADDING) != OpenSSLConstants::SUCCESS) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::Signing(
                compat::format("Failed to select PKCS#1 v1.5 padding: {}", GetOpenSSLError())));
    }

    size_t signature_len = 0;
    if (EVP_DigestSign(md_ctx.get(), nullptr, &signature_len,
                       payload.data(), payload.size()) != OpenSSLConstants::SUCCESS) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::Signing(
                compat::format("Signature size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> signature(signature_len);
    if (EVP_DigestSign(md_ctx.get(), signature.data(), &signature_len,
                       payload.data(), payload.size()) != OpenSSLConstants::SUCCESS) {
        return Result<Signature, ExportFailure>::Err(
            ExportFailure::Signing(
                compat::format("Signing failed: {}", GetOpenSSLError())));
    }
    signature.resize(signature_len);

    PKEXPORT_LOG_MSG("SIGN", SignatureAlgorithmName(key_algorithm));
    PKEXPORT_LOG_VALUE("SIGN", "signature_size", signature.size());
    return Result<Signature, ExportFailure>::Ok(
        Signature{std::move(signature), SignatureAlgorithmName(key_algorithm)});
}
}
