#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"

namespace pkexport::crypto {

std::string GetOpenSSLError() {
    unsigned long err = OpenSSLConstants::NO_ERROR;
    unsigned long last = OpenSSLConstants::NO_ERROR;
    while ((err = ERR_get_error()) != OpenSSLConstants::NO_ERROR) {
        last = err;
    }
    if (last == OpenSSLConstants::NO_ERROR) {
        return std::string(OpenSSLConstants::UNKNOWN_ERROR_MESSAGE);
    }
    char buffer[Constants::OPENSSL_ERROR_BUFFER_SIZE];
    ERR_error_string_n(last, buffer, sizeof(buffer));
    return std::string(buffer);
}

Result<CryptoBackend, ExportFailure> CryptoBackend::Create() {
    auto sodium_result = SodiumInterop::Initialize();
    if (sodium_result.IsErr()) {
        return Result<CryptoBackend, ExportFailure>::Err(
            ExportFailure::FromSodiumFailure(sodium_result.UnwrapErr()));
    }

    OSSL_LIB_CTX* lib_ctx = OSSL_LIB_CTX_new();
    if (lib_ctx == nullptr) {
        return Result<CryptoBackend, ExportFailure>::Err(
            ExportFailure::Generic(
                compat::format("Failed to create OpenSSL library context: {}", GetOpenSSLError())));
    }
    OSSL_PROVIDER* provider = OSSL_PROVIDER_load(lib_ctx, "default");
    if (provider == nullptr) {
        OSSL_LIB_CTX_free(lib_ctx);
        return Result<CryptoBackend, ExportFailure>::Err(
            ExportFailure::Generic(
                compat::format("Failed to load OpenSSL default provider: {}", GetOpenSSLError())));
    }
    OSSL_PROVIDER* legacy_provider = OSSL_PROVIDER_try_load(lib_ctx, "legacy", 1);
    if (legacy_provider == nullptr) {
        ERR_clear_error();
    }
    return Result<CryptoBackend, ExportFailure>::Ok(CryptoBackend(lib_ctx, provider, legacy_provider));
}

CryptoBackend::~CryptoBackend() {
    Release();
}

CryptoBackend::CryptoBackend(CryptoBackend&& other) noexcept
    : lib_ctx_(other.lib_ctx_)
    , provider_(other.provider_)
    , legacy_provider_(other.legacy_provider_) {
    other.lib_ctx_ = nullptr;
    other.provider_ = nullptr;
    other.legacy_provider_ = nullptr;
}

CryptoBackend& CryptoBackend::operator=(CryptoBackend&& other) noexcept {
    if (this != &other) {
        Release();
        lib_ctx_ = other.lib_ctx_;
        provider_ = other.provider_;
        legacy_provider_ = other.legacy_provider_;
        other.lib_ctx_ = nullptr;
        other.provider_ = nullptr;
        other.legacy_provider_ = nullptr;
    }
    return *this;
}

void CryptoBackend::Release() noexcept {
    if (legacy_provider_ != nullptr) {
        OSSL_PROVIDER_unload(legacy_provider_);
        legacy_provider_ = nullptr;
    }
    if (provider_ != nullptr) {
        OSSL_PROVIDER_unload(provider_);
        provider_ = nullptr;
    }
    if (lib_ctx_ != nullptr) {
        OSSL_LIB_CTX_free(lib_ctx_);
        lib_ctx_ = nullptr;
    }
}

} // namespace pkexport::crypto
