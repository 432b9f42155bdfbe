#pragma once

#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"

#include <openssl/crypto.h>
#include <openssl/provider.h>

namespace pkexport::crypto {

/**
 * @brief Explicit handle on the OpenSSL provider set used for one export run
 *
 * Every component that touches OpenSSL receives a reference to a backend
 * instead of relying on process-wide provider registration. The backend owns
 * a private OSSL_LIB_CTX with the default provider loaded, so algorithm
 * fetches made during a run never depend on global configuration. The legacy
 * provider is loaded too when it is installed: PKCS#12 files written by
 * OpenSSL 1.x and older keytool releases encrypt their certificates with
 * RC2-40, which only that provider implements.
 *
 * Not shared between threads; each run creates its own.
 */
class CryptoBackend {
public:
    /**
     * @brief Create a library context and load the default provider into it
     *
     * A missing legacy provider is not an error. Also initializes libsodium,
     * which supplies the CSPRNG and secure memory.
     */
    static Result<CryptoBackend, ExportFailure> Create();

    ~CryptoBackend();
    CryptoBackend(CryptoBackend&& other) noexcept;
    CryptoBackend& operator=(CryptoBackend&& other) noexcept;
    CryptoBackend(const CryptoBackend&) = delete;
    CryptoBackend& operator=(const CryptoBackend&) = delete;

    [[nodiscard]] OSSL_LIB_CTX* LibraryContext() const noexcept { return lib_ctx_; }

    [[nodiscard]] bool HasLegacyAlgorithms() const noexcept { return legacy_provider_ != nullptr; }

    /**
     * @brief Property query passed to every fetch; nullptr selects any provider
     */
    [[nodiscard]] const char* PropertyQuery() const noexcept { return nullptr; }

private:
    CryptoBackend(OSSL_LIB_CTX* lib_ctx, OSSL_PROVIDER* provider, OSSL_PROVIDER* legacy_provider) noexcept
        : lib_ctx_(lib_ctx), provider_(provider), legacy_provider_(legacy_provider) {}

    void Release() noexcept;

    OSSL_LIB_CTX* lib_ctx_;
    OSSL_PROVIDER* provider_;
    OSSL_PROVIDER* legacy_provider_;
};

} // namespace pkexport::crypto
