#include "pkexport/crypto/hkdf.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"

#include <openssl/kdf.h>
#include <openssl/params.h>
#include <string>

namespace pkexport::crypto {

Result<Unit, ExportFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) const {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("HKDF output size must be in [1, {}], got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }

    if (ikm.empty()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Encryption("HKDF input key material cannot be empty"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(backend_.LibraryContext(),
                                 OpenSSLConstants::ALGORITHM_HKDF.data(),
                                 backend_.PropertyQuery());
    if (!kdf) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to fetch HKDF algorithm: {}", GetOpenSSLError())));
    }
    EvpKdfCtxPtr kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to create HKDF context: {}", GetOpenSSLError())));
    }

    std::string digest(OpenSSLConstants::ALGORITHM_SHA256);
    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(), digest.data(), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_KEY.data(), const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_SALT.data(), const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OpenSSLConstants::PARAM_INFO.data(), const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        SodiumInterop::SecureWipe(output);
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("HKDF key derivation failed: {}", GetOpenSSLError())));
    }
    return Result<Unit, ExportFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ExportFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) const {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(output));
}

} // namespace pkexport::crypto
