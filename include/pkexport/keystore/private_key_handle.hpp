#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/crypto/secure_memory_handle.hpp"
#include <string>
namespace pkexport::keystore {

/**
 * A private key obtained from a key store.
 *
 * Algorithm() reports the key type the way key stores name it ("RSA", "DSA",
 * "EC", ...). ToPkcs8Der() yields the unencrypted PrivateKeyInfo encoding in
 * guarded memory.
 */
class PrivateKeyHandle {
public:
    virtual ~PrivateKeyHandle() = default;

    [[nodiscard]] virtual EVP_PKEY* NativeKey() const = 0;

    [[nodiscard]] virtual std::string Algorithm() const = 0;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, ExportFailure> ToPkcs8Der() const = 0;
};

class EvpPrivateKeyHandle final : public PrivateKeyHandle {
public:
    explicit EvpPrivateKeyHandle(crypto::EvpPkeyPtr key) : key_(std::move(key)) {}

    [[nodiscard]] EVP_PKEY* NativeKey() const override { return key_.get(); }

    [[nodiscard]] std::string Algorithm() const override;

    [[nodiscard]] Result<crypto::SecureMemoryHandle, ExportFailure> ToPkcs8Der() const override;

private:
    crypto::EvpPkeyPtr key_;
};

/**
 * Key store style algorithm name for an OpenSSL key.
 */
[[nodiscard]] std::string KeyAlgorithmName(EVP_PKEY* key);
}
