#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/keystore/private_key_handle.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace pkexport::crypto {

struct Signature {
    std::vector<uint8_t> bytes;
    std::string algorithm;
};

/**
 * Detached SHA512with<Alg> signatures over the encrypted payload.
 *
 * Only RSA (PKCS#1 v1.5) and DSA keys are accepted. This mirrors the legacy
 * receiving side and is narrower than what OpenSSL can sign with; EC keys are
 * refused even though they would work.
 */
class Signer {
public:
    explicit Signer(const CryptoBackend& backend) : backend_(backend) {}

    /**
     * @param key_algorithm the key's algorithm name as reported by the key
     *        store; checked before @p signing_key is used at all
     */
    [[nodiscard]] Result<Signature, ExportFailure> Sign(
        std::span<const uint8_t> payload,
        const keystore::PrivateKeyHandle& signing_key,
        std::string_view key_algorithm) const;

    [[nodiscard]] static bool IsSupportedAlgorithm(std::string_view key_algorithm) noexcept;

    [[nodiscard]] static std::string SignatureAlgorithmName(std::string_view key_algorithm);

private:
    const CryptoBackend& backend_;
};
}
