#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace pkexport::crypto {

/**
 * HKDF-SHA256 (RFC 5869) over the backend's library context.
 *
 * Used by the ECIES recipient encryption to turn the raw ECDH shared secret
 * into an AES-256 key. Failures are reported as Encryption.
 */
class Hkdf {
public:
    explicit Hkdf(const CryptoBackend& backend) : backend_(backend) {}

    /**
     * Extract-then-expand into @p output.
     *
     * @param ikm input key material, must not be empty
     * @param salt optional; empty means a zero-filled salt of HASH_LEN
     * @param info optional context binding
     */
    [[nodiscard]] Result<Unit, ExportFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info) const;

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    const CryptoBackend& backend_;
};

}
