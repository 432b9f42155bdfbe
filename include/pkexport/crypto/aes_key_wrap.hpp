#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace pkexport::crypto {

/**
 * AES-256 Key Wrap with Padding (RFC 5649).
 *
 * Deterministic and IV-free; integrity comes from the alternative initial
 * value and the message length indicator embedded in the first semiblock.
 * A key must never wrap two different payloads if ciphertext equality would
 * leak anything, which is why KeyWrapEncryptor draws a fresh key per call.
 *
 * RFC 5649 does not define an encoding for an empty plaintext. An empty input
 * is emitted as the single-semiblock form with MLI = 0 and unwrapped back to
 * an empty buffer; every other length goes through OpenSSL's AES-256-WRAP-PAD
 * and is bit-compatible with other RFC 5649 implementations.
 */
class AesKeyWrap {
public:
    explicit AesKeyWrap(const CryptoBackend& backend) : backend_(backend) {}

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> WrapWithPadding(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> UnwrapWithPadding(
        std::span<const uint8_t> key,
        std::span<const uint8_t> wrapped) const;

private:
    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> RunWrapCipher(
        std::span<const uint8_t> key,
        std::span<const uint8_t> input,
        bool wrapping) const;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> RunSingleBlock(
        std::span<const uint8_t> key,
        std::span<const uint8_t> block,
        bool encrypting) const;

    const CryptoBackend& backend_;
};
}
