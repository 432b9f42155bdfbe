#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace pkexport::interfaces {

/**
 * Opaque public-key encryption service used for the hybrid EC mode.
 *
 * The ciphertext format belongs to the implementation. Callers only pass the
 * recipient key as received and hand the result on unchanged.
 */
class IHybridEncrypter {
public:
    virtual ~IHybridEncrypter() = default;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        std::span<const uint8_t> recipient_public_key,
        std::span<const uint8_t> plaintext) = 0;
};
}
