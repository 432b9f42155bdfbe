#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/interfaces/i_hybrid_encrypter.hpp"
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
namespace pkexport::crypto {

/**
 * Hybrid EC export mode.
 *
 * The private key travels to the encryption service as a PEM "PRIVATE KEY"
 * block, not as raw DER. The service's output is returned untouched.
 */
class HybridEncryptionAdapter {
public:
    explicit HybridEncryptionAdapter(interfaces::IHybridEncrypter& service) : service_(service) {}

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        std::span<const uint8_t> recipient_public_key,
        std::span<const uint8_t> private_key_der) const;

    /**
     * Hex text of the recipient key, as given on the command line.
     * Odd length or a non-hex digit is an InputFormat failure.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ExportFailure> DecodeRecipientKeyHex(
        std::string_view hex);

private:
    interfaces::IHybridEncrypter& service_;
};
}
