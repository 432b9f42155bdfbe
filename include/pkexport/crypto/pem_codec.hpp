#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace pkexport::crypto {

/**
 * PEM text encoding for DER objects.
 *
 * Output layout, byte exact:
 *
 *   -----BEGIN <label>-----\n
 *   <standard padded base64, 64 characters per line>\n
 *   -----END <label>-----\n
 *
 * The last base64 line may be shorter than 64 characters; there is never a
 * blank line inside the block. External verifiers parse this output with
 * stock PEM readers, so the layout must not drift.
 */
class PemCodec {
public:
    [[nodiscard]] static std::string ToPem(
        std::span<const uint8_t> der,
        std::string_view label);

    [[nodiscard]] static std::vector<uint8_t> ToPemBytes(
        std::span<const uint8_t> der,
        std::string_view label);

    /**
     * Extracts the DER body of the first block carrying @p label. Line breaks
     * and surrounding whitespace inside the block are ignored.
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, ExportFailure> FromPem(
        std::string_view pem,
        std::string_view label);

    [[nodiscard]] static bool LooksLikePem(std::span<const uint8_t> bytes);

    [[nodiscard]] static std::string Base64Encode(std::span<const uint8_t> data);
private:
    PemCodec() = delete;
};
}
