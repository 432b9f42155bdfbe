#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/signer.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace pkexport::archive {

enum class ArchiveKind : uint8_t {
    BareCiphertext,
    ZipArchive
};

[[nodiscard]] constexpr std::string_view ArchiveKindName(const ArchiveKind kind) noexcept {
    return kind == ArchiveKind::ZipArchive ? "zip" : "bare";
}

struct ExportArchive {
    ArchiveKind kind;
    std::filesystem::path path;
    std::vector<uint8_t> bytes;
    std::vector<std::string> entry_names;
};

/**
 * Writes the export artifact to a destination fixed at construction.
 *
 * A payload with neither signature nor certificate is written as is. Anything
 * else becomes a ZIP with, in order:
 *
 *   encryptedPrivateKeySignature   (only with a signature)
 *   encryptedPrivateKey
 *   certificate.pem                (only with a certificate)
 *
 * The destination is never overwritten and never left half-written: the
 * bytes go to a temporary file in the same directory, which is then
 * hard-linked into place. link(2) fails if the name exists, so two builders
 * racing for one path produce exactly one winner.
 */
class ArchiveBuilder {
public:
    explicit ArchiveBuilder(std::filesystem::path destination)
        : destination_(std::move(destination)) {}

    [[nodiscard]] Result<ExportArchive, ExportFailure> Build(
        const std::optional<crypto::Signature>& signature,
        std::span<const uint8_t> payload,
        const std::optional<std::string>& certificate_pem) const;

    [[nodiscard]] const std::filesystem::path& Destination() const noexcept { return destination_; }

    [[nodiscard]] static Result<Unit, ExportFailure> CommitAtomically(
        const std::filesystem::path& destination,
        std::span<const uint8_t> bytes);

private:
    std::filesystem::path destination_;
};
}
