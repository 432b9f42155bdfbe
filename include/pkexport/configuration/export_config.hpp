#pragma once

#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/keystore/keystore_key.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pkexport::configuration {

/// How the exported key is encrypted
enum class EncryptionMode : uint8_t {
    /// PEM private key handed to the hybrid EC service; recipient key is hex
    HybridEc = 0,

    /// CKM_RSA_AES_KEY_WRAP under an RSA wrapping key (PEM or DER SPKI)
    RsaAesKeyWrap = 1
};

/// Configuration for one export run
///
/// Built through a factory for the encryption mode, then refined:
///
/// @example
/// ```cpp
/// auto config = ExportConfig::RsaAesKeyWrap(key, wrapping_key_pem, "out.zip")
///                   .WithSigningKey(signing_key)
///                   .WithCertificate(true);
/// if (auto valid = config.Validate(); valid.IsErr()) { ... }
/// ```
class ExportConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static ExportConfig RsaAesKeyWrap(
        keystore::KeystoreKey key,
        std::vector<uint8_t> wrapping_public_key,
        std::filesystem::path output) {
        ExportConfig config(EncryptionMode::RsaAesKeyWrap, std::move(key), std::move(output));
        config.wrapping_public_key_ = std::move(wrapping_public_key);
        return config;
    }

    [[nodiscard]] static ExportConfig HybridEc(
        keystore::KeystoreKey key,
        std::string recipient_key_hex,
        std::filesystem::path output) {
        ExportConfig config(EncryptionMode::HybridEc, std::move(key), std::move(output));
        config.recipient_key_hex_ = std::move(recipient_key_hex);
        return config;
    }

    // =========================================================================
    // Refinement
    // =========================================================================

    /// Sign the encrypted payload with this key; implies a ZIP with the certificate
    [[nodiscard]] ExportConfig WithSigningKey(keystore::KeystoreKey signing_key) && {
        signing_key_ = std::move(signing_key);
        return std::move(*this);
    }

    [[nodiscard]] ExportConfig WithCertificate(const bool include) && {
        include_certificate_ = include;
        return std::move(*this);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] EncryptionMode Mode() const noexcept { return mode_; }
    [[nodiscard]] const keystore::KeystoreKey& Key() const noexcept { return key_; }
    [[nodiscard]] const std::filesystem::path& Output() const noexcept { return output_; }
    [[nodiscard]] const std::vector<uint8_t>& WrappingPublicKey() const noexcept { return wrapping_public_key_; }
    [[nodiscard]] const std::string& RecipientKeyHex() const noexcept { return recipient_key_hex_; }
    [[nodiscard]] const std::optional<keystore::KeystoreKey>& SigningKey() const noexcept { return signing_key_; }
    [[nodiscard]] bool IncludeCertificate() const noexcept { return include_certificate_; }

    /// A certificate goes into the archive when asked for or when signing
    [[nodiscard]] bool NeedsCertificate() const noexcept {
        return include_certificate_ || signing_key_.has_value();
    }

    /// Rejects configurations that cannot name a key, a destination or the
    /// mode's key material. Content of the key material is checked later,
    /// by the component that parses it.
    [[nodiscard]] Result<Unit, ExportFailure> Validate() const;

private:
    ExportConfig(EncryptionMode mode, keystore::KeystoreKey key, std::filesystem::path output)
        : mode_(mode), key_(std::move(key)), output_(std::move(output)) {}

    EncryptionMode mode_;
    keystore::KeystoreKey key_;
    std::filesystem::path output_;
    std::vector<uint8_t> wrapping_public_key_;
    std::string recipient_key_hex_;
    std::optional<keystore::KeystoreKey> signing_key_;
    bool include_certificate_ = false;
};

} // namespace pkexport::configuration
