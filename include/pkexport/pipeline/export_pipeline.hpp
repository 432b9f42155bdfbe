#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/archive/archive_builder.hpp"
#include "pkexport/configuration/export_config.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/crypto/secure_memory_handle.hpp"
#include "pkexport/crypto/signer.hpp"
#include "pkexport/interfaces/i_hybrid_encrypter.hpp"
#include "pkexport/interfaces/i_keystore_provider.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
namespace pkexport::pipeline {

struct ExportOutcome {
    ExportStage final_stage;
    archive::ArchiveKind kind;
    std::filesystem::path path;
    size_t bytes_written;
    std::vector<std::string> entry_names;
};

/**
 * One private key export, run to completion or to the first failure.
 *
 *   Start -> KeyLoaded -> Encrypted -> [Signed] -> [CertificateFetched] -> Written -> Done
 *
 * Signed is entered only with a signing key; CertificateFetched when signing
 * or when the certificate was requested. A failure carries the stage that was
 * being entered and nothing is written for a failed run. Steps are never
 * retried.
 *
 * The backend, key store provider and hybrid service must outlive the
 * pipeline. One pipeline may run several configs in sequence, but not
 * concurrently.
 */
class ExportPipeline {
public:
    ExportPipeline(
        const crypto::CryptoBackend& backend,
        interfaces::IKeystoreProvider& keystore_provider,
        interfaces::IHybridEncrypter& hybrid_encrypter)
        : backend_(backend),
          keystore_provider_(keystore_provider),
          hybrid_encrypter_(hybrid_encrypter) {}

    [[nodiscard]] Result<ExportOutcome, ExportFailure> Run(const configuration::ExportConfig& config);

private:
    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Encrypt(
        const configuration::ExportConfig& config,
        const std::vector<uint8_t>& recipient_key,
        const crypto::SecureMemoryHandle& private_key_der) const;

    [[nodiscard]] Result<crypto::Signature, ExportFailure> Sign(
        const keystore::KeystoreKey& signing_key,
        std::span<const uint8_t> payload);

    [[nodiscard]] Result<std::string, ExportFailure> FetchCertificatePem(
        const keystore::KeystoreKey& key);

    const crypto::CryptoBackend& backend_;
    interfaces::IKeystoreProvider& keystore_provider_;
    interfaces::IHybridEncrypter& hybrid_encrypter_;
};
}
