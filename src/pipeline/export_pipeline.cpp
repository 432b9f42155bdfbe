#include "pkexport/pipeline/export_pipeline.hpp"
#include "pkexport/crypto/hybrid_encryption_adapter.hpp"
#include "pkexport/crypto/key_wrap_encryptor.hpp"
#include "pkexport/crypto/pem_codec.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include "pkexport/debug/export_logger.hpp"

namespace pkexport::pipeline {
using configuration::EncryptionMode;
using configuration::ExportConfig;

namespace {
    template<typename T>
    Result<T, ExportFailure> FailAt(const ExportStage stage, ExportFailure failure) {
        failure = std::move(failure).AtStage(stage);
        debug::LogFailure(failure);
        return Result<T, ExportFailure>::Err(std::move(failure));
    }
}

Result<std::vector<uint8_t>, ExportFailure> ExportPipeline::Encrypt(
    const ExportConfig& config,
    const std::vector<uint8_t>& recipient_key,
    const crypto::SecureMemoryHandle& private_key_der) const {
    auto encrypted = private_key_der.WithReadAccess(
        [this, &config, &recipient_key](std::span<const uint8_t> der)
            -> Result<std::vector<uint8_t>, ExportFailure> {
            if (config.Mode() == EncryptionMode::RsaAesKeyWrap) {
                const crypto::KeyWrapEncryptor encryptor(backend_);
                return encryptor.Encrypt(std::span<const uint8_t>(config.WrappingPublicKey()), der);
            }
            const crypto::HybridEncryptionAdapter adapter(hybrid_encrypter_);
            return adapter.Encrypt(recipient_key, der);
        });
    if (encrypted.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::FromSodiumFailure(encrypted.UnwrapErr()));
    }
    return std::move(encrypted).Unwrap();
}

Result<crypto::Signature, ExportFailure> ExportPipeline::Sign(
    const keystore::KeystoreKey& signing_key,
    std::span<const uint8_t> payload) {
    auto key_result = keystore_provider_.LoadPrivateKey(signing_key);
    if (key_result.IsErr()) {
        return Result<crypto::Signature, ExportFailure>::Err(std::move(key_result).UnwrapErr());
    }
    const auto handle = std::move(key_result).Unwrap();
    const std::string algorithm = handle->Algorithm();
    PKEXPORT_LOG_MSG("SIGN", compat::format("signing key '{}' is {}", signing_key.alias, algorithm));
    const crypto::Signer signer(backend_);
    return signer.Sign(payload, *handle, algorithm);
}

Result<std::string, ExportFailure> ExportPipeline::FetchCertificatePem(
    const keystore::KeystoreKey& key) {
    auto der_result = keystore_provider_.LoadCertificate(key);
    if (der_result.IsErr()) {
        return Result<std::string, ExportFailure>::Err(std::move(der_result).UnwrapErr());
    }
    const auto der = std::move(der_result).Unwrap();
    return Result<std::string, ExportFailure>::Ok(
        crypto::PemCodec::ToPem(der, PemLabels::CERTIFICATE));
}

Result<ExportOutcome, ExportFailure> ExportPipeline::Run(const ExportConfig& config) {
    PKEXPORT_LOG_STAGE(ExportStage::Start);
    if (auto valid = config.Validate(); valid.IsErr()) {
        return FailAt<ExportOutcome>(ExportStage::Start, std::move(valid).UnwrapErr());
    }
    std::vector<uint8_t> recipient_key;
    if (config.Mode() == EncryptionMode::HybridEc) {
        auto decoded = crypto::HybridEncryptionAdapter::DecodeRecipientKeyHex(config.RecipientKeyHex());
        if (decoded.IsErr()) {
            return FailAt<ExportOutcome>(ExportStage::Start, std::move(decoded).UnwrapErr());
        }
        recipient_key = std::move(decoded).Unwrap();
    }

    PKEXPORT_LOG_STAGE(ExportStage::KeyLoaded);
    auto key_result = keystore_provider_.LoadPrivateKey(config.Key());
    if (key_result.IsErr()) {
        return FailAt<ExportOutcome>(ExportStage::KeyLoaded, std::move(key_result).UnwrapErr());
    }
    const auto key_handle = std::move(key_result).Unwrap();
    auto der_result = key_handle->ToPkcs8Der();
    if (der_result.IsErr()) {
        return FailAt<ExportOutcome>(ExportStage::KeyLoaded, std::move(der_result).UnwrapErr());
    }
    const crypto::SecureMemoryHandle private_key_der = std::move(der_result).Unwrap();
    PKEXPORT_LOG_MSG("KEY", compat::format("alias '{}' algorithm {}", config.Key().alias, key_handle->Algorithm()));
    PKEXPORT_LOG_VALUE("KEY", "pkcs8_size", private_key_der.Size());

    PKEXPORT_LOG_STAGE(ExportStage::Encrypted);
    auto encrypted_result = Encrypt(config, recipient_key, private_key_der);
    if (encrypted_result.IsErr()) {
        return FailAt<ExportOutcome>(ExportStage::Encrypted, std::move(encrypted_result).UnwrapErr());
    }
    const std::vector<uint8_t> encrypted = std::move(encrypted_result).Unwrap();
    PKEXPORT_LOG_BYTES("ENCRYPT", "payload", std::span<const uint8_t>(encrypted));

    std::optional<crypto::Signature> signature;
    if (config.SigningKey().has_value()) {
        PKEXPORT_LOG_STAGE(ExportStage::Signed);
        auto signed_result = Sign(*config.SigningKey(), encrypted);
        if (signed_result.IsErr()) {
            return FailAt<ExportOutcome>(ExportStage::Signed, std::move(signed_result).UnwrapErr());
        }
        signature = std::move(signed_result).Unwrap();
    }

    std::optional<std::string> certificate_pem;
    if (config.NeedsCertificate()) {
        PKEXPORT_LOG_STAGE(ExportStage::CertificateFetched);
        auto cert_result = FetchCertificatePem(config.Key());
        if (cert_result.IsErr()) {
            return FailAt<ExportOutcome>(ExportStage::CertificateFetched, std::move(cert_result).UnwrapErr());
        }
        certificate_pem = std::move(cert_result).Unwrap();
    }

    PKEXPORT_LOG_STAGE(ExportStage::Written);
    const archive::ArchiveBuilder builder(config.Output());
    auto archive_result = builder.Build(signature, encrypted, certificate_pem);
    if (archive_result.IsErr()) {
        return FailAt<ExportOutcome>(ExportStage::Written, std::move(archive_result).UnwrapErr());
    }
    const archive::ExportArchive artifact = std::move(archive_result).Unwrap();

    PKEXPORT_LOG_STAGE(ExportStage::Done);
    return Result<ExportOutcome, ExportFailure>::Ok(ExportOutcome{
        ExportStage::Done,
        artifact.kind,
        artifact.path,
        artifact.bytes.size(),
        artifact.entry_names
    });
}
}
