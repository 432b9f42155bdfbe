#include "pkexport/configuration/export_config.hpp"

namespace pkexport::configuration {

Result<Unit, ExportFailure> ExportConfig::Validate() const {
    if (key_.path.empty()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::InvalidConfiguration("Keystore path is required"));
    }
    if (key_.alias.empty()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::InvalidConfiguration("Key alias is required"));
    }
    if (output_.empty()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::InvalidConfiguration("Output path is required"));
    }
    if (mode_ == EncryptionMode::RsaAesKeyWrap && wrapping_public_key_.empty()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::InvalidConfiguration("RSA-AES key wrap requires an encryption public key"));
    }
    if (mode_ == EncryptionMode::HybridEc && recipient_key_hex_.empty()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::InvalidConfiguration("Hybrid EC encryption requires an encryption key"));
    }
    if (signing_key_.has_value()) {
        if (signing_key_->path.empty()) {
            return Result<Unit, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration("Signing keystore path is required with a signing key"));
        }
        if (signing_key_->alias.empty()) {
            return Result<Unit, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration("Signing key alias is required with a signing keystore"));
        }
    }
    return Result<Unit, ExportFailure>::Ok(unit);
}

} // namespace pkexport::configuration
