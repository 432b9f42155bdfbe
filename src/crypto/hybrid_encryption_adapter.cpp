#include "pkexport/crypto/hybrid_encryption_adapter.hpp"
#include "pkexport/crypto/pem_codec.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
namespace pkexport::crypto {

Result<std::vector<uint8_t>, ExportFailure> HybridEncryptionAdapter::Encrypt(
    std::span<const uint8_t> recipient_public_key,
    std::span<const uint8_t> private_key_der) const {
    std::vector<uint8_t> pem = PemCodec::ToPemBytes(private_key_der, PemLabels::PRIVATE_KEY);
    auto result = service_.Encrypt(recipient_public_key, pem);
    SodiumInterop::SecureWipe(std::span<uint8_t>(pem));
    return result;
}

Result<std::vector<uint8_t>, ExportFailure> HybridEncryptionAdapter::DecodeRecipientKeyHex(
    std::string_view hex) {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto decoded = SodiumInterop::HexToBytes(hex);
    if (decoded.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::InputFormat(
                compat::format("Invalid encryption key: {}", decoded.UnwrapErr().message)));
    }
    if (decoded.Unwrap().empty()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::InputFormat("Invalid encryption key: empty"));
    }
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(decoded).Unwrap());
}
}
