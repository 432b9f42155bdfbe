#include "pkexport/crypto/ecies_p256_encrypter.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/format.hpp"
#include "pkexport/debug/export_logger.hpp"

#include <openssl/core_names.h>
#include <openssl/params.h>
#include <array>
#include <string>
#include <string_view>

namespace pkexport::crypto {
namespace {
    constexpr uint8_t kUncompressedPointTag = 0x04;
    constexpr std::string_view kCurveAlias = "prime256v1";

    bool IsP256(EVP_PKEY* key) {
        std::array<char, 64> group{};
        size_t group_len = 0;
        if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME,
                                           group.data(), group.size(), &group_len) != OpenSSLConstants::SUCCESS) {
            return false;
        }
        const std::string_view name(group.data(), group_len);
        return name == kCurveAlias || name == OpenSSLConstants::CURVE_P256;
    }
}

Result<EvpPkeyPtr, ExportFailure> EciesP256Encrypter::PointToKey(
    std::span<const uint8_t> point) const {
    if (point.size() != Constants::EC_P256_UNCOMPRESSED_POINT_SIZE || point[0] != kUncompressedPointTag) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Expected a {}-byte uncompressed P-256 point, got {} bytes",
                    Constants::EC_P256_UNCOMPRESSED_POINT_SIZE, point.size())));
    }
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(
        backend_.LibraryContext(), "EC", backend_.PropertyQuery()));
    if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != OpenSSLConstants::SUCCESS) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to create EC import context: {}", GetOpenSSLError())));
    }
    std::string group(OpenSSLConstants::CURVE_P256);
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group.data(), 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
            const_cast<uint8_t*>(point.data()), point.size()),
        OSSL_PARAM_construct_end()
    };
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) != OpenSSLConstants::SUCCESS) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Recipient point is not on P-256: {}", GetOpenSSLError())));
    }
    EvpPkeyPtr key(raw);

    // fromdata does not check that the point lies on the curve.
    EvpPkeyCtxPtr check(EVP_PKEY_CTX_new_from_pkey(
        backend_.LibraryContext(), key.get(), backend_.PropertyQuery()));
    if (!check || EVP_PKEY_public_check(check.get()) != OpenSSLConstants::SUCCESS) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Recipient point is not on P-256: {}", GetOpenSSLError())));
    }
    return Result<EvpPkeyPtr, ExportFailure>::Ok(std::move(key));
}

Result<EvpPkeyPtr, ExportFailure> EciesP256Encrypter::LoadRecipientKey(
    std::span<const uint8_t> encoded) const {
    if (encoded.size() == Constants::EC_P256_UNCOMPRESSED_POINT_SIZE && encoded[0] == kUncompressedPointTag) {
        return PointToKey(encoded);
    }
    const unsigned char* cursor = encoded.data();
    EvpPkeyPtr key(d2i_PUBKEY_ex(nullptr, &cursor, static_cast<long>(encoded.size()),
                                 backend_.LibraryContext(), backend_.PropertyQuery()));
    if (!key) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Recipient key is neither a P-256 point nor an SPKI: {}",
                    GetOpenSSLError())));
    }
    if (EVP_PKEY_is_a(key.get(), "EC") != 1 || !IsP256(key.get())) {
        return Result<EvpPkeyPtr, ExportFailure>::Err(
            ExportFailure::KeyFormat("Recipient key must be an EC key on P-256"));
    }
    return Result<EvpPkeyPtr, ExportFailure>::Ok(std::move(key));
}

Result<std::vector<uint8_t>, ExportFailure> EciesP256Encrypter::EncodePublicPoint(EVP_PKEY* key) {
    std::vector<uint8_t> point(Constants::EC_P256_UNCOMPRESSED_POINT_SIZE);
    size_t point_len = 0;
    if (EVP_PKEY_get_octet_string_param(key, OSSL_PKEY_PARAM_ENCODED_PUBLIC_KEY,
                                        point.data(), point.size(), &point_len) != OpenSSLConstants::SUCCESS ||
        point_len != Constants::EC_P256_UNCOMPRESSED_POINT_SIZE) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to encode EC public point: {}", GetOpenSSLError())));
    }
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(point));
}

Result<std::vector<uint8_t>, ExportFailure> EciesP256Encrypter::DeriveMessageKey(
    EVP_PKEY* own_key,
    EVP_PKEY* peer_key,
    std::span<const uint8_t> ephemeral_point) const {
    EvpPkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_pkey(
        backend_.LibraryContext(), own_key, backend_.PropertyQuery()));
    if (!ctx ||
        EVP_PKEY_derive_init(ctx.get()) != OpenSSLConstants::SUCCESS ||
        EVP_PKEY_derive_set_peer(ctx.get(), peer_key) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to set up ECDH: {}", GetOpenSSLError())));
    }
    size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx.get(), nullptr, &secret_len) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("ECDH size query failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> shared_secret(secret_len);
    if (EVP_PKEY_derive(ctx.get(), shared_secret.data(), &secret_len) != OpenSSLConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(shared_secret));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("ECDH failed: {}", GetOpenSSLError())));
    }
    shared_secret.resize(secret_len);

    const std::span<const uint8_t> info(
        reinterpret_cast<const uint8_t*>(Constants::ECIES_HKDF_INFO.data()),
        Constants::ECIES_HKDF_INFO.size());
    auto key_result = hkdf_.DeriveKeyBytes(shared_secret, Constants::AES_KEY_SIZE, ephemeral_point, info);
    SodiumInterop::SecureWipe(std::span<uint8_t>(shared_secret));
    return key_result;
}

Result<std::vector<uint8_t>, ExportFailure> EciesP256Encrypter::Encrypt(
    std::span<const uint8_t> recipient_public_key,
    std::span<const uint8_t> plaintext) {
    auto recipient_result = LoadRecipientKey(recipient_public_key);
    if (recipient_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(recipient_result).UnwrapErr());
    }
    const EvpPkeyPtr recipient = std::move(recipient_result).Unwrap();

    EvpPkeyPtr ephemeral(EVP_PKEY_Q_keygen(backend_.LibraryContext(), backend_.PropertyQuery(),
                                           "EC", OpenSSLConstants::CURVE_P256.data()));
    if (!ephemeral) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to generate ephemeral P-256 key: {}", GetOpenSSLError())));
    }
    auto point_result = EncodePublicPoint(ephemeral.get());
    if (point_result.IsErr()) {
        return point_result;
    }
    std::vector<uint8_t> output = std::move(point_result).Unwrap();

    auto key_result = DeriveMessageKey(ephemeral.get(), recipient.get(), output);
    if (key_result.IsErr()) {
        return key_result;
    }
    std::vector<uint8_t> message_key = std::move(key_result).Unwrap();

    const std::vector<uint8_t> nonce = SodiumInterop::GetRandomBytes(Constants::AES_GCM_NONCE_SIZE);
    auto sealed = aes_gcm_.Encrypt(message_key, nonce, plaintext);
    SodiumInterop::SecureWipe(std::span<uint8_t>(message_key));
    if (sealed.IsErr()) {
        return sealed;
    }
    const std::vector<uint8_t> body = std::move(sealed).Unwrap();

    output.reserve(HEADER_SIZE + body.size());
    output.insert(output.end(), nonce.begin(), nonce.end());
    output.insert(output.end(), body.begin(), body.end());
    PKEXPORT_LOG_VALUE("ECIES", "ciphertext_size", output.size());
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ExportFailure> EciesP256Encrypter::Decrypt(
    EVP_PKEY* recipient_private_key,
    std::span<const uint8_t> ciphertext) const {
    if (ciphertext.size() < HEADER_SIZE + Constants::AES_GCM_TAG_SIZE) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("ECIES ciphertext too short: {} bytes", ciphertext.size())));
    }
    const auto ephemeral_point = ciphertext.subspan(0, Constants::EC_P256_UNCOMPRESSED_POINT_SIZE);
    const auto nonce = ciphertext.subspan(Constants::EC_P256_UNCOMPRESSED_POINT_SIZE,
                                          Constants::AES_GCM_NONCE_SIZE);
    const auto body = ciphertext.subspan(HEADER_SIZE);

    auto ephemeral_result = PointToKey(ephemeral_point);
    if (ephemeral_result.IsErr()) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(std::move(ephemeral_result).UnwrapErr());
    }
    const EvpPkeyPtr ephemeral = std::move(ephemeral_result).Unwrap();

    auto key_result = DeriveMessageKey(recipient_private_key, ephemeral.get(), ephemeral_point);
    if (key_result.IsErr()) {
        return key_result;
    }
    std::vector<uint8_t> message_key = std::move(key_result).Unwrap();
    auto opened = aes_gcm_.Decrypt(message_key, nonce, body);
    SodiumInterop::SecureWipe(std::span<uint8_t>(message_key));
    return opened;
}

} // namespace pkexport::crypto
