#include "pkexport/keystore/private_key_handle.hpp"
#include "pkexport/core/format.hpp"
#include <openssl/x509.h>
#include <array>
#include <string_view>
#include <utility>
namespace pkexport::keystore {
namespace {
    constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kAlgorithmNames = {{
        {"RSA", "RSA"},
        {"RSA-PSS", "RSASSA-PSS"},
        {"DSA", "DSA"},
        {"EC", "EC"},
        {"ED25519", "Ed25519"},
        {"ED448", "Ed448"},
    }};
}

std::string KeyAlgorithmName(EVP_PKEY* key) {
    if (key == nullptr) {
        return {};
    }
    for (const auto& [openssl_name, store_name] : kAlgorithmNames) {
        if (EVP_PKEY_is_a(key, std::string(openssl_name).c_str()) == 1) {
            return std::string(store_name);
        }
    }
    const char* type_name = EVP_PKEY_get0_type_name(key);
    return type_name != nullptr ? std::string(type_name) : std::string();
}

std::string EvpPrivateKeyHandle::Algorithm() const {
    return KeyAlgorithmName(key_.get());
}

Result<crypto::SecureMemoryHandle, ExportFailure> EvpPrivateKeyHandle::ToPkcs8Der() const {
    PKCS8_PRIV_KEY_INFO* p8 = EVP_PKEY2PKCS8(key_.get());
    if (p8 == nullptr) {
        return Result<crypto::SecureMemoryHandle, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Private key cannot be encoded as PKCS#8: {}", crypto::GetOpenSSLError())));
    }
    unsigned char* der = nullptr;
    const int der_len = i2d_PKCS8_PRIV_KEY_INFO(p8, &der);
    PKCS8_PRIV_KEY_INFO_free(p8);
    if (der_len <= 0 || der == nullptr) {
        return Result<crypto::SecureMemoryHandle, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("Failed to DER-encode PKCS#8 key: {}", crypto::GetOpenSSLError())));
    }
    auto handle = crypto::SecureMemoryHandle::FromBytes(
        std::span<const uint8_t>(der, static_cast<size_t>(der_len)));
    OPENSSL_clear_free(der, static_cast<size_t>(der_len));
    if (handle.IsErr()) {
        return Result<crypto::SecureMemoryHandle, ExportFailure>::Err(
            ExportFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<crypto::SecureMemoryHandle, ExportFailure>::Ok(std::move(handle).Unwrap());
}
}
