#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace pkexport {
struct Constants {
    static constexpr size_t AES_KEY_SIZE = 32;
    static constexpr size_t AES_GCM_NONCE_SIZE = 12;
    static constexpr size_t AES_GCM_TAG_SIZE = 16;
    static constexpr size_t AES_KWP_BLOCK_SIZE = 8;
    static constexpr size_t EC_P256_UNCOMPRESSED_POINT_SIZE = 65;
    static constexpr size_t PEM_LINE_LENGTH = 64;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t OPENSSL_ERROR_BUFFER_SIZE = 256;
    static constexpr size_t FINGERPRINT_PREFIX_SIZE = 8;
    static constexpr std::string_view ECIES_HKDF_INFO = "pkexport-ecies-p256-v1";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr unsigned long NO_ERROR = 0;
    static constexpr std::string_view ALGORITHM_HKDF = "HKDF";
    static constexpr std::string_view ALGORITHM_SHA256 = "SHA256";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_KEY = "key";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_INFO = "info";
    static constexpr std::string_view CURVE_P256 = "P-256";
    static constexpr std::string_view UNKNOWN_ERROR_MESSAGE = "Unknown OpenSSL error";
};
struct PemLabels {
    static constexpr std::string_view PRIVATE_KEY = "PRIVATE KEY";
    static constexpr std::string_view CERTIFICATE = "CERTIFICATE";
    static constexpr std::string_view PUBLIC_KEY = "PUBLIC KEY";
};
struct ArchiveEntryNames {
    static constexpr std::string_view SIGNATURE = "encryptedPrivateKeySignature";
    static constexpr std::string_view ENCRYPTED_PRIVATE_KEY = "encryptedPrivateKey";
    static constexpr std::string_view CERTIFICATE = "certificate.pem";
};
// RSA and DSA only. Legacy verifier policy, intentionally narrower than what
// OpenSSL could sign with.
struct SigningPolicy {
    static constexpr std::string_view ALGORITHM_RSA = "RSA";
    static constexpr std::string_view ALGORITHM_DSA = "DSA";
    static constexpr std::string_view SIGNATURE_PREFIX = "SHA512with";
    static constexpr std::string_view DIGEST = "SHA512";
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view HANDLE_DISPOSED = "Handle disposed";
    static constexpr std::string_view FAILED_TO_ALLOCATE_SECURE_MEMORY = "Failed to allocate secure memory: ";
    static constexpr std::string_view FAILED_TO_READ_SECURE_MEMORY = "Failed to read secure memory: ";
    static constexpr std::string_view DATA_EXCEEDS_BUFFER = "Data size exceeds buffer size";
    static constexpr std::string_view UNSUPPORTED_SIGNING_ALGORITHM =
        "The signing key uses an unsupported algorithm. The tool only supports [RSA, DSA]";
};
}
