#pragma once

/**
 * @file export_logger.hpp
 * @brief Debug logging for the export pipeline.
 *
 * Logs stage transitions, sizes, aliases and SHA-256 fingerprint prefixes of
 * public artifacts to stderr. Raw key material is never passed to these
 * macros; PKEXPORT_LOG_BYTES prints only a fingerprint.
 *
 * Enable via CMake: -DPKEXPORT_DEBUG_LOG=ON
 */

#include "pkexport/core/constants.hpp"
#include "pkexport/core/failures.hpp"

#include <sodium.h>

#include <array>
#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace pkexport::debug {

#ifdef PKEXPORT_DEBUG_LOG

/**
 * @brief Lowercase hex of the first FINGERPRINT_PREFIX_SIZE bytes of SHA-256(data).
 */
inline std::string Fingerprint(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::array<uint8_t, crypto_hash_sha256_BYTES> digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    std::string result;
    result.reserve(Constants::FINGERPRINT_PREFIX_SIZE * 2);
    for (size_t i = 0; i < Constants::FINGERPRINT_PREFIX_SIZE; ++i) {
        result.push_back(hex_chars[(digest[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[digest[i] & 0x0F]);
    }
    return result + " (" + std::to_string(data.size()) + " bytes)";
}

// ============================================================================
// Core logging macros
// ============================================================================

#define PKEXPORT_LOG_STAGE(stage) \
    do { \
        fprintf(stderr, "[PKEXPORT-DEBUG] ---------- %.*s ----------\n", \
            static_cast<int>(::pkexport::StageName(stage).size()), \
            ::pkexport::StageName(stage).data()); \
        fflush(stderr); \
    } while(0)

#define PKEXPORT_LOG_VALUE(operation, name, value) \
    do { \
        fprintf(stderr, "[PKEXPORT-DEBUG] %s %s: %s\n", \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define PKEXPORT_LOG_MSG(operation, message) \
    do { \
        fprintf(stderr, "[PKEXPORT-DEBUG] %s %s\n", \
            operation, \
            std::string(message).c_str()); \
        fflush(stderr); \
    } while(0)

#define PKEXPORT_LOG_BYTES(operation, name, data) \
    do { \
        fprintf(stderr, "[PKEXPORT-DEBUG] %s %s: sha256:%s\n", \
            operation, \
            name, \
            ::pkexport::debug::Fingerprint(data).c_str()); \
        fflush(stderr); \
    } while(0)

inline void LogFailure(const ExportFailure& failure) {
    const auto stage = StageName(failure.stage);
    fprintf(stderr, "[PKEXPORT-DEBUG] FAILED at %.*s: %s\n",
        static_cast<int>(stage.size()), stage.data(), failure.message.c_str());
    fflush(stderr);
}

#else // !PKEXPORT_DEBUG_LOG

#define PKEXPORT_LOG_STAGE(stage) ((void)0)
#define PKEXPORT_LOG_VALUE(operation, name, value) ((void)0)
#define PKEXPORT_LOG_MSG(operation, message) ((void)0)
#define PKEXPORT_LOG_BYTES(operation, name, data) ((void)0)

inline void LogFailure(const ExportFailure&) {}

#endif // PKEXPORT_DEBUG_LOG

} // namespace pkexport::debug
