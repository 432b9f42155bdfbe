#pragma once

#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include <vector>

namespace pkexport::crypto {

class SecureMemoryHandle;

/**
 * @brief Interop layer for libsodium
 *
 * Owns library initialisation, the CSPRNG used for ephemeral key material,
 * secure wiping of temporaries and hex decoding of caller-supplied keys.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Generate cryptographically secure random bytes
     *
     * Blocks only if the system entropy source blocks.
     */
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /**
     * @brief Fill a secure handle with fresh random bytes
     *
     * The bytes never pass through ordinary heap memory.
     */
    static Result<SecureMemoryHandle, SodiumFailure> GenerateSecretKey(size_t size);

    // ========================================================================
    // Encoding
    // ========================================================================

    /**
     * @brief Decode a hex string
     *
     * Upper and lower case digits are accepted. No separators are skipped.
     * Any non-hex character or a dangling nibble is an error.
     */
    static Result<std::vector<uint8_t>, SodiumFailure> HexToBytes(std::string_view hex);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace pkexport::crypto
