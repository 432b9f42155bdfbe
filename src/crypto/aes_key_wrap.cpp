#include "pkexport/crypto/aes_key_wrap.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include <array>
#include <algorithm>
namespace pkexport::crypto {
namespace {
    constexpr std::array<uint8_t, 4> kAlternativeIv = {0xA6, 0x59, 0x59, 0xA6};
    constexpr size_t kSemiblock = Constants::AES_KWP_BLOCK_SIZE;
    constexpr size_t kAesBlock = 2 * kSemiblock;

    std::array<uint8_t, kAesBlock> EmptyPlaintextBlock() {
        std::array<uint8_t, kAesBlock> block{};
        std::copy(kAlternativeIv.begin(), kAlternativeIv.end(), block.begin());
        return block;
    }
}

Result<std::vector<uint8_t>, ExportFailure> AesKeyWrap::WrapWithPadding(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext) const {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("AES key wrap key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size())));
    }
    if (plaintext.empty()) {
        const auto block = EmptyPlaintextBlock();
        return RunSingleBlock(key, block, true);
    }
    return RunWrapCipher(key, plaintext, true);
}

Result<std::vector<uint8_t>, ExportFailure> AesKeyWrap::UnwrapWithPadding(
    std::span<const uint8_t> key,
    std::span<const uint8_t> wrapped) const {
    if (key.size() != Constants::AES_KEY_SIZE) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("AES key wrap key must be {} bytes, got {}",
                    Constants::AES_KEY_SIZE, key.size())));
    }
    if (wrapped.size() < kAesBlock || wrapped.size() % kSemiblock != 0) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Wrapped key length {} is not a valid RFC 5649 length",
                    wrapped.size())));
    }
    if (wrapped.size() == kAesBlock) {
        auto block_result = RunSingleBlock(key, wrapped, false);
        if (block_result.IsErr()) {
            return block_result;
        }
        auto block = std::move(block_result).Unwrap();
        const auto empty_block = EmptyPlaintextBlock();
        const bool is_empty_form = std::equal(block.begin(), block.end(), empty_block.begin());
        SodiumInterop::SecureWipe(std::span<uint8_t>(block));
        if (is_empty_form) {
            return Result<std::vector<uint8_t>, ExportFailure>::Ok({});
        }
    }
    return RunWrapCipher(key, wrapped, false);
}

Result<std::vector<uint8_t>, ExportFailure> AesKeyWrap::RunWrapCipher(
    std::span<const uint8_t> key,
    std::span<const uint8_t> input,
    const bool wrapping) const {
    EvpCipherPtr cipher(EVP_CIPHER_fetch(
        backend_.LibraryContext(), "AES-256-WRAP-PAD", backend_.PropertyQuery()));
    if (!cipher) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("AES-256-WRAP-PAD is unavailable: {}", GetOpenSSLError())));
    }
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_CipherInit_ex2(ctx.get(), cipher.get(), key.data(), nullptr,
                           wrapping ? 1 : 0, nullptr) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to initialize AES key wrap: {}", GetOpenSSLError())));
    }

    const size_t capacity = wrapping
        ? ((input.size() + kSemiblock - 1) / kSemiblock) * kSemiblock + kSemiblock
        : input.size();
    std::vector<uint8_t> output(capacity);
    int out_len = 0;
    if (EVP_CipherUpdate(ctx.get(), output.data(), &out_len,
                         input.data(), static_cast<int>(input.size())) != OpenSSLConstants::SUCCESS ||
        out_len < 0) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                wrapping
                    ? compat::format("AES key wrap failed: {}", GetOpenSSLError())
                    : compat::format("AES key unwrap failed, integrity check did not pass: {}",
                          GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), output.data() + out_len, &final_len) != OpenSSLConstants::SUCCESS) {
        SodiumInterop::SecureWipe(std::span<uint8_t>(output));
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("AES key wrap finalization failed: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(out_len + final_len));
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, ExportFailure> AesKeyWrap::RunSingleBlock(
    std::span<const uint8_t> key,
    std::span<const uint8_t> block,
    const bool encrypting) const {
    EvpCipherPtr cipher(EVP_CIPHER_fetch(
        backend_.LibraryContext(), "AES-256-ECB", backend_.PropertyQuery()));
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!cipher || !ctx ||
        EVP_CipherInit_ex2(ctx.get(), cipher.get(), key.data(), nullptr,
                           encrypting ? 1 : 0, nullptr) != OpenSSLConstants::SUCCESS ||
        EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != OpenSSLConstants::SUCCESS) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("Failed to initialize AES-256-ECB: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> output(kAesBlock);
    int out_len = 0;
    if (EVP_CipherUpdate(ctx.get(), output.data(), &out_len,
                         block.data(), static_cast<int>(block.size())) != OpenSSLConstants::SUCCESS ||
        out_len != static_cast<int>(kAesBlock)) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Encryption(
                compat::format("AES single block operation failed: {}", GetOpenSSLError())));
    }
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(output));
}
}
