#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include "pkexport/crypto/key_wrap_encryptor.hpp"
#include "pkexport/crypto/aes_key_wrap.hpp"
#include "pkexport/crypto/rsa_oaep.hpp"
#include "pkexport/crypto/pem_codec.hpp"
#include "pkexport/core/constants.hpp"
#include "helpers/test_keys.hpp"

#include <algorithm>

using namespace pkexport;
using namespace pkexport::crypto;
using namespace pkexport::test_helpers;

namespace {
    std::vector<uint8_t> Payload(const size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>(i * 7 + 3);
        }
        return data;
    }

    size_t ExpectedWrappedSize(const size_t plaintext_size) {
        const size_t padded = ((plaintext_size + 7) / 8) * 8;
        return std::max<size_t>(padded + 8, 16);
    }
}

TEST_CASE("AesKeyWrap - RFC 5649 lengths", "[crypto][keywrap]") {
    const auto backend = CreateBackend();
    const AesKeyWrap key_wrap(backend);
    const auto key = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);

    const size_t size = GENERATE(0, 1, 7, 8, 9, 15, 16, 17, 1000);
    const auto plaintext = Payload(size);

    auto wrapped = key_wrap.WrapWithPadding(key, plaintext);
    REQUIRE(wrapped.IsOk());
    REQUIRE(wrapped.Unwrap().size() == ExpectedWrappedSize(size));

    auto unwrapped = key_wrap.UnwrapWithPadding(key, wrapped.Unwrap());
    REQUIRE(unwrapped.IsOk());
    REQUIRE(unwrapped.Unwrap() == plaintext);
}

TEST_CASE("AesKeyWrap - Integrity", "[crypto][keywrap]") {
    const auto backend = CreateBackend();
    const AesKeyWrap key_wrap(backend);
    const auto key = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);

    SECTION("Deterministic under one key") {
        const auto plaintext = Payload(40);
        REQUIRE(key_wrap.WrapWithPadding(key, plaintext).Unwrap() ==
                key_wrap.WrapWithPadding(key, plaintext).Unwrap());
    }
    SECTION("Tampered ciphertext is rejected") {
        auto wrapped = key_wrap.WrapWithPadding(key, Payload(40)).Unwrap();
        wrapped[wrapped.size() / 2] ^= 0x01;
        auto result = key_wrap.UnwrapWithPadding(key, wrapped);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::Encryption);
    }
    SECTION("Wrong key is rejected") {
        const auto wrapped = key_wrap.WrapWithPadding(key, Payload(17)).Unwrap();
        const auto other = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
        REQUIRE(key_wrap.UnwrapWithPadding(other, wrapped).IsErr());
    }
    SECTION("Empty form under the wrong key is rejected") {
        const auto wrapped = key_wrap.WrapWithPadding(key, {}).Unwrap();
        const auto other = SodiumInterop::GetRandomBytes(Constants::AES_KEY_SIZE);
        REQUIRE(key_wrap.UnwrapWithPadding(other, wrapped).IsErr());
    }
    SECTION("Empty plaintext encodes AIV with MLI zero") {
        const auto wrapped = key_wrap.WrapWithPadding(key, {}).Unwrap();
        REQUIRE(wrapped.size() == 16);
        EvpCipherPtr ecb(EVP_CIPHER_fetch(backend.LibraryContext(), "AES-256-ECB", nullptr));
        EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
        REQUIRE(EVP_DecryptInit_ex2(ctx.get(), ecb.get(), key.data(), nullptr, nullptr) == 1);
        REQUIRE(EVP_CIPHER_CTX_set_padding(ctx.get(), 0) == 1);
        std::vector<uint8_t> block(16);
        int len = 0;
        REQUIRE(EVP_DecryptUpdate(ctx.get(), block.data(), &len, wrapped.data(), 16) == 1);
        const std::vector<uint8_t> expected = {
            0xA6, 0x59, 0x59, 0xA6, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};
        REQUIRE(block == expected);
    }
    SECTION("Bad key and ciphertext lengths") {
        REQUIRE(key_wrap.WrapWithPadding(Payload(16), Payload(8)).IsErr());
        REQUIRE(key_wrap.UnwrapWithPadding(key, Payload(8)).IsErr());
        REQUIRE(key_wrap.UnwrapWithPadding(key, Payload(20)).IsErr());
    }
}

TEST_CASE("RsaOaep - Public key parsing", "[crypto][rsa]") {
    const auto backend = CreateBackend();
    const RsaOaep rsa(backend);
    const auto rsa_key = GenerateRsaKey(backend);
    const auto der = PublicKeyDer(rsa_key.get());

    SECTION("DER SubjectPublicKeyInfo") {
        REQUIRE(rsa.LoadPublicKey(der).IsOk());
    }
    SECTION("PEM SubjectPublicKeyInfo") {
        REQUIRE(rsa.LoadPublicKey(PemCodec::ToPemBytes(der, PemLabels::PUBLIC_KEY)).IsOk());
    }
    SECTION("EC key is refused") {
        const auto ec_key = GenerateEcKey(backend);
        auto result = rsa.LoadPublicKey(PublicKeyDer(ec_key.get()));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyFormat);
    }
    SECTION("Garbage is refused") {
        auto result = rsa.LoadPublicKey(Payload(50));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyFormat);
    }
    SECTION("Empty input is refused") {
        REQUIRE(rsa.LoadPublicKey({}).IsErr());
    }
    SECTION("Block size follows the modulus") {
        REQUIRE(RsaOaep::BlockSize(rsa_key.get()) == 256);
    }
}

TEST_CASE("KeyWrapEncryptor - Composite layout", "[crypto][keywrap]") {
    const auto backend = CreateBackend();
    const KeyWrapEncryptor encryptor(backend);
    const RsaOaep rsa(backend);
    const AesKeyWrap key_wrap(backend);
    const auto wrapping_key = GenerateRsaKey(backend);
    const auto wrapping_der = PublicKeyDer(wrapping_key.get());

    const size_t size = GENERATE(0, 1, 15, 16, 17, 1000);
    const auto payload = Payload(size);

    auto encrypted = encryptor.Encrypt(wrapping_der, payload);
    REQUIRE(encrypted.IsOk());
    const auto& bytes = encrypted.Unwrap();
    REQUIRE(bytes.size() == 256 + ExpectedWrappedSize(size));

    const std::span<const uint8_t> head(bytes.data(), 256);
    const std::span<const uint8_t> tail(bytes.data() + 256, bytes.size() - 256);
    auto aes_key = rsa.Decrypt(wrapping_key.get(), head);
    REQUIRE(aes_key.IsOk());
    REQUIRE(aes_key.Unwrap().size() == Constants::AES_KEY_SIZE);

    auto recovered = key_wrap.UnwrapWithPadding(aes_key.Unwrap(), tail);
    REQUIRE(recovered.IsOk());
    REQUIRE(recovered.Unwrap() == payload);
}

TEST_CASE("KeyWrapEncryptor - Fresh key per call", "[crypto][keywrap]") {
    const auto backend = CreateBackend();
    const KeyWrapEncryptor encryptor(backend);
    const auto wrapping_key = GenerateRsaKey(backend);
    const auto pem = PemCodec::ToPemBytes(PublicKeyDer(wrapping_key.get()), PemLabels::PUBLIC_KEY);
    const auto payload = Payload(64);

    const auto first = encryptor.Encrypt(pem, payload).Unwrap();
    const auto second = encryptor.Encrypt(pem, payload).Unwrap();
    REQUIRE(first.size() == second.size());
    REQUIRE(std::vector<uint8_t>(first.begin(), first.begin() + 256) !=
            std::vector<uint8_t>(second.begin(), second.begin() + 256));
    REQUIRE(std::vector<uint8_t>(first.begin() + 256, first.end()) !=
            std::vector<uint8_t>(second.begin() + 256, second.end()));
}

TEST_CASE("KeyWrapEncryptor - Key errors", "[crypto][keywrap]") {
    const auto backend = CreateBackend();
    const KeyWrapEncryptor encryptor(backend);

    SECTION("Unparseable wrapping key") {
        auto result = encryptor.Encrypt(Payload(100), Payload(10));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyFormat);
    }
    SECTION("Null key handle") {
        auto result = encryptor.Encrypt(static_cast<EVP_PKEY*>(nullptr), Payload(10));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyFormat);
    }
}
