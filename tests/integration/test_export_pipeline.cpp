#include <catch2/catch_test_macros.hpp>
#include "pkexport/pipeline/export_pipeline.hpp"
#include "pkexport/cli/command_line.hpp"
#include "pkexport/crypto/aes_key_wrap.hpp"
#include "pkexport/crypto/ecies_p256_encrypter.hpp"
#include "pkexport/crypto/pem_codec.hpp"
#include "pkexport/crypto/rsa_oaep.hpp"
#include "pkexport/keystore/pkcs12_keystore_provider.hpp"
#include "pkexport/core/constants.hpp"
#include "helpers/test_keys.hpp"
#include "helpers/test_doubles.hpp"
#include "helpers/zip_reader.hpp"

#include <string>

using namespace pkexport;
using namespace pkexport::test_helpers;
using configuration::ExportConfig;

namespace {
    std::string ToHex(const std::vector<uint8_t>& bytes) {
        static constexpr char kHex[] = "0123456789abcdef";
        std::string hex;
        for (const auto byte : bytes) {
            hex.push_back(kHex[byte >> 4]);
            hex.push_back(kHex[byte & 0x0F]);
        }
        return hex;
    }

    keystore::KeystoreKey KeyAt(const std::filesystem::path& path, const std::string& alias, const std::string& password) {
        keystore::KeystoreKey key;
        key.path = path;
        key.alias = alias;
        key.store_password = password;
        return key;
    }

    /**
     * An RSA-2048 key "exportme" (password "pw1234") with its certificate, an
     * RSA-2048 wrapping key pair, and a DSA signing key in its own store.
     */
    struct ExportFixture {
        crypto::CryptoBackend backend = CreateBackend();
        TempDirectory dir;
        crypto::EvpPkeyPtr exported_key = GenerateRsaKey(backend);
        crypto::X509Ptr exported_cert = SelfSignedCertificate(backend, exported_key.get(), "exportme");
        crypto::EvpPkeyPtr wrapping_key = GenerateRsaKey(backend);
        std::filesystem::path store_path = dir / "keystore.p12";
        std::filesystem::path signing_store_path = dir / "signing.p12";

        ExportFixture() {
            WritePkcs12(backend, store_path, exported_key.get(), exported_cert.get(), "exportme", "pw1234");
        }

        keystore::KeystoreKey ExportedKey() const { return KeyAt(store_path, "exportme", "pw1234"); }

        std::vector<uint8_t> WrappingKeyPem() const {
            return crypto::PemCodec::ToPemBytes(PublicKeyDer(wrapping_key.get()), PemLabels::PUBLIC_KEY);
        }

        void AddSigningStore(EVP_PKEY* key, const std::string& alias, const std::string& password = "") const {
            const auto cert = SelfSignedCertificate(backend, key, alias);
            WritePkcs12(backend, signing_store_path, key, cert.get(), alias, password);
        }

        std::vector<uint8_t> UnwrapRsaAes(const std::vector<uint8_t>& payload) const {
            const crypto::RsaOaep rsa(backend);
            const crypto::AesKeyWrap key_wrap(backend);
            const size_t head = crypto::RsaOaep::BlockSize(wrapping_key.get());
            REQUIRE(payload.size() > head);
            auto aes_key = rsa.Decrypt(wrapping_key.get(), std::span<const uint8_t>(payload.data(), head));
            REQUIRE(aes_key.IsOk());
            auto der = key_wrap.UnwrapWithPadding(
                aes_key.Unwrap(), std::span<const uint8_t>(payload.data() + head, payload.size() - head));
            REQUIRE(der.IsOk());
            return std::move(der).Unwrap();
        }
    };
}

TEST_CASE("ExportPipeline - RSA-AES key wrap end to end", "[integration][pipeline]") {
    ExportFixture fixture;
    keystore::Pkcs12KeystoreProvider provider(fixture.backend);
    crypto::EciesP256Encrypter ecies(fixture.backend);
    pipeline::ExportPipeline pipeline(fixture.backend, provider, ecies);
    const auto output = fixture.dir / "exported.bin";

    auto outcome = pipeline.Run(ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output));
    REQUIRE(outcome.IsOk());
    REQUIRE(outcome.Unwrap().final_stage == ExportStage::Done);
    REQUIRE(outcome.Unwrap().kind == archive::ArchiveKind::BareCiphertext);

    const auto written = ReadFile(output);
    REQUIRE(written.size() == outcome.Unwrap().bytes_written);
    REQUIRE(std::vector<uint8_t>(written.begin(), written.begin() + 256) !=
            std::vector<uint8_t>(256, 0));
    REQUIRE(fixture.UnwrapRsaAes(written) == PrivateKeyPkcs8Der(fixture.exported_key.get()));
}

TEST_CASE("ExportPipeline - Hybrid EC end to end", "[integration][pipeline]") {
    ExportFixture fixture;
    keystore::Pkcs12KeystoreProvider provider(fixture.backend);
    crypto::EciesP256Encrypter ecies(fixture.backend);
    pipeline::ExportPipeline pipeline(fixture.backend, provider, ecies);
    const auto recipient = GenerateEcKey(fixture.backend);
    const auto point = crypto::EciesP256Encrypter::EncodePublicPoint(recipient.get()).Unwrap();
    const auto output = fixture.dir / "exported.ecies";

    auto outcome = pipeline.Run(ExportConfig::HybridEc(fixture.ExportedKey(), ToHex(point), output));
    REQUIRE(outcome.IsOk());

    auto pem = ecies.Decrypt(recipient.get(), ReadFile(output));
    REQUIRE(pem.IsOk());
    const std::string pem_text(pem.Unwrap().begin(), pem.Unwrap().end());
    REQUIRE(pem_text == crypto::PemCodec::ToPem(PrivateKeyPkcs8Der(fixture.exported_key.get()), PemLabels::PRIVATE_KEY));
}

TEST_CASE("ExportPipeline - Signed archive", "[integration][pipeline]") {
    ExportFixture fixture;
    keystore::Pkcs12KeystoreProvider provider(fixture.backend);
    crypto::EciesP256Encrypter ecies(fixture.backend);
    pipeline::ExportPipeline pipeline(fixture.backend, provider, ecies);
    const auto output = fixture.dir / "exported.zip";

    SECTION("RSA signing key") {
        const auto signing_key = GenerateRsaKey(fixture.backend);
        fixture.AddSigningStore(signing_key.get(), "signer");
        auto config = ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output)
                          .WithSigningKey(KeyAt(fixture.signing_store_path, "signer", ""));

        auto outcome = pipeline.Run(config);
        REQUIRE(outcome.IsOk());
        REQUIRE(outcome.Unwrap().kind == archive::ArchiveKind::ZipArchive);

        const auto entries = ZipReader::Read(ReadFile(output));
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].name == ArchiveEntryNames::SIGNATURE);
        REQUIRE(entries[1].name == ArchiveEntryNames::ENCRYPTED_PRIVATE_KEY);
        REQUIRE(entries[2].name == ArchiveEntryNames::CERTIFICATE);

        REQUIRE(VerifySignature(fixture.backend, signing_key.get(), entries[1].data, entries[0].data));
        REQUIRE(fixture.UnwrapRsaAes(entries[1].data) == PrivateKeyPkcs8Der(fixture.exported_key.get()));

        // The certificate is the exported key's, not the signer's
        const std::string cert_pem(entries[2].data.begin(), entries[2].data.end());
        REQUIRE(cert_pem == crypto::PemCodec::ToPem(CertificateDer(fixture.exported_cert.get()), PemLabels::CERTIFICATE));
    }
    SECTION("DSA signing key") {
        const auto signing_key = GenerateDsaKey(fixture.backend);
        fixture.AddSigningStore(signing_key.get(), "dsasigner");
        auto config = ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output)
                          .WithSigningKey(KeyAt(fixture.signing_store_path, "dsasigner", ""));

        auto outcome = pipeline.Run(config);
        REQUIRE(outcome.IsOk());
        const auto entries = ZipReader::Read(ReadFile(output));
        REQUIRE(entries.size() == 3);
        REQUIRE(VerifySignature(fixture.backend, signing_key.get(), entries[1].data, entries[0].data));
    }
    SECTION("Password-protected signing store from command-line flags") {
        const auto signing_key = GenerateRsaKey(fixture.backend);
        fixture.AddSigningStore(signing_key.get(), "signer", "signpw");
        const auto wrapping_path = fixture.dir / "wrap.pem";
        WriteFile(wrapping_path, fixture.WrappingKeyPem());

        auto parsed = cli::ParseArguments({
            "--keystore=" + fixture.store_path.string(), "--alias=exportme", "--keystore-pass=pw1234",
            "--output=" + output.string(), "--rsa-aes-encryption=true",
            "--encryption-key-path=" + wrapping_path.string(),
            "--signing-keystore=" + fixture.signing_store_path.string(), "--signing-key-alias=signer",
            "--signing-keystore-pass=signpw"});
        REQUIRE(parsed.IsOk());
        auto config = cli::BuildExportConfig(std::move(parsed).Unwrap());
        REQUIRE(config.IsOk());

        auto outcome = pipeline.Run(config.Unwrap());
        REQUIRE(outcome.IsOk());
        const auto entries = ZipReader::Read(ReadFile(output));
        REQUIRE(entries.size() == 3);
        REQUIRE(VerifySignature(fixture.backend, signing_key.get(), entries[1].data, entries[0].data));
    }
    SECTION("Certificate without signature") {
        auto config = ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output)
                          .WithCertificate(true);
        auto outcome = pipeline.Run(config);
        REQUIRE(outcome.IsOk());
        const auto entries = ZipReader::Read(ReadFile(output));
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].name == ArchiveEntryNames::ENCRYPTED_PRIVATE_KEY);
        REQUIRE(entries[1].name == ArchiveEntryNames::CERTIFICATE);
    }
}

TEST_CASE("ExportPipeline - Failure stages", "[integration][pipeline]") {
    ExportFixture fixture;
    keystore::Pkcs12KeystoreProvider provider(fixture.backend);
    crypto::EciesP256Encrypter ecies(fixture.backend);
    pipeline::ExportPipeline pipeline(fixture.backend, provider, ecies);
    const auto output = fixture.dir / "out.bin";
    const size_t files_before = fixture.dir.FileCount();

    SECTION("Invalid configuration fails at Start") {
        auto key = fixture.ExportedKey();
        key.alias.clear();
        auto outcome = pipeline.Run(ExportConfig::RsaAesKeyWrap(key, fixture.WrappingKeyPem(), output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Start);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::InvalidConfiguration);
    }
    SECTION("Bad recipient hex fails at Start") {
        auto outcome = pipeline.Run(ExportConfig::HybridEc(fixture.ExportedKey(), "04a", output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Start);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::InputFormat);
    }
    SECTION("Wrong password fails at KeyLoaded") {
        auto outcome = pipeline.Run(ExportConfig::RsaAesKeyWrap(
            KeyAt(fixture.store_path, "exportme", "wrong"), fixture.WrappingKeyPem(), output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::KeyLoaded);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::KeyRetrieval);
    }
    SECTION("Unknown alias fails at KeyLoaded") {
        auto outcome = pipeline.Run(ExportConfig::RsaAesKeyWrap(
            KeyAt(fixture.store_path, "nobody", "pw1234"), fixture.WrappingKeyPem(), output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::KeyLoaded);
    }
    SECTION("Malformed wrapping key fails at Encrypted") {
        auto outcome = pipeline.Run(ExportConfig::RsaAesKeyWrap(
            fixture.ExportedKey(), std::vector<uint8_t>(100, 0x41), output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Encrypted);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::KeyFormat);
    }
    SECTION("Recipient off the curve fails at Encrypted") {
        std::vector<uint8_t> point(65, 0x07);
        point[0] = 0x04;
        auto outcome = pipeline.Run(ExportConfig::HybridEc(fixture.ExportedKey(), ToHex(point), output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Encrypted);
    }
    SECTION("EC signing key fails at Signed") {
        const auto signing_key = GenerateEcKey(fixture.backend);
        fixture.AddSigningStore(signing_key.get(), "ecsigner");
        const size_t with_signing_store = fixture.dir.FileCount();
        auto config = ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output)
                          .WithSigningKey(KeyAt(fixture.signing_store_path, "ecsigner", ""));
        auto outcome = pipeline.Run(config);
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Signed);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::UnsupportedAlgorithm);
        REQUIRE(fixture.dir.FileCount() == with_signing_store);
        return;
    }
    SECTION("Wrong signing store password fails at Signed") {
        const auto signing_key = GenerateRsaKey(fixture.backend);
        fixture.AddSigningStore(signing_key.get(), "signer", "signpw");
        const size_t with_signing_store = fixture.dir.FileCount();
        auto config = ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output)
                          .WithSigningKey(KeyAt(fixture.signing_store_path, "signer", ""));
        auto outcome = pipeline.Run(config);
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Signed);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::KeyRetrieval);
        REQUIRE(fixture.dir.FileCount() == with_signing_store);
        return;
    }
    SECTION("Existing output fails at Written") {
        WriteFile(output, {0x01});
        auto outcome = pipeline.Run(ExportConfig::RsaAesKeyWrap(fixture.ExportedKey(), fixture.WrappingKeyPem(), output));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Written);
        REQUIRE(outcome.UnwrapErr().type == ExportFailureType::OutputAlreadyExists);
        REQUIRE(ReadFile(output) == std::vector<uint8_t>{0x01});
        return;
    }
    REQUIRE_FALSE(std::filesystem::exists(output));
    REQUIRE(fixture.dir.FileCount() == files_before);
}

TEST_CASE("ExportPipeline - Stage ordering with test doubles", "[integration][pipeline]") {
    const auto backend = CreateBackend();
    TempDirectory dir;

    SECTION("Key store failure stops before encryption") {
        FailingKeystoreProvider provider;
        RecordingHybridEncrypter service;
        pipeline::ExportPipeline pipeline(backend, provider, service);
        auto outcome = pipeline.Run(ExportConfig::HybridEc(KeyAt("any.p12", "exportme", ""), "04ab", dir / "o"));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::KeyLoaded);
        REQUIRE(provider.calls == 1);
        REQUIRE(service.calls == 0);
        REQUIRE(dir.FileCount() == 0);
    }
    SECTION("Hybrid service receives the decoded key and a PEM private key") {
        auto key = GenerateRsaKey(backend);
        const auto cert = SelfSignedCertificate(backend, key.get(), "exportme");
        WritePkcs12(backend, dir / "ks.p12", key.get(), cert.get(), "exportme", "pw1234");
        keystore::Pkcs12KeystoreProvider provider(backend);
        RecordingHybridEncrypter service;
        pipeline::ExportPipeline pipeline(backend, provider, service);

        auto outcome = pipeline.Run(ExportConfig::HybridEc(
            KeyAt(dir / "ks.p12", "exportme", "pw1234"), "04ABcd", dir / "out.bin"));
        REQUIRE(outcome.IsOk());
        REQUIRE(service.calls == 1);
        REQUIRE(service.last_recipient == std::vector<uint8_t>{0x04, 0xAB, 0xCD});
        const std::string sent(service.last_plaintext.begin(), service.last_plaintext.end());
        REQUIRE(sent == crypto::PemCodec::ToPem(PrivateKeyPkcs8Der(key.get()), PemLabels::PRIVATE_KEY));
        REQUIRE(ReadFile(dir / "out.bin").front() == RecordingHybridEncrypter::MARKER);
    }
    SECTION("Service failure is tagged Encrypted and writes nothing") {
        auto key = GenerateRsaKey(backend);
        const auto cert = SelfSignedCertificate(backend, key.get(), "exportme");
        WritePkcs12(backend, dir / "ks.p12", key.get(), cert.get(), "exportme", "pw1234");
        keystore::Pkcs12KeystoreProvider provider(backend);
        RecordingHybridEncrypter service;
        service.fail = true;
        pipeline::ExportPipeline pipeline(backend, provider, service);

        auto outcome = pipeline.Run(ExportConfig::HybridEc(
            KeyAt(dir / "ks.p12", "exportme", "pw1234"), "04ab", dir / "out.bin"));
        REQUIRE(outcome.IsErr());
        REQUIRE(outcome.UnwrapErr().stage == ExportStage::Encrypted);
        REQUIRE_FALSE(std::filesystem::exists(dir / "out.bin"));
    }
}
