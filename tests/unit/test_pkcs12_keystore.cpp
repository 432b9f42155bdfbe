#include <catch2/catch_test_macros.hpp>
#include "pkexport/keystore/pkcs12_keystore_provider.hpp"
#include "pkexport/keystore/keystore_key.hpp"
#include "helpers/test_keys.hpp"

using namespace pkexport;
using namespace pkexport::keystore;
using namespace pkexport::test_helpers;

namespace {
    KeystoreKey KeyAt(const std::filesystem::path& path, const std::string& alias, const std::string& password) {
        KeystoreKey key;
        key.path = path;
        key.alias = alias;
        key.store_password = password;
        return key;
    }
}

TEST_CASE("KeystoreKey - Password fallback", "[keystore]") {
    KeystoreKey key;
    SECTION("Neither given") {
        REQUIRE(key.StorePassword().empty());
        REQUIRE(key.KeyPassword().empty());
    }
    SECTION("Store password only") {
        key.store_password = "store";
        REQUIRE(key.StorePassword() == "store");
        REQUIRE(key.KeyPassword() == "store");
    }
    SECTION("Key password only") {
        key.key_password = "key";
        REQUIRE(key.StorePassword() == "key");
        REQUIRE(key.KeyPassword() == "key");
    }
    SECTION("Both given") {
        key.store_password = "store";
        key.key_password = "key";
        REQUIRE(key.StorePassword() == "store");
        REQUIRE(key.KeyPassword() == "key");
    }
}

TEST_CASE("Pkcs12KeystoreProvider - Loading", "[keystore]") {
    const auto backend = CreateBackend();
    TempDirectory dir;
    const auto store_path = dir / "store.p12";
    auto rsa = GenerateRsaKey(backend);
    const auto cert = SelfSignedCertificate(backend, rsa.get(), "exportme");
    WritePkcs12(backend, store_path, rsa.get(), cert.get(), "exportme", "pw1234");
    Pkcs12KeystoreProvider provider(backend);

    SECTION("Key and certificate by alias") {
        auto handle = provider.LoadPrivateKey(KeyAt(store_path, "exportme", "pw1234"));
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap()->Algorithm() == "RSA");
        REQUIRE(EVP_PKEY_eq(handle.Unwrap()->NativeKey(), rsa.get()) == 1);

        const auto der = handle.Unwrap()->ToPkcs8Der().Unwrap();
        REQUIRE(der.ReadBytes(der.Size()).Unwrap() == PrivateKeyPkcs8Der(rsa.get()));

        auto cert_der = provider.LoadCertificate(KeyAt(store_path, "exportme", "pw1234"));
        REQUIRE(cert_der.IsOk());
        REQUIRE(cert_der.Unwrap() == CertificateDer(cert.get()));
    }
    SECTION("Alias lookup ignores case") {
        REQUIRE(provider.LoadPrivateKey(KeyAt(store_path, "ExportMe", "pw1234")).IsOk());
    }
    SECTION("Key password alone opens a single-password store") {
        KeystoreKey key;
        key.path = store_path;
        key.alias = "exportme";
        key.key_password = "pw1234";
        REQUIRE(provider.LoadPrivateKey(key).IsOk());
    }
    SECTION("Aliases are listed") {
        auto aliases = provider.ListAliases(KeyAt(store_path, "exportme", "pw1234"));
        REQUIRE(aliases.IsOk());
        REQUIRE(aliases.Unwrap() == std::vector<std::string>{"exportme"});
    }
}

TEST_CASE("Pkcs12KeystoreProvider - Failures", "[keystore]") {
    const auto backend = CreateBackend();
    TempDirectory dir;
    const auto store_path = dir / "store.p12";
    auto rsa = GenerateRsaKey(backend);
    const auto cert = SelfSignedCertificate(backend, rsa.get(), "exportme");
    WritePkcs12(backend, store_path, rsa.get(), cert.get(), "exportme", "pw1234");
    Pkcs12KeystoreProvider provider(backend);

    SECTION("Missing file") {
        auto result = provider.LoadPrivateKey(KeyAt(dir / "absent.p12", "exportme", "pw1234"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyRetrieval);
        REQUIRE(result.UnwrapErr().message.find("not found") != std::string::npos);
    }
    SECTION("Not a PKCS#12 file") {
        WriteFile(dir / "junk.p12", std::vector<uint8_t>(64, 0x2A));
        auto result = provider.LoadPrivateKey(KeyAt(dir / "junk.p12", "exportme", "pw1234"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyRetrieval);
    }
    SECTION("Wrong store password") {
        auto result = provider.LoadPrivateKey(KeyAt(store_path, "exportme", "wrong"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyRetrieval);
        REQUIRE(result.UnwrapErr().message.find("password") != std::string::npos);
    }
    SECTION("Unknown alias") {
        auto result = provider.LoadPrivateKey(KeyAt(store_path, "someoneelse", "pw1234"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyRetrieval);
        REQUIRE(result.UnwrapErr().message.find("someoneelse") != std::string::npos);
    }
    SECTION("Wrong key password") {
        auto key = KeyAt(store_path, "exportme", "pw1234");
        key.key_password = "nope";
        auto result = provider.LoadPrivateKey(key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyRetrieval);
        REQUIRE(result.UnwrapErr().message.find("Key password") != std::string::npos);
    }
}

TEST_CASE("Pkcs12KeystoreProvider - Other key types", "[keystore]") {
    const auto backend = CreateBackend();
    TempDirectory dir;
    Pkcs12KeystoreProvider provider(backend);

    SECTION("EC") {
        auto ec = GenerateEcKey(backend);
        const auto cert = SelfSignedCertificate(backend, ec.get(), "eckey");
        WritePkcs12(backend, dir / "ec.p12", ec.get(), cert.get(), "eckey", "secret");
        auto handle = provider.LoadPrivateKey(KeyAt(dir / "ec.p12", "eckey", "secret"));
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap()->Algorithm() == "EC");
    }
    SECTION("DSA") {
        auto dsa = GenerateDsaKey(backend);
        const auto cert = SelfSignedCertificate(backend, dsa.get(), "dsakey");
        WritePkcs12(backend, dir / "dsa.p12", dsa.get(), cert.get(), "dsakey", "secret");
        auto handle = provider.LoadPrivateKey(KeyAt(dir / "dsa.p12", "dsakey", "secret"));
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap()->Algorithm() == "DSA");
    }
    SECTION("Empty password store") {
        auto rsa = GenerateRsaKey(backend);
        const auto cert = SelfSignedCertificate(backend, rsa.get(), "open");
        WritePkcs12(backend, dir / "open.p12", rsa.get(), cert.get(), "open", "");
        KeystoreKey key;
        key.path = dir / "open.p12";
        key.alias = "open";
        REQUIRE(provider.LoadPrivateKey(key).IsOk());
        REQUIRE(provider.LoadCertificate(key).IsOk());
    }
}

TEST_CASE("Pkcs12KeystoreProvider - Legacy encryption", "[keystore]") {
    const auto backend = CreateBackend();
    if (!backend.HasLegacyAlgorithms()) {
        SKIP("OpenSSL legacy provider is not installed");
    }
    TempDirectory dir;
    const auto store_path = dir / "legacy.p12";
    auto rsa = GenerateRsaKey(backend);
    const auto cert = SelfSignedCertificate(backend, rsa.get(), "exportme");
    WriteLegacyPkcs12(backend, store_path, rsa.get(), cert.get(), "exportme", "pw1234");
    Pkcs12KeystoreProvider provider(backend);

    auto handle = provider.LoadPrivateKey(KeyAt(store_path, "exportme", "pw1234"));
    REQUIRE(handle.IsOk());
    REQUIRE(EVP_PKEY_eq(handle.Unwrap()->NativeKey(), rsa.get()) == 1);

    auto cert_der = provider.LoadCertificate(KeyAt(store_path, "exportme", "pw1234"));
    REQUIRE(cert_der.IsOk());
    REQUIRE(cert_der.Unwrap() == CertificateDer(cert.get()));
}

TEST_CASE("Pkcs12KeystoreProvider - Undecryptable certificate section", "[keystore]") {
    const auto backend = CreateBackend();
    TempDirectory dir;
    const auto store_path = dir / "sealed.p12";
    auto rsa = GenerateRsaKey(backend);
    const auto cert = SelfSignedCertificate(backend, rsa.get(), "exportme");
    WritePkcs12WithSealedCertificate(backend, store_path, rsa.get(), cert.get(), "exportme", "pw1234", "other");
    Pkcs12KeystoreProvider provider(backend);

    SECTION("Key is still exported") {
        auto handle = provider.LoadPrivateKey(KeyAt(store_path, "exportme", "pw1234"));
        REQUIRE(handle.IsOk());
        REQUIRE(EVP_PKEY_eq(handle.Unwrap()->NativeKey(), rsa.get()) == 1);
    }
    SECTION("Certificate lookup reports the skipped section") {
        auto result = provider.LoadCertificate(KeyAt(store_path, "exportme", "pw1234"));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ExportFailureType::KeyRetrieval);
        REQUIRE(result.UnwrapErr().message.find("could not be decrypted") != std::string::npos);
    }
}
