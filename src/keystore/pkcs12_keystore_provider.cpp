#include "pkexport/keystore/pkcs12_keystore_provider.hpp"
#include "pkexport/crypto/openssl_types.hpp"
#include "pkexport/core/format.hpp"
#include "pkexport/debug/export_logger.hpp"

#include <openssl/pkcs7.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace pkexport::keystore {
namespace {
    bool EqualsIgnoreCase(const std::string_view lhs, const std::string_view rhs) {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](const char a, const char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    }

    std::string FriendlyName(PKCS12_SAFEBAG* bag) {
        char* name = PKCS12_get_friendlyname(bag);
        if (name == nullptr) {
            return {};
        }
        std::string result(name);
        OPENSSL_free(name);
        return result;
    }

    bool IsKeyBag(const PKCS12_SAFEBAG* bag) {
        const int nid = PKCS12_SAFEBAG_get_nid(bag);
        return nid == NID_keyBag || nid == NID_pkcs8ShroudedKeyBag;
    }

    bool IsX509CertBag(const PKCS12_SAFEBAG* bag) {
        return PKCS12_SAFEBAG_get_nid(bag) == NID_certBag &&
               PKCS12_SAFEBAG_get_bag_nid(bag) == NID_x509Certificate;
    }

    const ASN1_OCTET_STRING* LocalKeyId(const PKCS12_SAFEBAG* bag) {
        const ASN1_TYPE* attr = PKCS12_SAFEBAG_get0_attr(bag, NID_localKeyID);
        if (attr == nullptr || attr->type != V_ASN1_OCTET_STRING) {
            return nullptr;
        }
        return attr->value.octet_string;
    }

    // An empty password may have been encoded either as an empty BMPString or
    // as no password at all, depending on the tool that wrote the file.
    template<typename F>
    auto WithPasswordCandidates(const std::string& password, F&& attempt) {
        auto result = attempt(password.c_str(), static_cast<int>(password.size()));
        if (!result && password.empty()) {
            result = attempt(nullptr, 0);
        }
        return result;
    }

    void CollectBags(const STACK_OF(PKCS12_SAFEBAG)* stack, std::vector<PKCS12_SAFEBAG*>& out) {
        for (int i = 0; i < sk_PKCS12_SAFEBAG_num(stack); ++i) {
            PKCS12_SAFEBAG* bag = sk_PKCS12_SAFEBAG_value(stack, i);
            if (PKCS12_SAFEBAG_get_nid(bag) == NID_safeContentsBag) {
                CollectBags(PKCS12_SAFEBAG_get0_safes(bag), out);
            } else {
                out.push_back(bag);
            }
        }
    }

    // PKCS12_unpack_p7encdata would decrypt in the default library context,
    // which lacks the legacy provider.
    STACK_OF(PKCS12_SAFEBAG)* DecryptSafeContents(
        const PKCS7* p7,
        const char* pass,
        const int pass_len,
        const crypto::CryptoBackend& backend) {
        if (p7->d.encrypted == nullptr || p7->d.encrypted->enc_data == nullptr ||
            p7->d.encrypted->enc_data->enc_data == nullptr) {
            return nullptr;
        }
        const PKCS7_ENC_CONTENT* content = p7->d.encrypted->enc_data;
        return static_cast<STACK_OF(PKCS12_SAFEBAG)*>(PKCS12_item_decrypt_d2i_ex(
            content->algorithm, ASN1_ITEM_rptr(PKCS12_SAFEBAGS), pass, pass_len,
            content->enc_data, 1, backend.LibraryContext(), backend.PropertyQuery()));
    }

    struct Pkcs7StackDeleter {
        void operator()(STACK_OF(PKCS7)* stack) const noexcept {
            sk_PKCS7_pop_free(stack, PKCS7_free);
        }
    };
}

Result<Pkcs12KeystoreProvider::OpenedStore, ExportFailure> Pkcs12KeystoreProvider::Open(
    const KeystoreKey& key) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(key.path, ec)) {
        return Result<OpenedStore, ExportFailure>::Err(
            ExportFailure::KeyRetrieval(
                compat::format("Keystore file not found: {}", key.path.string())));
    }
    crypto::BioPtr bio(BIO_new_file(key.path.string().c_str(), "rb"));
    if (!bio) {
        return Result<OpenedStore, ExportFailure>::Err(
            ExportFailure::KeyRetrieval(
                compat::format("Cannot open keystore {}: {}", key.path.string(), crypto::GetOpenSSLError())));
    }
    OpenedStore store;
    store.p12.reset(d2i_PKCS12_bio(bio.get(), nullptr));
    if (!store.p12) {
        return Result<OpenedStore, ExportFailure>::Err(
            ExportFailure::KeyRetrieval(
                compat::format("{} is not a PKCS#12 keystore: {}", key.path.string(), crypto::GetOpenSSLError())));
    }

    const std::string store_password = key.StorePassword();
    if (PKCS12_mac_present(store.p12.get()) == 1) {
        const bool mac_ok = WithPasswordCandidates(store_password, [&store](const char* pass, const int len) {
            return PKCS12_verify_mac(store.p12.get(), pass, len) == 1;
        });
        if (!mac_ok) {
            return Result<OpenedStore, ExportFailure>::Err(
                ExportFailure::KeyRetrieval(
                    compat::format("Keystore password was incorrect for {}", key.path.string())));
        }
    }

    std::unique_ptr<STACK_OF(PKCS7), Pkcs7StackDeleter> auth_safes(PKCS12_unpack_authsafes(store.p12.get()));
    if (!auth_safes) {
        return Result<OpenedStore, ExportFailure>::Err(
            ExportFailure::KeyRetrieval(
                compat::format("Keystore contents are unreadable: {}", crypto::GetOpenSSLError())));
    }
    for (int i = 0; i < sk_PKCS7_num(auth_safes.get()); ++i) {
        PKCS7* p7 = sk_PKCS7_value(auth_safes.get(), i);
        STACK_OF(PKCS12_SAFEBAG)* bags = nullptr;
        if (PKCS7_type_is_data(p7)) {
            bags = PKCS12_unpack_p7data(p7);
        } else if (PKCS7_type_is_encrypted(p7)) {
            bags = WithPasswordCandidates(store_password, [this, p7](const char* pass, const int len) {
                return DecryptSafeContents(p7, pass, len, backend_);
            });
        } else {
            continue;
        }
        // A safe we cannot decrypt is skipped; the entry being looked up may
        // live in another one.
        if (bags == nullptr) {
            if (store.skipped_safe_error.empty()) {
                store.skipped_safe_error = crypto::GetOpenSSLError();
            }
            continue;
        }
        store.owned_stacks.emplace_back(bags);
        CollectBags(bags, store.bags);
    }
    return Result<OpenedStore, ExportFailure>::Ok(std::move(store));
}

std::string Pkcs12KeystoreProvider::SkippedSafeNote(const OpenedStore& store) {
    if (store.skipped_safe_error.empty()) {
        return {};
    }
    return compat::format(" (an encrypted section could not be decrypted: {})", store.skipped_safe_error);
}

Result<PKCS12_SAFEBAG*, ExportFailure> Pkcs12KeystoreProvider::FindKeyBag(
    const OpenedStore& store,
    const KeystoreKey& key) {
    for (PKCS12_SAFEBAG* bag : store.bags) {
        if (IsKeyBag(bag) && EqualsIgnoreCase(FriendlyName(bag), key.alias)) {
            return Result<PKCS12_SAFEBAG*, ExportFailure>::Ok(bag);
        }
    }
    return Result<PKCS12_SAFEBAG*, ExportFailure>::Err(
        ExportFailure::KeyRetrieval(
            compat::format("No key with alias '{}' found in keystore {}{}",
                key.alias, key.path.string(), SkippedSafeNote(store))));
}

Result<std::unique_ptr<PrivateKeyHandle>, ExportFailure> Pkcs12KeystoreProvider::LoadPrivateKey(
    const KeystoreKey& key) {
    using ResultType = Result<std::unique_ptr<PrivateKeyHandle>, ExportFailure>;
    auto store_result = Open(key);
    if (store_result.IsErr()) {
        return ResultType::Err(std::move(store_result).UnwrapErr());
    }
    const OpenedStore store = std::move(store_result).Unwrap();
    auto bag_result = FindKeyBag(store, key);
    if (bag_result.IsErr()) {
        return ResultType::Err(std::move(bag_result).UnwrapErr());
    }
    const PKCS12_SAFEBAG* bag = bag_result.Unwrap();

    crypto::EvpPkeyPtr pkey;
    if (PKCS12_SAFEBAG_get_nid(bag) == NID_keyBag) {
        pkey.reset(EVP_PKCS82PKEY_ex(PKCS12_SAFEBAG_get0_p8inf(bag),
                                     backend_.LibraryContext(), backend_.PropertyQuery()));
    } else {
        const std::string key_password = key.KeyPassword();
        PKCS8_PRIV_KEY_INFO* p8 = WithPasswordCandidates(key_password, [this, bag](const char* pass, const int len) {
            return PKCS12_decrypt_skey_ex(bag, pass, len, backend_.LibraryContext(), backend_.PropertyQuery());
        });
        if (p8 == nullptr) {
            return ResultType::Err(
                ExportFailure::KeyRetrieval(
                    compat::format("Key password was incorrect for alias '{}'", key.alias)));
        }
        pkey.reset(EVP_PKCS82PKEY_ex(p8, backend_.LibraryContext(), backend_.PropertyQuery()));
        PKCS8_PRIV_KEY_INFO_free(p8);
    }
    if (!pkey) {
        return ResultType::Err(
            ExportFailure::KeyRetrieval(
                compat::format("Key '{}' could not be decoded: {}", key.alias, crypto::GetOpenSSLError())));
    }
    PKEXPORT_LOG_MSG("KEYSTORE", compat::format("loaded {} key '{}'", KeyAlgorithmName(pkey.get()), key.alias));
    return ResultType::Ok(std::make_unique<EvpPrivateKeyHandle>(std::move(pkey)));
}

Result<std::vector<uint8_t>, ExportFailure> Pkcs12KeystoreProvider::LoadCertificate(
    const KeystoreKey& key) {
    using ResultType = Result<std::vector<uint8_t>, ExportFailure>;
    auto store_result = Open(key);
    if (store_result.IsErr()) {
        return ResultType::Err(std::move(store_result).UnwrapErr());
    }
    const OpenedStore store = std::move(store_result).Unwrap();
    auto bag_result = FindKeyBag(store, key);
    if (bag_result.IsErr()) {
        return ResultType::Err(std::move(bag_result).UnwrapErr());
    }
    const ASN1_OCTET_STRING* key_id = LocalKeyId(bag_result.Unwrap());

    PKCS12_SAFEBAG* match = nullptr;
    for (PKCS12_SAFEBAG* bag : store.bags) {
        if (!IsX509CertBag(bag)) {
            continue;
        }
        const ASN1_OCTET_STRING* cert_id = LocalKeyId(bag);
        if (key_id != nullptr && cert_id != nullptr && ASN1_STRING_cmp(key_id, cert_id) == 0) {
            match = bag;
            break;
        }
        if (match == nullptr && EqualsIgnoreCase(FriendlyName(bag), key.alias)) {
            match = bag;
        }
    }
    if (match == nullptr) {
        return ResultType::Err(
            ExportFailure::KeyRetrieval(
                compat::format("No certificate stored for alias '{}'{}", key.alias, SkippedSafeNote(store))));
    }

    crypto::X509Ptr cert(PKCS12_SAFEBAG_get1_cert(match));
    if (!cert) {
        return ResultType::Err(
            ExportFailure::KeyRetrieval(
                compat::format("Certificate for alias '{}' is unreadable: {}", key.alias, crypto::GetOpenSSLError())));
    }
    unsigned char* der = nullptr;
    const int der_len = i2d_X509(cert.get(), &der);
    if (der_len <= 0 || der == nullptr) {
        return ResultType::Err(
            ExportFailure::KeyRetrieval(
                compat::format("Failed to encode certificate: {}", crypto::GetOpenSSLError())));
    }
    std::vector<uint8_t> encoded(der, der + der_len);
    OPENSSL_free(der);
    return ResultType::Ok(std::move(encoded));
}

Result<std::vector<std::string>, ExportFailure> Pkcs12KeystoreProvider::ListAliases(
    const KeystoreKey& key) const {
    auto store_result = Open(key);
    if (store_result.IsErr()) {
        return Result<std::vector<std::string>, ExportFailure>::Err(std::move(store_result).UnwrapErr());
    }
    const OpenedStore store = std::move(store_result).Unwrap();
    std::vector<std::string> aliases;
    for (PKCS12_SAFEBAG* bag : store.bags) {
        if (IsKeyBag(bag)) {
            aliases.push_back(FriendlyName(bag));
        }
    }
    return Result<std::vector<std::string>, ExportFailure>::Ok(std::move(aliases));
}
}
