#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/interfaces/i_keystore_provider.hpp"
#include <memory>
#include <string>
#include <vector>

#include <openssl/pkcs12.h>

namespace pkexport::keystore {

/**
 * Key store provider over PKCS#12 files.
 *
 * Entries are addressed by their friendlyName attribute, compared without
 * regard to case since keytool lowercases aliases on import. The matching
 * certificate is the certBag sharing the key's localKeyID; stores written
 * without localKeyID fall back to the friendlyName.
 *
 * Encrypted safes are decrypted in the backend's library context. One that
 * cannot be decrypted is skipped rather than failing the whole store, so a key
 * can still be exported when only the certificate section uses a cipher this
 * build lacks.
 *
 * Every failure is reported as KeyRetrieval, each with its own message.
 */
class Pkcs12KeystoreProvider final : public interfaces::IKeystoreProvider {
public:
    explicit Pkcs12KeystoreProvider(const crypto::CryptoBackend& backend) : backend_(backend) {}

    [[nodiscard]] Result<std::unique_ptr<PrivateKeyHandle>, ExportFailure> LoadPrivateKey(
        const KeystoreKey& key) override;

    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> LoadCertificate(
        const KeystoreKey& key) override;

    /**
     * Aliases of every key entry in the store, in file order.
     */
    [[nodiscard]] Result<std::vector<std::string>, ExportFailure> ListAliases(
        const KeystoreKey& key) const;

private:
    struct Pkcs12Deleter {
        void operator()(PKCS12* p12) const noexcept { PKCS12_free(p12); }
    };
    struct SafeBagStackDeleter {
        void operator()(STACK_OF(PKCS12_SAFEBAG)* bags) const noexcept {
            sk_PKCS12_SAFEBAG_pop_free(bags, PKCS12_SAFEBAG_free);
        }
    };
    using Pkcs12Ptr = std::unique_ptr<PKCS12, Pkcs12Deleter>;
    using SafeBagStackPtr = std::unique_ptr<STACK_OF(PKCS12_SAFEBAG), SafeBagStackDeleter>;

    /**
     * A parsed, MAC-verified store with every safe bag flattened, including
     * those nested in safeContents bags. The raw pointers are owned by
     * @c owned_stacks. @c skipped_safe_error holds the OpenSSL error of the
     * first encrypted safe that could not be decrypted.
     */
    struct OpenedStore {
        Pkcs12Ptr p12;
        std::vector<SafeBagStackPtr> owned_stacks;
        std::vector<PKCS12_SAFEBAG*> bags;
        std::string skipped_safe_error;
    };

    [[nodiscard]] Result<OpenedStore, ExportFailure> Open(const KeystoreKey& key) const;

    [[nodiscard]] static std::string SkippedSafeNote(const OpenedStore& store);

    [[nodiscard]] static Result<PKCS12_SAFEBAG*, ExportFailure> FindKeyBag(
        const OpenedStore& store,
        const KeystoreKey& key);

    const crypto::CryptoBackend& backend_;
};
}
