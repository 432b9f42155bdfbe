#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/keystore/keystore_key.hpp"
#include "pkexport/keystore/private_key_handle.hpp"
#include <cstdint>
#include <memory>
#include <vector>
namespace pkexport::interfaces {
class IKeystoreProvider {
public:
    virtual ~IKeystoreProvider() = default;

    [[nodiscard]] virtual Result<std::unique_ptr<keystore::PrivateKeyHandle>, ExportFailure> LoadPrivateKey(
        const keystore::KeystoreKey& key) = 0;

    /**
     * DER encoding of the X.509 certificate stored with @p key.
     */
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ExportFailure> LoadCertificate(
        const keystore::KeystoreKey& key) = 0;
};
}
