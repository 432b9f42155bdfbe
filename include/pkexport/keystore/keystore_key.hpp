#pragma once
#include <filesystem>
#include <optional>
#include <string>
namespace pkexport::keystore {

/**
 * Locates one private key inside a key store file.
 *
 * This is a lookup descriptor, not a secret container; it lives only for one
 * run. When only one password is given it is used for both the store and the
 * key, which is how single-password PKCS#12 files are produced by keytool and
 * openssl.
 */
struct KeystoreKey {
    std::filesystem::path path;
    std::string alias;
    std::optional<std::string> store_password;
    std::optional<std::string> key_password;

    [[nodiscard]] std::string StorePassword() const {
        return store_password.value_or(key_password.value_or(std::string()));
    }

    [[nodiscard]] std::string KeyPassword() const {
        return key_password.value_or(store_password.value_or(std::string()));
    }
};
}
