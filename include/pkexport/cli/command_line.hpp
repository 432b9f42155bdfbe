#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include "pkexport/configuration/export_config.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>
namespace pkexport::cli {

struct CommandLineFlags {
    static constexpr std::string_view KEYSTORE = "keystore";
    static constexpr std::string_view ALIAS = "alias";
    static constexpr std::string_view RSA_AES_ENCRYPTION = "rsa-aes-encryption";
    static constexpr std::string_view ENCRYPTION_KEY_PATH = "encryption-key-path";
    static constexpr std::string_view ENCRYPTION_KEY = "encryptionkey";
    static constexpr std::string_view OUTPUT = "output";
    static constexpr std::string_view SIGNING_KEYSTORE = "signing-keystore";
    static constexpr std::string_view SIGNING_KEY_ALIAS = "signing-key-alias";
    static constexpr std::string_view KEYSTORE_PASS = "keystore-pass";
    static constexpr std::string_view KEY_PASS = "key-pass";
    static constexpr std::string_view SIGNING_KEYSTORE_PASS = "signing-keystore-pass";
    static constexpr std::string_view SIGNING_KEY_PASS = "signing-key-pass";
    static constexpr std::string_view INCLUDE_CERT = "include-cert";
    static constexpr std::string_view HELP = "help";
};

struct CommandLineArguments {
    bool help = false;
    std::map<std::string, std::string, std::less<>> flags;
};

/**
 * Splits "--name=value" arguments. Repeated flags and arguments without a
 * leading "--" are rejected; "--help" needs no value.
 */
[[nodiscard]] Result<CommandLineArguments, ExportFailure> ParseArguments(
    const std::vector<std::string>& args);

/**
 * Maps parsed flags onto an export configuration. Reads the RSA wrapping key
 * file when --rsa-aes-encryption=true. Any flag left over is an error.
 */
[[nodiscard]] Result<configuration::ExportConfig, ExportFailure> BuildExportConfig(
    CommandLineArguments arguments);

[[nodiscard]] std::string UsageText();
}
