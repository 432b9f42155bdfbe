#include "pkexport/cli/command_line.hpp"
#include "pkexport/core/format.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>

namespace pkexport::cli {
namespace {
    constexpr std::string_view kFlagPrefix = "--";

    std::optional<std::string> TakeFlag(CommandLineArguments& arguments, const std::string_view name) {
        const auto it = arguments.flags.find(name);
        if (it == arguments.flags.end()) {
            return std::nullopt;
        }
        std::string value = std::move(it->second);
        arguments.flags.erase(it);
        return value;
    }

    Result<std::string, ExportFailure> TakeRequiredFlag(CommandLineArguments& arguments, const std::string_view name) {
        auto value = TakeFlag(arguments, name);
        if (!value.has_value()) {
            return Result<std::string, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration(compat::format("--{} must be specified", name)));
        }
        return Result<std::string, ExportFailure>::Ok(std::move(*value));
    }

    // Anything other than "true" (any case) is false.
    bool ParseBoolean(const std::optional<std::string>& value) {
        if (!value.has_value()) {
            return false;
        }
        std::string lowered(*value);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lowered == "true";
    }

    Result<std::vector<uint8_t>, ExportFailure> ReadKeyFile(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return Result<std::vector<uint8_t>, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration(
                    compat::format("Cannot read encryption key file: {}", path)));
        }
        std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(bytes));
    }
}

Result<CommandLineArguments, ExportFailure> ParseArguments(const std::vector<std::string>& args) {
    CommandLineArguments parsed;
    for (const auto& arg : args) {
        const std::string_view view(arg);
        if (view.substr(0, kFlagPrefix.size()) != kFlagPrefix) {
            return Result<CommandLineArguments, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration(compat::format("Unexpected argument: {}", arg)));
        }
        const std::string_view body = view.substr(kFlagPrefix.size());
        if (body == CommandLineFlags::HELP) {
            parsed.help = true;
            continue;
        }
        const size_t separator = body.find('=');
        if (separator == std::string_view::npos || separator == 0) {
            return Result<CommandLineArguments, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration(
                    compat::format("Flags must be given as --name=value: {}", arg)));
        }
        std::string name(body.substr(0, separator));
        std::string value(body.substr(separator + 1));
        if (!parsed.flags.emplace(name, std::move(value)).second) {
            return Result<CommandLineArguments, ExportFailure>::Err(
                ExportFailure::InvalidConfiguration(compat::format("Flag given twice: --{}", name)));
        }
    }
    return Result<CommandLineArguments, ExportFailure>::Ok(std::move(parsed));
}

Result<configuration::ExportConfig, ExportFailure> BuildExportConfig(CommandLineArguments arguments) {
    using ResultType = Result<configuration::ExportConfig, ExportFailure>;

    auto keystore_path = TakeRequiredFlag(arguments, CommandLineFlags::KEYSTORE);
    if (keystore_path.IsErr()) {
        return ResultType::Err(std::move(keystore_path).UnwrapErr());
    }
    auto alias = TakeRequiredFlag(arguments, CommandLineFlags::ALIAS);
    if (alias.IsErr()) {
        return ResultType::Err(std::move(alias).UnwrapErr());
    }
    auto output = TakeRequiredFlag(arguments, CommandLineFlags::OUTPUT);
    if (output.IsErr()) {
        return ResultType::Err(std::move(output).UnwrapErr());
    }

    keystore::KeystoreKey key;
    key.path = std::move(keystore_path).Unwrap();
    key.alias = std::move(alias).Unwrap();
    key.store_password = TakeFlag(arguments, CommandLineFlags::KEYSTORE_PASS);
    key.key_password = TakeFlag(arguments, CommandLineFlags::KEY_PASS);

    const bool use_rsa_aes = ParseBoolean(TakeFlag(arguments, CommandLineFlags::RSA_AES_ENCRYPTION));
    std::optional<configuration::ExportConfig> config;
    if (use_rsa_aes) {
        auto key_path = TakeRequiredFlag(arguments, CommandLineFlags::ENCRYPTION_KEY_PATH);
        if (key_path.IsErr()) {
            return ResultType::Err(std::move(key_path).UnwrapErr());
        }
        auto key_bytes = ReadKeyFile(key_path.Unwrap());
        if (key_bytes.IsErr()) {
            return ResultType::Err(std::move(key_bytes).UnwrapErr());
        }
        config = configuration::ExportConfig::RsaAesKeyWrap(
            std::move(key), std::move(key_bytes).Unwrap(), std::move(output).Unwrap());
    } else {
        auto recipient_hex = TakeRequiredFlag(arguments, CommandLineFlags::ENCRYPTION_KEY);
        if (recipient_hex.IsErr()) {
            return ResultType::Err(std::move(recipient_hex).UnwrapErr());
        }
        config = configuration::ExportConfig::HybridEc(
            std::move(key), std::move(recipient_hex).Unwrap(), std::move(output).Unwrap());
    }

    if (auto signing_alias = TakeFlag(arguments, CommandLineFlags::SIGNING_KEY_ALIAS); signing_alias.has_value()) {
        auto signing_path = TakeRequiredFlag(arguments, CommandLineFlags::SIGNING_KEYSTORE);
        if (signing_path.IsErr()) {
            return ResultType::Err(std::move(signing_path).UnwrapErr());
        }
        keystore::KeystoreKey signing_key;
        signing_key.path = std::move(signing_path).Unwrap();
        signing_key.alias = std::move(*signing_alias);
        signing_key.store_password = TakeFlag(arguments, CommandLineFlags::SIGNING_KEYSTORE_PASS);
        signing_key.key_password = TakeFlag(arguments, CommandLineFlags::SIGNING_KEY_PASS);
        config = std::move(*config).WithSigningKey(std::move(signing_key));
    }
    config = std::move(*config).WithCertificate(ParseBoolean(TakeFlag(arguments, CommandLineFlags::INCLUDE_CERT)));

    if (!arguments.flags.empty()) {
        std::string unknown;
        for (const auto& flag : arguments.flags) {
            unknown += unknown.empty() ? "--" : ", --";
            unknown += flag.first;
        }
        return ResultType::Err(
            ExportFailure::InvalidConfiguration(compat::format("Unrecognized flags: {}", unknown)));
    }
    return ResultType::Ok(std::move(*config));
}

std::string UsageText() {
    return
        "Usage: pkexport --keystore=<file> --alias=<alias> --output=<file> [options]\n"
        "\n"
        "Exports a private key from a PKCS#12 keystore, encrypted for transfer.\n"
        "\n"
        "Encryption (one of):\n"
        "  --encryptionkey=<hex>              recipient EC public key, hex encoded\n"
        "  --rsa-aes-encryption=true          RSA-OAEP + AES key wrap, with\n"
        "  --encryption-key-path=<file>       RSA public key file (PEM or DER)\n"
        "\n"
        "Options:\n"
        "  --keystore-pass=<password>         keystore password\n"
        "  --key-pass=<password>              key password (defaults to the keystore password)\n"
        "  --signing-key-alias=<alias>        sign the encrypted key with this key\n"
        "  --signing-keystore=<file>          keystore holding the signing key\n"
        "  --signing-keystore-pass=<password> signing keystore password\n"
        "  --signing-key-pass=<password>      signing key password (defaults to the\n"
        "                                     signing keystore password)\n"
        "  --include-cert=true                add the key's certificate to the output\n"
        "  --help                             show this text\n"
        "\n"
        "With a signing key or --include-cert=true the output is a zip archive.\n";
}
}
