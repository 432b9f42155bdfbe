/**
 * @file pkexport_main.cpp
 * @brief Command line front end for the private key export pipeline
 */

#include "pkexport/cli/command_line.hpp"
#include "pkexport/crypto/crypto_backend.hpp"
#include "pkexport/crypto/ecies_p256_encrypter.hpp"
#include "pkexport/keystore/pkcs12_keystore_provider.hpp"
#include "pkexport/pipeline/export_pipeline.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace pkexport;

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = cli::ParseArguments(args);
    if (parsed.IsErr()) {
        std::cerr << "Error: Unable to parse the input: " << parsed.UnwrapErr().message << std::endl;
        std::cerr << cli::UsageText();
        return 1;
    }
    if (args.empty() || parsed.Unwrap().help) {
        std::cout << cli::UsageText();
        return 0;
    }

    auto config_result = cli::BuildExportConfig(std::move(parsed).Unwrap());
    if (config_result.IsErr()) {
        std::cerr << "Error: Unable to parse the input: " << config_result.UnwrapErr().message << std::endl;
        std::cerr << cli::UsageText();
        return 1;
    }
    const configuration::ExportConfig config = std::move(config_result).Unwrap();

    try {
        auto backend_result = crypto::CryptoBackend::Create();
        if (backend_result.IsErr()) {
            std::cerr << "Error: " << backend_result.UnwrapErr().message << std::endl;
            return 1;
        }
        const crypto::CryptoBackend backend = std::move(backend_result).Unwrap();

        keystore::Pkcs12KeystoreProvider keystore_provider(backend);
        crypto::EciesP256Encrypter hybrid_encrypter(backend);
        pipeline::ExportPipeline export_pipeline(backend, keystore_provider, hybrid_encrypter);

        auto outcome = export_pipeline.Run(config);
        if (outcome.IsErr()) {
            const auto& failure = outcome.UnwrapErr();
            std::cerr << "Error: " << StageName(failure.stage) << ": " << failure.message << std::endl;
            return 1;
        }
        const auto& done = outcome.Unwrap();
        std::cout << "Exported '" << config.Key().alias << "' to " << done.path.string()
                  << " (" << done.bytes_written << " bytes, "
                  << archive::ArchiveKindName(done.kind) << ")" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "Error: Unable to export or encrypt the private key: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
