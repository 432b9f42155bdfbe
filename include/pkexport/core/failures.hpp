#pragma once
#include <cstdint>
#include <string>
#include <string_view>
namespace pkexport {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    AllocationFailed,
    ReadOperationFailed,
    InvalidOperation,
    DecodeFailed
};
enum class ExportFailureType {
    Generic,
    KeyRetrieval,
    KeyFormat,
    InputFormat,
    UnsupportedAlgorithm,
    Encryption,
    Signing,
    OutputAlreadyExists,
    Output,
    InvalidConfiguration
};
// Pipeline stages. A failure is tagged with the stage that was being entered.
enum class ExportStage : uint8_t {
    Start,
    KeyLoaded,
    Encrypted,
    Signed,
    CertificateFetched,
    Written,
    Done
};
[[nodiscard]] constexpr std::string_view StageName(const ExportStage stage) noexcept {
    switch (stage) {
        case ExportStage::Start: return "Start";
        case ExportStage::KeyLoaded: return "KeyLoaded";
        case ExportStage::Encrypted: return "Encrypted";
        case ExportStage::Signed: return "Signed";
        case ExportStage::CertificateFetched: return "CertificateFetched";
        case ExportStage::Written: return "Written";
        case ExportStage::Done: return "Done";
    }
    return "Unknown";
}
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
    static SodiumFailure DecodeFailed(std::string msg) {
        return {SodiumFailureType::DecodeFailed, std::move(msg)};
    }
};
class ExportFailure {
public:
    ExportFailureType type;
    ExportStage stage;
    std::string message;
    ExportFailure(const ExportFailureType t, std::string msg)
        : type(t), stage(ExportStage::Start), message(std::move(msg)) {}
    static ExportFailure Generic(std::string msg) {
        return {ExportFailureType::Generic, std::move(msg)};
    }
    static ExportFailure KeyRetrieval(std::string msg) {
        return {ExportFailureType::KeyRetrieval, std::move(msg)};
    }
    static ExportFailure KeyFormat(std::string msg) {
        return {ExportFailureType::KeyFormat, std::move(msg)};
    }
    static ExportFailure InputFormat(std::string msg) {
        return {ExportFailureType::InputFormat, std::move(msg)};
    }
    static ExportFailure UnsupportedAlgorithm(std::string msg) {
        return {ExportFailureType::UnsupportedAlgorithm, std::move(msg)};
    }
    static ExportFailure Encryption(std::string msg) {
        return {ExportFailureType::Encryption, std::move(msg)};
    }
    static ExportFailure Signing(std::string msg) {
        return {ExportFailureType::Signing, std::move(msg)};
    }
    static ExportFailure OutputAlreadyExists(std::string msg) {
        return {ExportFailureType::OutputAlreadyExists, std::move(msg)};
    }
    static ExportFailure Output(std::string msg) {
        return {ExportFailureType::Output, std::move(msg)};
    }
    static ExportFailure InvalidConfiguration(std::string msg) {
        return {ExportFailureType::InvalidConfiguration, std::move(msg)};
    }
    static ExportFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] ExportFailure AtStage(const ExportStage s) && {
        stage = s;
        return std::move(*this);
    }
};
}
