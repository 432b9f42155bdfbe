#include "pkexport/crypto/pem_codec.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <iterator>
namespace pkexport::crypto {
namespace {
    constexpr std::string_view kBeginPrefix = "-----BEGIN ";
    constexpr std::string_view kEndPrefix = "-----END ";
    constexpr std::string_view kBoundarySuffix = "-----";

    std::string Boundary(std::string_view prefix, std::string_view label) {
        std::string line;
        line.reserve(prefix.size() + label.size() + kBoundarySuffix.size());
        line.append(prefix).append(label).append(kBoundarySuffix);
        return line;
    }
}

std::string PemCodec::Base64Encode(std::span<const uint8_t> data) {
    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        data.data(),
        static_cast<int>(data.size()));
    encoded.resize(static_cast<size_t>(written));
    return encoded;
}

std::string PemCodec::ToPem(std::span<const uint8_t> der, std::string_view label) {
    const std::string body = Base64Encode(der);
    std::string pem = Boundary(kBeginPrefix, label);
    pem.push_back('\n');
    if (body.empty()) {
        pem.push_back('\n');
    }
    for (size_t offset = 0; offset < body.size(); offset += Constants::PEM_LINE_LENGTH) {
        pem.append(body, offset, Constants::PEM_LINE_LENGTH);
        pem.push_back('\n');
    }
    pem.append(Boundary(kEndPrefix, label));
    pem.push_back('\n');
    return pem;
}

std::vector<uint8_t> PemCodec::ToPemBytes(std::span<const uint8_t> der, std::string_view label) {
    const std::string pem = ToPem(der, label);
    return std::vector<uint8_t>(pem.begin(), pem.end());
}

bool PemCodec::LooksLikePem(std::span<const uint8_t> bytes) {
    const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return text.find(kBeginPrefix) != std::string_view::npos;
}

Result<std::vector<uint8_t>, ExportFailure> PemCodec::FromPem(
    std::string_view pem,
    std::string_view label) {
    const std::string begin = Boundary(kBeginPrefix, label);
    const std::string end = Boundary(kEndPrefix, label);
    const size_t begin_pos = pem.find(begin);
    if (begin_pos == std::string_view::npos) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::KeyFormat(compat::format("No PEM block labelled '{}' found", label)));
    }
    const size_t body_pos = begin_pos + begin.size();
    const size_t end_pos = pem.find(end, body_pos);
    if (end_pos == std::string_view::npos) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::KeyFormat(compat::format("PEM block '{}' is not terminated", label)));
    }

    std::string body;
    body.reserve(end_pos - body_pos);
    std::copy_if(pem.begin() + static_cast<std::ptrdiff_t>(body_pos),
                 pem.begin() + static_cast<std::ptrdiff_t>(end_pos),
                 std::back_inserter(body),
                 [](const char c) { return std::isspace(static_cast<unsigned char>(c)) == 0; });
    if (body.size() % 4 != 0) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("PEM block '{}' has a truncated base64 body", label)));
    }

    std::vector<uint8_t> der(3 * body.size() / 4);
    const int decoded = EVP_DecodeBlock(
        der.data(),
        reinterpret_cast<const unsigned char*>(body.data()),
        static_cast<int>(body.size()));
    if (decoded < 0) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::KeyFormat(
                compat::format("PEM block '{}' contains invalid base64", label)));
    }
    // EVP_DecodeBlock counts padding characters as zero bytes
    size_t padding = 0;
    if (!body.empty() && body.back() == '=') {
        ++padding;
        if (body.size() >= 2 && body[body.size() - 2] == '=') {
            ++padding;
        }
    }
    der.resize(static_cast<size_t>(decoded) - padding);
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(der));
}
}
