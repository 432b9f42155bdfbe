#include "pkexport/archive/archive_builder.hpp"
#include "pkexport/archive/zip_writer.hpp"
#include "pkexport/crypto/sodium_interop.hpp"
#include "pkexport/core/constants.hpp"
#include "pkexport/core/format.hpp"
#include "pkexport/debug/export_logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace pkexport::archive {
namespace {
    constexpr size_t kTempTokenSize = 8;
    constexpr mode_t kOutputMode = 0644;

    std::filesystem::path MakeTempPath(const std::filesystem::path& destination) {
        static constexpr char kHex[] = "0123456789abcdef";
        const auto token = crypto::SodiumInterop::GetRandomBytes(kTempTokenSize);
        std::string suffix;
        suffix.reserve(token.size() * 2);
        for (const auto byte : token) {
            suffix.push_back(kHex[byte >> 4]);
            suffix.push_back(kHex[byte & 0x0F]);
        }
        std::filesystem::path directory = destination.parent_path();
        if (directory.empty()) {
            directory = ".";
        }
        return directory / ("." + destination.filename().string() + "." + suffix + ".tmp");
    }

    // Unlinks the temporary name on every exit path; after a successful link
    // the destination keeps the data alive.
    class TempFileGuard {
    public:
        explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
        ~TempFileGuard() {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
        TempFileGuard(const TempFileGuard&) = delete;
        TempFileGuard& operator=(const TempFileGuard&) = delete;
    private:
        std::filesystem::path path_;
    };

    Result<Unit, ExportFailure> WriteAndSync(const int fd, std::span<const uint8_t> bytes) {
        size_t total = 0;
        while (total < bytes.size()) {
            const ssize_t written = ::write(fd, bytes.data() + total, bytes.size() - total);
            if (written < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Result<Unit, ExportFailure>::Err(
                    ExportFailure::Output(compat::format("Write failed: {}", std::strerror(errno))));
            }
            total += static_cast<size_t>(written);
        }
        if (::fsync(fd) != 0) {
            return Result<Unit, ExportFailure>::Err(
                ExportFailure::Output(compat::format("fsync failed: {}", std::strerror(errno))));
        }
        return Result<Unit, ExportFailure>::Ok(unit);
    }
}

Result<Unit, ExportFailure> ArchiveBuilder::CommitAtomically(
    const std::filesystem::path& destination,
    std::span<const uint8_t> bytes) {
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::symlink_status(destination, ec))) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::OutputAlreadyExists(
                compat::format("Output file already exists: {}", destination.string())));
    }

    const std::filesystem::path temp_path = MakeTempPath(destination);
    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, kOutputMode);
    if (fd < 0) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output(
                compat::format("Cannot create temporary file in {}: {}",
                    temp_path.parent_path().string(), std::strerror(errno))));
    }
    TempFileGuard guard(temp_path);

    auto write_result = WriteAndSync(fd, bytes);
    const int close_rc = ::close(fd);
    if (write_result.IsErr()) {
        return write_result;
    }
    if (close_rc != 0) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output(compat::format("close failed: {}", std::strerror(errno))));
    }

    std::filesystem::create_hard_link(temp_path, destination, ec);
    if (ec == std::errc::file_exists) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::OutputAlreadyExists(
                compat::format("Output file already exists: {}", destination.string())));
    }
    if (ec) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output(
                compat::format("Cannot create {}: {}", destination.string(), ec.message())));
    }
    return Result<Unit, ExportFailure>::Ok(unit);
}

Result<ExportArchive, ExportFailure> ArchiveBuilder::Build(
    const std::optional<crypto::Signature>& signature,
    std::span<const uint8_t> payload,
    const std::optional<std::string>& certificate_pem) const {
    ExportArchive archive{ArchiveKind::BareCiphertext, destination_, {}, {}};

    if (!signature.has_value() && !certificate_pem.has_value()) {
        archive.bytes.assign(payload.begin(), payload.end());
    } else {
        ZipWriter writer;
        if (signature.has_value()) {
            auto added = writer.AddEntry(ArchiveEntryNames::SIGNATURE, signature->bytes);
            if (added.IsErr()) {
                return Result<ExportArchive, ExportFailure>::Err(std::move(added).UnwrapErr());
            }
        }
        if (auto added = writer.AddEntry(ArchiveEntryNames::ENCRYPTED_PRIVATE_KEY, payload); added.IsErr()) {
            return Result<ExportArchive, ExportFailure>::Err(std::move(added).UnwrapErr());
        }
        if (certificate_pem.has_value()) {
            const std::span<const uint8_t> pem(
                reinterpret_cast<const uint8_t*>(certificate_pem->data()), certificate_pem->size());
            auto added = writer.AddEntry(ArchiveEntryNames::CERTIFICATE, pem);
            if (added.IsErr()) {
                return Result<ExportArchive, ExportFailure>::Err(std::move(added).UnwrapErr());
            }
        }
        archive.kind = ArchiveKind::ZipArchive;
        archive.entry_names = writer.EntryNames();
        auto finished = writer.Finish();
        if (finished.IsErr()) {
            return Result<ExportArchive, ExportFailure>::Err(std::move(finished).UnwrapErr());
        }
        archive.bytes = std::move(finished).Unwrap();
    }

    auto committed = CommitAtomically(destination_, archive.bytes);
    if (committed.IsErr()) {
        return Result<ExportArchive, ExportFailure>::Err(std::move(committed).UnwrapErr());
    }
    PKEXPORT_LOG_MSG("ARCHIVE", compat::format("wrote {} artifact {}",
        ArchiveKindName(archive.kind), destination_.string()));
    PKEXPORT_LOG_BYTES("ARCHIVE", "artifact", std::span<const uint8_t>(archive.bytes));
    return Result<ExportArchive, ExportFailure>::Ok(std::move(archive));
}
}
