#include "pkexport/archive/zip_writer.hpp"
#include "pkexport/core/format.hpp"

#include <zlib.h>
#include <algorithm>
#include <limits>

namespace pkexport::archive {
namespace {
    constexpr uint64_t kMaxZip32 = std::numeric_limits<uint32_t>::max();
    constexpr size_t kMaxEntries = std::numeric_limits<uint16_t>::max();

    void WriteU16LE(std::vector<uint8_t>& out, const uint16_t value) {
        out.push_back(static_cast<uint8_t>(value & 0xFF));
        out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }

    void WriteU32LE(std::vector<uint8_t>& out, const uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    uint32_t Crc32(std::span<const uint8_t> data) {
        uLong crc = crc32(0L, Z_NULL, 0);
        size_t offset = 0;
        while (offset < data.size()) {
            const auto chunk = static_cast<uInt>(
                std::min<size_t>(data.size() - offset, std::numeric_limits<uInt>::max()));
            crc = crc32(crc, data.data() + offset, chunk);
            offset += chunk;
        }
        return static_cast<uint32_t>(crc);
    }
}

Result<std::vector<uint8_t>, ExportFailure> ZipWriter::Deflate(std::span<const uint8_t> data) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Output(compat::format("deflateInit2 failed: {}",
                stream.msg != nullptr ? stream.msg : "unknown")));
    }
    std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&stream, Z_FINISH);
    const uLong produced = stream.total_out;
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Output(compat::format("deflate failed with code {}", rc)));
    }
    out.resize(produced);
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(out));
}

Result<Unit, ExportFailure> ZipWriter::AddEntry(
    std::string_view name,
    std::span<const uint8_t> data) {
    if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output(compat::format("Invalid zip entry name length {}", name.size())));
    }
    if (std::find(names_.begin(), names_.end(), name) != names_.end()) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output(compat::format("Duplicate zip entry: {}", name)));
    }
    if (records_.size() >= kMaxEntries || data.size() >= kMaxZip32) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output("Zip archive limits exceeded; ZIP64 is not supported"));
    }

    auto compressed_result = Deflate(data);
    if (compressed_result.IsErr()) {
        return Result<Unit, ExportFailure>::Err(std::move(compressed_result).UnwrapErr());
    }
    const std::vector<uint8_t> compressed = std::move(compressed_result).Unwrap();
    if (buffer_.size() + compressed.size() + name.size() + 30 >= kMaxZip32) {
        return Result<Unit, ExportFailure>::Err(
            ExportFailure::Output("Zip archive limits exceeded; ZIP64 is not supported"));
    }

    CentralRecord record{
        std::string(name),
        Crc32(data),
        static_cast<uint32_t>(compressed.size()),
        static_cast<uint32_t>(data.size()),
        static_cast<uint32_t>(buffer_.size())
    };

    WriteU32LE(buffer_, LOCAL_HEADER_SIGNATURE);
    WriteU16LE(buffer_, VERSION_NEEDED);
    WriteU16LE(buffer_, 0);
    WriteU16LE(buffer_, METHOD_DEFLATE);
    WriteU16LE(buffer_, 0);
    WriteU16LE(buffer_, DOS_EPOCH_DATE);
    WriteU32LE(buffer_, record.crc);
    WriteU32LE(buffer_, record.compressed_size);
    WriteU32LE(buffer_, record.uncompressed_size);
    WriteU16LE(buffer_, static_cast<uint16_t>(name.size()));
    WriteU16LE(buffer_, 0);
    buffer_.insert(buffer_.end(), name.begin(), name.end());
    buffer_.insert(buffer_.end(), compressed.begin(), compressed.end());

    records_.push_back(std::move(record));
    names_.emplace_back(name);
    return Result<Unit, ExportFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, ExportFailure> ZipWriter::Finish() {
    const size_t central_offset = buffer_.size();
    for (const auto& record : records_) {
        WriteU32LE(buffer_, CENTRAL_HEADER_SIGNATURE);
        WriteU16LE(buffer_, VERSION_NEEDED);
        WriteU16LE(buffer_, VERSION_NEEDED);
        WriteU16LE(buffer_, 0);
        WriteU16LE(buffer_, METHOD_DEFLATE);
        WriteU16LE(buffer_, 0);
        WriteU16LE(buffer_, DOS_EPOCH_DATE);
        WriteU32LE(buffer_, record.crc);
        WriteU32LE(buffer_, record.compressed_size);
        WriteU32LE(buffer_, record.uncompressed_size);
        WriteU16LE(buffer_, static_cast<uint16_t>(record.name.size()));
        WriteU16LE(buffer_, 0);
        WriteU16LE(buffer_, 0);
        WriteU16LE(buffer_, 0);
        WriteU16LE(buffer_, 0);
        WriteU32LE(buffer_, 0);
        WriteU32LE(buffer_, record.local_header_offset);
        buffer_.insert(buffer_.end(), record.name.begin(), record.name.end());
    }
    const size_t central_size = buffer_.size() - central_offset;
    if (buffer_.size() + 22 >= kMaxZip32) {
        return Result<std::vector<uint8_t>, ExportFailure>::Err(
            ExportFailure::Output("Zip archive limits exceeded; ZIP64 is not supported"));
    }

    WriteU32LE(buffer_, END_OF_CENTRAL_DIRECTORY_SIGNATURE);
    WriteU16LE(buffer_, 0);
    WriteU16LE(buffer_, 0);
    WriteU16LE(buffer_, static_cast<uint16_t>(records_.size()));
    WriteU16LE(buffer_, static_cast<uint16_t>(records_.size()));
    WriteU32LE(buffer_, static_cast<uint32_t>(central_size));
    WriteU32LE(buffer_, static_cast<uint32_t>(central_offset));
    WriteU16LE(buffer_, 0);

    std::vector<uint8_t> archive = std::move(buffer_);
    buffer_.clear();
    records_.clear();
    names_.clear();
    return Result<std::vector<uint8_t>, ExportFailure>::Ok(std::move(archive));
}
}
