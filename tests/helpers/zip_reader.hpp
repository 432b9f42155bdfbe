#pragma once
#include <zlib.h>

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace pkexport::test_helpers {

struct ZipEntry {
    std::string name;
    uint16_t method;
    uint16_t dos_date;
    uint16_t dos_time;
    std::vector<uint8_t> data;
};

/**
 * Minimal reader for archives produced by ZipWriter: walks the central
 * directory, inflates each entry and checks its CRC-32.
 */
class ZipReader {
public:
    static std::vector<ZipEntry> Read(std::span<const uint8_t> archive) {
        if (archive.size() < kEocdSize) {
            throw std::runtime_error("Archive too short");
        }
        size_t eocd = archive.size() - kEocdSize;
        while (U32(archive, eocd) != 0x06054b50) {
            if (eocd == 0) {
                throw std::runtime_error("End of central directory not found");
            }
            --eocd;
        }
        const uint16_t count = U16(archive, eocd + 10);
        size_t offset = U32(archive, eocd + 16);

        std::vector<ZipEntry> entries;
        for (uint16_t i = 0; i < count; ++i) {
            if (U32(archive, offset) != 0x02014b50) {
                throw std::runtime_error("Bad central directory header");
            }
            const uint16_t method = U16(archive, offset + 10);
            const uint16_t dos_time = U16(archive, offset + 12);
            const uint16_t dos_date = U16(archive, offset + 14);
            const uint32_t crc = U32(archive, offset + 16);
            const uint32_t compressed = U32(archive, offset + 20);
            const uint32_t uncompressed = U32(archive, offset + 24);
            const uint16_t name_len = U16(archive, offset + 28);
            const uint16_t extra_len = U16(archive, offset + 30);
            const uint16_t comment_len = U16(archive, offset + 32);
            const uint32_t local_offset = U32(archive, offset + 42);
            std::string name(reinterpret_cast<const char*>(archive.data() + offset + 46), name_len);

            if (U32(archive, local_offset) != 0x04034b50) {
                throw std::runtime_error("Bad local header for " + name);
            }
            const size_t data_offset = local_offset + 30 +
                U16(archive, local_offset + 26) + U16(archive, local_offset + 28);
            auto data = Inflate(archive.subspan(data_offset, compressed), uncompressed);
            const uLong actual_crc = crc32(crc32(0L, Z_NULL, 0), data.data(), static_cast<uInt>(data.size()));
            if (static_cast<uint32_t>(actual_crc) != crc) {
                throw std::runtime_error("CRC mismatch for " + name);
            }
            entries.push_back(ZipEntry{std::move(name), method, dos_date, dos_time, std::move(data)});
            offset += 46 + name_len + extra_len + comment_len;
        }
        return entries;
    }

private:
    static constexpr size_t kEocdSize = 22;

    static uint16_t U16(std::span<const uint8_t> b, const size_t at) {
        if (at + 2 > b.size()) {
            throw std::runtime_error("Truncated archive");
        }
        return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
    }

    static uint32_t U32(std::span<const uint8_t> b, const size_t at) {
        if (at + 4 > b.size()) {
            throw std::runtime_error("Truncated archive");
        }
        return static_cast<uint32_t>(b[at]) | (static_cast<uint32_t>(b[at + 1]) << 8) |
               (static_cast<uint32_t>(b[at + 2]) << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
    }

    static std::vector<uint8_t> Inflate(std::span<const uint8_t> compressed, const size_t expected) {
        // zlib rejects a null output pointer even when nothing is expected
        std::vector<uint8_t> out(expected == 0 ? 1 : expected);
        z_stream stream{};
        if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
            throw std::runtime_error("inflateInit2 failed");
        }
        stream.next_in = const_cast<Bytef*>(compressed.data());
        stream.avail_in = static_cast<uInt>(compressed.size());
        stream.next_out = out.data();
        stream.avail_out = static_cast<uInt>(out.size());
        const int rc = inflate(&stream, Z_FINISH);
        const uLong produced = stream.total_out;
        inflateEnd(&stream);
        if (rc != Z_STREAM_END || produced != expected) {
            throw std::runtime_error("Inflate failed");
        }
        out.resize(expected);
        return out;
    }
};

}
