#pragma once
#include "pkexport/core/result.hpp"
#include "pkexport/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace pkexport::archive {

/**
 * In-memory ZIP (PKZIP 2.0) serializer.
 *
 * Every entry is raw DEFLATE with its CRC-32 and sizes in the local header,
 * so no data descriptors are written. Timestamps are fixed at the DOS epoch
 * (1980-01-01 00:00) so the same inputs always give the same bytes. ZIP64 is
 * not supported; entries and the archive must stay below 4 GiB.
 */
class ZipWriter {
public:
    static constexpr uint32_t LOCAL_HEADER_SIGNATURE = 0x04034b50;
    static constexpr uint32_t CENTRAL_HEADER_SIGNATURE = 0x02014b50;
    static constexpr uint32_t END_OF_CENTRAL_DIRECTORY_SIGNATURE = 0x06054b50;
    static constexpr uint16_t VERSION_NEEDED = 20;
    static constexpr uint16_t METHOD_DEFLATE = 8;
    static constexpr uint16_t DOS_EPOCH_DATE = (0 << 9) | (1 << 5) | 1;

    [[nodiscard]] Result<Unit, ExportFailure> AddEntry(
        std::string_view name,
        std::span<const uint8_t> data);

    /**
     * Appends the central directory and end record, and releases the bytes.
     * The writer is empty afterwards.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, ExportFailure> Finish();

    [[nodiscard]] const std::vector<std::string>& EntryNames() const noexcept { return names_; }

private:
    struct CentralRecord {
        std::string name;
        uint32_t crc;
        uint32_t compressed_size;
        uint32_t uncompressed_size;
        uint32_t local_header_offset;
    };

    [[nodiscard]] static Result<std::vector<uint8_t>, ExportFailure> Deflate(
        std::span<const uint8_t> data);

    std::vector<uint8_t> buffer_;
    std::vector<CentralRecord> records_;
    std::vector<std::string> names_;
};
}
