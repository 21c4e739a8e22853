#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace flib::archive
{
    struct ContainerEntry {
        std::string name;
        std::vector<std::uint8_t> data;
    };

    // One central-directory file header as found in the raw bytes.
    struct CentralDirectoryRecord {
        std::uint64_t headerOffset = 0;
        std::uint16_t flags = 0;
        std::uint16_t method = 0;
        std::uint32_t crc32 = 0;
        std::uint64_t compressedSize = 0;
        std::uint64_t uncompressedSize = 0;
        std::uint64_t localHeaderOffset = 0;
        std::string name;
    };

    // Pass one: every central-directory header whose local header offset points
    // at a local file header signature. Does not need the end-of-directory
    // record. Records are returned in file order.
    std::vector<CentralDirectoryRecord> ScanCentralDirectory(const std::vector<std::uint8_t>& bytes, std::size_t& signaturesSeen);

    // Pass two for a single record: follows the local header and decodes the
    // member (stored or deflate). Returns false when the entry must be skipped.
    bool TryExtractEntry(const std::vector<std::uint8_t>& bytes, const CentralDirectoryRecord& record, std::vector<std::uint8_t>& out);

    // Both passes. Throws flib::Error(MalformedContainer) when the bytes hold no
    // central-directory signature at all; entries that cannot be decoded are
    // left out.
    std::vector<ContainerEntry> RecoverEntries(const std::vector<std::uint8_t>& bytes, const std::string& sourcePath);
}
