#include "archive/zip_recovery.hpp"

#include <algorithm>
#include <cstring>
#include <unordered_set>
#include <utility>
#include <zlib.h>
#include "util/error.hpp"

namespace flib::archive
{
    namespace {
        constexpr std::uint8_t kCentralHeaderSig[4] = {'P', 'K', 0x01, 0x02};
        constexpr std::uint8_t kLocalHeaderSig[4] = {'P', 'K', 0x03, 0x04};
        constexpr std::size_t kCentralHeaderSize = 46;
        constexpr std::size_t kLocalHeaderSize = 30;
        constexpr std::uint16_t kZip64ExtraId = 0x0001;
        constexpr std::uint32_t kZip64Marker = 0xFFFFFFFFU;
        constexpr std::uint16_t kMethodStored = 0;
        constexpr std::uint16_t kMethodDeflate = 8;
        // zlib counts in uInt; larger buffers are fed in pieces.
        constexpr std::size_t kMaxZlibChunk = 0x40000000;

        std::uint16_t ReadU16(const std::uint8_t* p)
        {
            return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
        }

        std::uint32_t ReadU32(const std::uint8_t* p)
        {
            return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
                   (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
        }

        std::uint64_t ReadU64(const std::uint8_t* p)
        {
            return static_cast<std::uint64_t>(ReadU32(p)) | (static_cast<std::uint64_t>(ReadU32(p + 4)) << 32);
        }

        std::size_t FindSignature(const std::vector<std::uint8_t>& bytes, std::size_t from, const std::uint8_t* sig)
        {
            if (bytes.size() < 4)
                return std::string::npos;
            for (std::size_t pos = from; pos + 4 <= bytes.size(); pos++) {
                const void* hit = std::memchr(bytes.data() + pos, sig[0], bytes.size() - pos);
                if (hit == nullptr)
                    return std::string::npos;
                pos = static_cast<std::size_t>(static_cast<const std::uint8_t*>(hit) - bytes.data());
                if (pos + 4 > bytes.size())
                    return std::string::npos;
                if (std::memcmp(bytes.data() + pos, sig, 4) == 0)
                    return pos;
            }
            return std::string::npos;
        }

        // Sizes and offset saturated at 0xFFFFFFFF live in the zip64 extra field,
        // in this order, and only for the saturated ones.
        void ApplyZip64Extra(const std::uint8_t* extra, std::size_t extraLen, CentralDirectoryRecord& record)
        {
            std::size_t pos = 0;
            while (pos + 4 <= extraLen) {
                const std::uint16_t id = ReadU16(extra + pos);
                const std::uint16_t len = ReadU16(extra + pos + 2);
                if (pos + 4 + len > extraLen)
                    return;
                if (id == kZip64ExtraId) {
                    const std::uint8_t* field = extra + pos + 4;
                    std::size_t used = 0;
                    if (record.uncompressedSize == kZip64Marker && used + 8 <= len) {
                        record.uncompressedSize = ReadU64(field + used);
                        used += 8;
                    }
                    if (record.compressedSize == kZip64Marker && used + 8 <= len) {
                        record.compressedSize = ReadU64(field + used);
                        used += 8;
                    }
                    if (record.localHeaderOffset == kZip64Marker && used + 8 <= len) {
                        record.localHeaderOffset = ReadU64(field + used);
                        used += 8;
                    }
                    return;
                }
                pos += 4 + len;
            }
        }

        bool HasLocalHeaderAt(const std::vector<std::uint8_t>& bytes, std::uint64_t offset)
        {
            if (offset > bytes.size() || bytes.size() - offset < kLocalHeaderSize)
                return false;
            return std::memcmp(bytes.data() + offset, kLocalHeaderSig, 4) == 0;
        }

        bool InflateRaw(const std::uint8_t* src, std::size_t srcLen, std::uint64_t expectedLen, std::vector<std::uint8_t>& out)
        {
            z_stream strm = {};
            if (inflateInit2(&strm, -MAX_WBITS) != Z_OK)
                return false;

            out.clear();
            out.reserve(static_cast<std::size_t>(expectedLen));
            std::vector<std::uint8_t> chunk(0x10000);
            strm.next_in = const_cast<Bytef*>(src);
            std::size_t pending = srcLen;

            int rc = Z_OK;
            while (rc != Z_STREAM_END) {
                if (strm.avail_in == 0 && pending > 0) {
                    strm.avail_in = static_cast<uInt>(std::min<std::size_t>(pending, kMaxZlibChunk));
                    pending -= strm.avail_in;
                }
                strm.next_out = chunk.data();
                strm.avail_out = static_cast<uInt>(chunk.size());
                rc = inflate(&strm, Z_NO_FLUSH);
                if (rc != Z_OK && rc != Z_STREAM_END) {
                    inflateEnd(&strm);
                    return false;
                }
                const std::size_t produced = chunk.size() - strm.avail_out;
                out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
                if (rc == Z_OK && produced == 0 && strm.avail_in == 0 && pending == 0) {
                    // Input exhausted without a stream end marker.
                    inflateEnd(&strm);
                    return false;
                }
            }
            inflateEnd(&strm);
            return true;
        }

        std::uint32_t Crc32Of(const std::uint8_t* data, std::size_t size)
        {
            uLong crc = crc32(0L, Z_NULL, 0);
            while (size > 0) {
                const uInt n = static_cast<uInt>(std::min<std::size_t>(size, kMaxZlibChunk));
                crc = crc32(crc, data, n);
                data += n;
                size -= n;
            }
            return static_cast<std::uint32_t>(crc);
        }
    }

    std::vector<CentralDirectoryRecord> ScanCentralDirectory(const std::vector<std::uint8_t>& bytes, std::size_t& signaturesSeen)
    {
        std::vector<CentralDirectoryRecord> records;
        signaturesSeen = 0;

        std::size_t offset = 0;
        while (offset < bytes.size()) {
            const std::size_t pos = FindSignature(bytes, offset, kCentralHeaderSig);
            if (pos == std::string::npos)
                break;
            signaturesSeen++;
            if (pos + kCentralHeaderSize > bytes.size())
                break;

            const std::uint8_t* h = bytes.data() + pos;
            CentralDirectoryRecord record;
            record.headerOffset = pos;
            record.flags = ReadU16(h + 8);
            record.method = ReadU16(h + 10);
            record.crc32 = ReadU32(h + 16);
            record.compressedSize = ReadU32(h + 20);
            record.uncompressedSize = ReadU32(h + 24);
            const std::uint16_t nameLen = ReadU16(h + 28);
            const std::uint16_t extraLen = ReadU16(h + 30);
            const std::uint16_t commentLen = ReadU16(h + 32);
            record.localHeaderOffset = ReadU32(h + 42);

            const std::size_t nameStart = pos + kCentralHeaderSize;
            if (nameStart + nameLen > bytes.size()) {
                offset = pos + 4;
                continue;
            }
            record.name.assign(reinterpret_cast<const char*>(bytes.data() + nameStart), nameLen);

            const std::size_t extraStart = nameStart + nameLen;
            if (extraStart + extraLen <= bytes.size())
                ApplyZip64Extra(bytes.data() + extraStart, extraLen, record);

            // A signature that happens to sit inside compressed data will not
            // point back at a local header; step over just the signature then.
            if (!HasLocalHeaderAt(bytes, record.localHeaderOffset)) {
                offset = pos + 4;
                continue;
            }

            records.push_back(std::move(record));
            const std::size_t next = extraStart + extraLen + commentLen;
            offset = next <= bytes.size() ? next : bytes.size();
        }
        return records;
    }

    bool TryExtractEntry(const std::vector<std::uint8_t>& bytes, const CentralDirectoryRecord& record, std::vector<std::uint8_t>& out)
    {
        out.clear();
        if (!HasLocalHeaderAt(bytes, record.localHeaderOffset))
            return false;

        const std::uint8_t* lh = bytes.data() + record.localHeaderOffset;
        const std::uint16_t nameLen = ReadU16(lh + 26);
        const std::uint16_t extraLen = ReadU16(lh + 28);
        const std::uint64_t dataStart = record.localHeaderOffset + kLocalHeaderSize + nameLen + extraLen;
        if (dataStart > bytes.size() || record.compressedSize > bytes.size() - dataStart) {
            LOG_DEBUG("Recovery: %s data runs past end of buffer\n", record.name.c_str());
            return false;
        }

        const std::uint8_t* src = bytes.data() + dataStart;
        if (record.method == kMethodStored) {
            const std::uint64_t len = std::min(record.compressedSize, record.uncompressedSize);
            out.assign(src, src + len);
        } else if (record.method == kMethodDeflate) {
            if (!InflateRaw(src, static_cast<std::size_t>(record.compressedSize), record.uncompressedSize, out)) {
                LOG_DEBUG("Recovery: inflate failed for %s\n", record.name.c_str());
                out.clear();
                return false;
            }
        } else {
            LOG_DEBUG("Recovery: skipping %s, compression method %u not supported\n", record.name.c_str(), record.method);
            return false;
        }

        const std::uint32_t crc = Crc32Of(out.data(), out.size());
        if (crc != record.crc32)
            LOG_DEBUG("Recovery: crc mismatch for %s (expected %08x, got %08x)\n", record.name.c_str(), record.crc32, crc);
        return true;
    }

    std::vector<ContainerEntry> RecoverEntries(const std::vector<std::uint8_t>& bytes, const std::string& sourcePath)
    {
        std::size_t signaturesSeen = 0;
        const std::vector<CentralDirectoryRecord> records = ScanCentralDirectory(bytes, signaturesSeen);
        if (signaturesSeen == 0)
            THROW_ERROR(ErrorKind::MalformedContainer, sourcePath, "", "no central directory found in %s", sourcePath.c_str());

        std::vector<ContainerEntry> entries;
        std::unordered_set<std::string> seen;
        for (const auto& record : records) {
            if (record.name.empty() || record.name.back() == '/')
                continue;
            if (!seen.insert(record.name).second) {
                LOG_DEBUG("Recovery: duplicate entry %s ignored\n", record.name.c_str());
                continue;
            }
            ContainerEntry entry;
            entry.name = record.name;
            if (!TryExtractEntry(bytes, record, entry.data))
                continue;
            entries.push_back(std::move(entry));
        }

        LOG_DEBUG("Recovery: %zu central directory headers, %zu entries recovered from %s\n",
            records.size(), entries.size(), sourcePath.c_str());
        return entries;
    }
}
