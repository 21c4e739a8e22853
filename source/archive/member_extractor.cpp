#include "archive/member_extractor.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <utility>
#include <archive.h>
#include <archive_entry.h>
#include <minizip/unzip.h>
#include "util/error.hpp"
#include "util/util.hpp"

namespace flib::archive
{
    namespace {
        constexpr std::size_t kCopyBufferSize = 0x8000;

        struct UnzCloser {
            void operator()(void* handle) const
            {
                if (handle)
                    unzClose(handle);
            }
        };
        using UnzHandle = std::unique_ptr<void, UnzCloser>;

        struct ArchiveReadCloser {
            void operator()(struct archive* a) const
            {
                if (a)
                    archive_read_free(a);
            }
        };
        using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadCloser>;

        class ZipMemberStream : public MemberStream
        {
            public:
                ZipMemberStream(UnzHandle handle, std::string name, std::uint64_t size, std::string archivePath)
                    : MemberStream(std::move(name), size), m_handle(std::move(handle)), m_archivePath(std::move(archivePath))
                {
                }

                ~ZipMemberStream() override
                {
                    if (m_open)
                        unzCloseCurrentFile(m_handle.get());
                }

                std::size_t Read(void* buffer, std::size_t length) override
                {
                    if (length == 0 || !m_open)
                        return 0;
                    const unsigned int chunk = static_cast<unsigned int>(std::min<std::size_t>(length, 0x7FFFFFFF));
                    const int read = unzReadCurrentFile(m_handle.get(), buffer, chunk);
                    if (read < 0)
                        THROW_FORMAT("read error %d in %s member %s", read, m_archivePath.c_str(), name().c_str());
                    if (read == 0)
                        Finish();
                    return static_cast<std::size_t>(read);
                }

            private:
                // The CRC of a member is only checked when it is closed at end of data.
                void Finish()
                {
                    m_open = false;
                    const int rc = unzCloseCurrentFile(m_handle.get());
                    if (rc == UNZ_CRCERROR)
                        THROW_ERROR(ErrorKind::UnsupportedFormat, m_archivePath, name(), "crc mismatch for %s in %s",
                            name().c_str(), m_archivePath.c_str());
                    if (rc != UNZ_OK)
                        THROW_ERROR(ErrorKind::UnsupportedFormat, m_archivePath, name(), "close error %d for %s in %s",
                            rc, name().c_str(), m_archivePath.c_str());
                }

                UnzHandle m_handle;
                std::string m_archivePath;
                bool m_open = true;
        };

        class BufferedMemberStream : public MemberStream
        {
            public:
                BufferedMemberStream(std::string name, std::vector<std::uint8_t> data)
                    : MemberStream(std::move(name), data.size()), m_data(std::move(data))
                {
                }

                std::size_t Read(void* buffer, std::size_t length) override
                {
                    const std::size_t available = m_data.size() - m_pos;
                    const std::size_t n = std::min(length, available);
                    if (n > 0) {
                        std::memcpy(buffer, m_data.data() + m_pos, n);
                        m_pos += n;
                    }
                    return n;
                }

            private:
                std::vector<std::uint8_t> m_data;
                std::size_t m_pos = 0;
        };

        bool ReadCurrentZipInfo(unzFile unz, MemberInfo& out)
        {
            unz_file_info64 info = {};
            if (unzGetCurrentFileInfo64(unz, &info, nullptr, 0, nullptr, 0, nullptr, 0) != UNZ_OK)
                return false;

            std::string name;
            if (info.size_filename > 0) {
                std::vector<char> nameBuf(static_cast<std::size_t>(info.size_filename) + 1, '\0');
                if (unzGetCurrentFileInfo64(unz, &info, nameBuf.data(), static_cast<uLong>(nameBuf.size()), nullptr, 0, nullptr, 0) != UNZ_OK)
                    return false;
                name.assign(nameBuf.data());
            }
            std::replace(name.begin(), name.end(), '\\', '/');

            out.name = std::move(name);
            out.size = info.uncompressed_size;
            out.isDirectory = !out.name.empty() && out.name.back() == '/';
            return true;
        }

        ArchiveReader OpenSevenZipReader(const std::filesystem::path& path)
        {
            ArchiveReader reader(archive_read_new());
            if (!reader)
                THROW_FORMAT("archive_read_new failed");
            if (archive_read_support_format_7zip(reader.get()) != ARCHIVE_OK) {
                THROW_ERROR(ErrorKind::UnsupportedFormat, path.string(), "",
                    "7z support unavailable in libarchive: %s", archive_error_string(reader.get()));
            }
            if (archive_read_open_filename(reader.get(), path.string().c_str(), 10240) != ARCHIVE_OK) {
                const char* reason = archive_error_string(reader.get());
                THROW_ERROR(ErrorKind::UnsupportedFormat, path.string(), "",
                    "cannot read %s as 7z: %s", path.string().c_str(), reason ? reason : "unknown error");
            }
            return reader;
        }

        bool CopyEntryToFile(struct archive* a, const std::filesystem::path& target, std::string& error)
        {
            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                error = "cannot create " + target.string();
                return false;
            }

            const void* block = nullptr;
            std::size_t blockSize = 0;
            la_int64_t offset = 0;
            while (true) {
                const int rc = archive_read_data_block(a, &block, &blockSize, &offset);
                if (rc == ARCHIVE_EOF)
                    break;
                if (rc != ARCHIVE_OK) {
                    const char* reason = archive_error_string(a);
                    error = reason ? reason : "archive_read_data_block failed";
                    return false;
                }
                out.seekp(static_cast<std::streamoff>(offset));
                out.write(static_cast<const char*>(block), static_cast<std::streamsize>(blockSize));
                if (!out.good()) {
                    error = "write failed for " + target.string();
                    return false;
                }
            }
            out.flush();
            return out.good();
        }
    }

    MemberStream::MemberStream(std::string name, std::uint64_t size) : m_name(std::move(name)), m_size(size)
    {
    }

    std::vector<std::uint8_t> MemberStream::ReadAll()
    {
        std::vector<std::uint8_t> out;
        out.reserve(static_cast<std::size_t>(m_size));
        std::vector<std::uint8_t> buffer(kCopyBufferSize);
        while (true) {
            const std::size_t n = Read(buffer.data(), buffer.size());
            if (n == 0)
                break;
            out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
        }
        return out;
    }

    ZipArchive::ZipArchive(std::filesystem::path path) : m_path(std::move(path))
    {
    }

    bool ZipArchive::TryListMembers(std::vector<MemberInfo>& out) const
    {
        out.clear();
        UnzHandle unz(unzOpen64(m_path.string().c_str()));
        if (!unz)
            return false;

        int code = unzGoToFirstFile(unz.get());
        while (code == UNZ_OK) {
            MemberInfo info;
            if (!ReadCurrentZipInfo(unz.get(), info))
                return false;
            out.push_back(std::move(info));
            code = unzGoToNextFile(unz.get());
        }
        return code == UNZ_END_OF_LIST_OF_FILE;
    }

    std::vector<MemberInfo> ZipArchive::ListMembers() const
    {
        std::vector<MemberInfo> members;
        if (!TryListMembers(members))
            THROW_ERROR(ErrorKind::UnsupportedFormat, m_path.string(), "", "cannot read %s as zip", m_path.string().c_str());
        return members;
    }

    std::unique_ptr<MemberStream> ZipArchive::OpenMember(const std::string& member) const
    {
        const std::string pathText = m_path.string();
        UnzHandle unz(unzOpen64(pathText.c_str()));
        if (!unz)
            THROW_ERROR(ErrorKind::UnsupportedFormat, pathText, member, "cannot read %s as zip", pathText.c_str());

        // Remember the first regular entry while looking for the exact name.
        bool haveFallback = false;
        unz64_file_pos fallbackPos = {};
        MemberInfo fallbackInfo;
        bool found = false;
        MemberInfo chosen;

        int code = unzGoToFirstFile(unz.get());
        while (code == UNZ_OK) {
            MemberInfo info;
            if (!ReadCurrentZipInfo(unz.get(), info))
                THROW_ERROR(ErrorKind::UnsupportedFormat, pathText, member, "corrupt directory entry in %s", pathText.c_str());
            if (!info.isDirectory) {
                if (info.name == member) {
                    found = true;
                    chosen = std::move(info);
                    break;
                }
                if (!haveFallback && unzGetFilePos64(unz.get(), &fallbackPos) == UNZ_OK) {
                    haveFallback = true;
                    fallbackInfo = info;
                }
            }
            code = unzGoToNextFile(unz.get());
        }

        if (!found) {
            if (!haveFallback)
                THROW_ERROR(ErrorKind::NotFound, pathText, member, "%s not found in %s", member.c_str(), pathText.c_str());
            if (unzGoToFilePos64(unz.get(), &fallbackPos) != UNZ_OK)
                THROW_ERROR(ErrorKind::UnsupportedFormat, pathText, member, "cannot seek in %s", pathText.c_str());
            LOG_DEBUG("Zip: %s not in %s, using %s\n", member.c_str(), pathText.c_str(), fallbackInfo.name.c_str());
            chosen = std::move(fallbackInfo);
        }

        if (unzOpenCurrentFile(unz.get()) != UNZ_OK)
            THROW_ERROR(ErrorKind::UnsupportedFormat, pathText, chosen.name, "cannot decode %s in %s", chosen.name.c_str(), pathText.c_str());

        return std::make_unique<ZipMemberStream>(std::move(unz), chosen.name, chosen.size, pathText);
    }

    SevenZipArchive::SevenZipArchive(std::filesystem::path path) : m_path(std::move(path))
    {
    }

    std::vector<MemberInfo> SevenZipArchive::ListMembers() const
    {
        ArchiveReader reader = OpenSevenZipReader(m_path);
        std::vector<MemberInfo> members;
        struct archive_entry* entry = nullptr;
        int rc = ARCHIVE_OK;
        while ((rc = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
            MemberInfo info;
            const char* name = archive_entry_pathname(entry);
            info.name = name ? name : "";
            info.size = archive_entry_size_is_set(entry) ? static_cast<std::uint64_t>(archive_entry_size(entry)) : 0;
            info.isDirectory = archive_entry_filetype(entry) == AE_IFDIR || (!info.name.empty() && info.name.back() == '/');
            members.push_back(std::move(info));
            if (archive_read_data_skip(reader.get()) != ARCHIVE_OK) {
                rc = ARCHIVE_FATAL;
                break;
            }
        }
        if (rc != ARCHIVE_EOF) {
            const char* reason = archive_error_string(reader.get());
            THROW_ERROR(ErrorKind::UnsupportedFormat, m_path.string(), "",
                "failed listing %s: %s", m_path.string().c_str(), reason ? reason : "unknown error");
        }
        return members;
    }

    std::unique_ptr<MemberStream> SevenZipArchive::OpenMember(const std::string& member) const
    {
        const std::string pathText = m_path.string();
        ArchiveReader reader = OpenSevenZipReader(m_path);

        struct archive_entry* entry = nullptr;
        int rc = ARCHIVE_OK;
        while ((rc = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
            const char* name = archive_entry_pathname(entry);
            if (name == nullptr || member != name || archive_entry_filetype(entry) == AE_IFDIR) {
                if (archive_read_data_skip(reader.get()) != ARCHIVE_OK) {
                    rc = ARCHIVE_FATAL;
                    break;
                }
                continue;
            }

            std::vector<std::uint8_t> data;
            {
                util::ScratchDirectory scratch("flibook-7z");
                const std::filesystem::path target = scratch.path() / "member.bin";
                std::string error;
                if (!CopyEntryToFile(reader.get(), target, error))
                    THROW_ERROR(ErrorKind::UnsupportedFormat, pathText, member, "cannot extract %s from %s: %s",
                        member.c_str(), pathText.c_str(), error.c_str());
                if (!util::readFileBytes(target, data))
                    THROW_FORMAT("cannot read extracted %s", target.string().c_str());
            }
            return std::make_unique<BufferedMemberStream>(member, std::move(data));
        }

        if (rc != ARCHIVE_EOF) {
            const char* reason = archive_error_string(reader.get());
            THROW_ERROR(ErrorKind::UnsupportedFormat, pathText, member,
                "failed reading %s: %s", pathText.c_str(), reason ? reason : "unknown error");
        }
        THROW_ERROR(ErrorKind::NotFound, pathText, member, "%s not found in %s", member.c_str(), pathText.c_str());
    }

    ArchiveHandle OpenArchive(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            THROW_ERROR(ErrorKind::NotFound, path.string(), "", "archive %s does not exist", path.string().c_str());

        const std::string ext = util::toLower(path.extension().string());
        if (ext == ".zip")
            return ZipArchive(path);
        if (ext == ".7z")
            return SevenZipArchive(path);
        THROW_ERROR(ErrorKind::UnsupportedFormat, path.string(), "", "unknown archive type: %s", path.string().c_str());
    }

    std::vector<MemberInfo> ListMembers(const ArchiveHandle& archive)
    {
        return std::visit([](const auto& a) { return a.ListMembers(); }, archive);
    }

    std::unique_ptr<MemberStream> OpenMember(const ArchiveHandle& archive, const std::string& member)
    {
        return std::visit([&member](const auto& a) { return a.OpenMember(member); }, archive);
    }

    std::unique_ptr<MemberStream> OpenMember(const std::filesystem::path& archivePath, const std::string& member)
    {
        return OpenMember(OpenArchive(archivePath), member);
    }
}
