#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace flib::archive
{
    struct MemberInfo {
        std::string name;
        std::uint64_t size = 0;
        bool isDirectory = false;
    };

    // Readable bytes of a single archive member. Whatever the stream holds on
    // to (archive handles, buffers) is released by its destructor.
    class MemberStream
    {
        public:
            virtual ~MemberStream() = default;

            MemberStream(const MemberStream&) = delete;
            MemberStream& operator=(const MemberStream&) = delete;

            // Name of the member actually opened; differs from the requested one
            // when a ZIP fell back to its first entry.
            const std::string& name() const { return m_name; }
            std::uint64_t size() const { return m_size; }

            // Returns 0 at end of member.
            virtual std::size_t Read(void* buffer, std::size_t length) = 0;
            std::vector<std::uint8_t> ReadAll();

        protected:
            MemberStream(std::string name, std::uint64_t size);

        private:
            std::string m_name;
            std::uint64_t m_size;
    };

    // Deflate/stored container, read through minizip.
    class ZipArchive
    {
        public:
            explicit ZipArchive(std::filesystem::path path);

            const std::filesystem::path& path() const { return m_path; }

            // False when minizip cannot open the file as a ZIP.
            bool TryListMembers(std::vector<MemberInfo>& out) const;
            std::vector<MemberInfo> ListMembers() const;

            // Exact name first, then the first non-directory entry.
            std::unique_ptr<MemberStream> OpenMember(const std::string& member) const;

        private:
            std::filesystem::path m_path;
    };

    // Solid-block 7z container, read through libarchive. Members are extracted
    // one at a time into a scratch directory that is gone before OpenMember
    // returns.
    class SevenZipArchive
    {
        public:
            explicit SevenZipArchive(std::filesystem::path path);

            const std::filesystem::path& path() const { return m_path; }

            std::vector<MemberInfo> ListMembers() const;
            std::unique_ptr<MemberStream> OpenMember(const std::string& member) const;

        private:
            std::filesystem::path m_path;
    };

    using ArchiveHandle = std::variant<ZipArchive, SevenZipArchive>;

    // Picks the container kind from the file extension. Throws NotFound when the
    // file is missing and UnsupportedFormat for any other extension.
    ArchiveHandle OpenArchive(const std::filesystem::path& path);

    std::vector<MemberInfo> ListMembers(const ArchiveHandle& archive);
    std::unique_ptr<MemberStream> OpenMember(const ArchiveHandle& archive, const std::string& member);
    std::unique_ptr<MemberStream> OpenMember(const std::filesystem::path& archivePath, const std::string& member);
}
