#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace flib::archive
{
    // Inclusive ID range claimed by one archive file.
    struct ArchiveInfo {
        std::uint64_t start = 0;
        std::uint64_t end = 0;
        std::filesystem::path location;

        bool Contains(std::uint64_t id) const { return start <= id && id <= end; }
    };

    // Where the archives live and how they are named:
    //   [<c>.]<token>-<start>-<end>.<payloadExt>   anywhere under the root
    //   [<c>.]<token>-<start>-<end>.<assetExt>     under coversDir / imagesDir
    struct ArchiveLayout {
        std::string token = "fb2";
        std::string payloadExt = "7z";
        std::string assetExt = "zip";
        std::string coversDir = "covers";
        std::string imagesDir = "images";

        static ArchiveLayout FromConfig();
    };

    // Empty path means no archive claims the ID.
    struct ResolvedArchives {
        std::filesystem::path payload;
        std::filesystem::path cover;
        std::filesystem::path illustration;
    };

    // Parses "<prefix>.<token>-<start>-<end>.<ext>" file names. The prefix is
    // optional and at most one character. Matching ignores case.
    bool TryParseArchiveRange(const std::string& fileName, const std::string& token, const std::string& ext,
        std::uint64_t& start, std::uint64_t& end);

    // Rightmost archive whose start <= id, accepted only if id <= its end.
    // The list must be sorted by start. Overlapping ranges give unspecified
    // results.
    const ArchiveInfo* FindArchive(const std::vector<ArchiveInfo>& sorted, std::uint64_t id);

    class ArchiveResolver
    {
        public:
            // Scans the root once. Throws flib::Error(NotFound) when it does not
            // exist. The indices are never modified afterwards.
            explicit ArchiveResolver(const std::filesystem::path& root, ArchiveLayout layout = ArchiveLayout());

            ResolvedArchives Resolve(std::uint64_t id) const;

            const std::filesystem::path& root() const { return m_root; }
            const std::vector<ArchiveInfo>& payloadArchives() const { return m_payloadArchives; }
            const std::vector<ArchiveInfo>& coverArchives() const { return m_coverArchives; }
            const std::vector<ArchiveInfo>& illustrationArchives() const { return m_illustrationArchives; }

        private:
            void ScanArchives();

            std::filesystem::path m_root;
            ArchiveLayout m_layout;
            std::vector<ArchiveInfo> m_payloadArchives;
            std::vector<ArchiveInfo> m_coverArchives;
            std::vector<ArchiveInfo> m_illustrationArchives;
    };
}
