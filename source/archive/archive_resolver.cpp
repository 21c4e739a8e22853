#include "archive/archive_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include "util/config.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

namespace flib::archive
{
    namespace {
        bool TryParseUnsigned(const std::string& text, std::uint64_t& out)
        {
            if (text.empty())
                return false;
            for (unsigned char c : text) {
                if (!std::isdigit(c))
                    return false;
            }
            char* end = nullptr;
            errno = 0;
            const unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
            if (errno == ERANGE || end == nullptr || *end != '\0')
                return false;
            out = static_cast<std::uint64_t>(parsed);
            return true;
        }

        void CollectArchives(const std::filesystem::path& dir, const std::string& token, const std::string& ext,
            std::vector<ArchiveInfo>& out)
        {
            std::error_code ec;
            if (!std::filesystem::is_directory(dir, ec))
                return;

            std::filesystem::recursive_directory_iterator it(dir, std::filesystem::directory_options::skip_permission_denied, ec);
            const std::filesystem::recursive_directory_iterator endIt;
            for (; !ec && it != endIt; it.increment(ec)) {
                if (!it->is_regular_file(ec))
                    continue;
                std::uint64_t start = 0;
                std::uint64_t end = 0;
                if (!TryParseArchiveRange(it->path().filename().string(), token, ext, start, end))
                    continue;
                if (start > end) {
                    LOG_DEBUG("Resolver: ignoring %s, range start after end\n", it->path().string().c_str());
                    continue;
                }
                out.push_back(ArchiveInfo{start, end, it->path()});
            }
            if (ec)
                LOG_DEBUG("Resolver: scan of %s stopped early: %s\n", dir.string().c_str(), ec.message().c_str());
        }

        void SortByStart(std::vector<ArchiveInfo>& archives)
        {
            std::sort(archives.begin(), archives.end(), [](const ArchiveInfo& a, const ArchiveInfo& b) {
                if (a.start != b.start)
                    return a.start < b.start;
                return a.location < b.location;
            });
        }
    }

    ArchiveLayout ArchiveLayout::FromConfig()
    {
        ArchiveLayout layout;
        layout.token = flib::config::archiveToken;
        layout.payloadExt = flib::config::payloadArchiveExt;
        layout.assetExt = flib::config::assetArchiveExt;
        layout.coversDir = flib::config::coversDirName;
        layout.imagesDir = flib::config::imagesDirName;
        return layout;
    }

    bool TryParseArchiveRange(const std::string& fileName, const std::string& token, const std::string& ext,
        std::uint64_t& start, std::uint64_t& end)
    {
        const std::string name = util::toLower(fileName);
        const std::string suffix = "." + util::toLower(ext);
        if (!util::endsWith(name, suffix))
            return false;
        const std::string stem = name.substr(0, name.size() - suffix.size());

        const std::string marker = util::toLower(token) + "-";
        const std::size_t tokenPos = stem.rfind(marker);
        if (tokenPos == std::string::npos)
            return false;

        // Nothing, or a single character and a dot, may precede the token.
        if (tokenPos != 0 && !(tokenPos == 2 && stem[1] == '.' && stem[0] != '.'))
            return false;

        const std::string range = stem.substr(tokenPos + marker.size());
        const std::size_t dash = range.find('-');
        if (dash == std::string::npos)
            return false;
        return TryParseUnsigned(range.substr(0, dash), start) && TryParseUnsigned(range.substr(dash + 1), end);
    }

    const ArchiveInfo* FindArchive(const std::vector<ArchiveInfo>& sorted, std::uint64_t id)
    {
        auto it = std::upper_bound(sorted.begin(), sorted.end(), id, [](std::uint64_t value, const ArchiveInfo& info) {
            return value < info.start;
        });
        if (it == sorted.begin())
            return nullptr;
        --it;
        return it->Contains(id) ? &(*it) : nullptr;
    }

    ArchiveResolver::ArchiveResolver(const std::filesystem::path& root, ArchiveLayout layout)
        : m_root(root), m_layout(std::move(layout))
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_root, ec))
            THROW_ERROR(ErrorKind::NotFound, m_root.string(), "", "library root %s does not exist", m_root.string().c_str());
        ScanArchives();
    }

    void ArchiveResolver::ScanArchives()
    {
        CollectArchives(m_root, m_layout.token, m_layout.payloadExt, m_payloadArchives);
        CollectArchives(m_root / m_layout.coversDir, m_layout.token, m_layout.assetExt, m_coverArchives);
        CollectArchives(m_root / m_layout.imagesDir, m_layout.token, m_layout.assetExt, m_illustrationArchives);

        SortByStart(m_payloadArchives);
        SortByStart(m_coverArchives);
        SortByStart(m_illustrationArchives);

        LOG_DEBUG("Resolver: %s has %zu payload, %zu cover, %zu illustration archives\n",
            m_root.string().c_str(), m_payloadArchives.size(), m_coverArchives.size(), m_illustrationArchives.size());
    }

    ResolvedArchives ArchiveResolver::Resolve(std::uint64_t id) const
    {
        ResolvedArchives resolved;
        if (const ArchiveInfo* info = FindArchive(m_payloadArchives, id))
            resolved.payload = info->location;
        if (const ArchiveInfo* info = FindArchive(m_coverArchives, id))
            resolved.cover = info->location;
        if (const ArchiveInfo* info = FindArchive(m_illustrationArchives, id))
            resolved.illustration = info->location;
        return resolved;
    }
}
