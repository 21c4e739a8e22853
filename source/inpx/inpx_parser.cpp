#include "inpx/inpx_parser.hpp"

#include <cstring>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include "archive/member_extractor.hpp"
#include "archive/zip_recovery.hpp"
#include "util/config.hpp"
#include "util/encoding.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

namespace flib::inpx
{
    const char* const kDefaultStructure = "AUTHOR;GENRE;TITLE;SERIES;SERNO;FILE;SIZE;LIBID;DEL;EXT;DATE;LANG;KEYWORDS;FOLDER;";

    namespace {
        const char kFieldSeparator = '\x04';
        const std::string kStructureMember = "structure.info";
        const std::string kRecordExtension = ".inp";

        bool IsRecordMember(const std::string& name)
        {
            return util::endsWith(util::toLower(name), kRecordExtension);
        }

        bool IsStructureMember(const std::string& name)
        {
            return util::ignoreCaseCompare(name, kStructureMember);
        }

        // Container that minizip opens normally. Members are decompressed one at
        // a time as the stream reaches them.
        class ZipDumpSource : public DumpSource
        {
            public:
                ZipDumpSource(archive::ZipArchive zip, std::vector<std::string> members)
                    : m_zip(std::move(zip)), m_members(std::move(members)) {}

                const std::vector<std::string>& recordMembers() const override { return m_members; }

                std::vector<std::uint8_t> Load(const std::string& member) override
                {
                    return m_zip.OpenMember(member)->ReadAll();
                }

            private:
                archive::ZipArchive m_zip;
                std::vector<std::string> m_members;
        };

        // Entries recovered from the raw bytes. Each entry's data is handed out
        // once.
        class RecoveredDumpSource : public DumpSource
        {
            public:
                explicit RecoveredDumpSource(std::vector<archive::ContainerEntry> entries)
                    : m_entries(std::move(entries))
                {
                    for (std::size_t i = 0; i < m_entries.size(); i++) {
                        if (IsRecordMember(m_entries[i].name))
                            m_members.push_back(m_entries[i].name);
                        m_index.emplace(m_entries[i].name, i);
                    }
                }

                const std::vector<std::string>& recordMembers() const override { return m_members; }

                std::vector<std::uint8_t> Load(const std::string& member) override
                {
                    auto it = m_index.find(member);
                    if (it == m_index.end())
                        return {};
                    return std::move(m_entries[it->second].data);
                }

            private:
                std::vector<archive::ContainerEntry> m_entries;
                std::vector<std::string> m_members;
                std::unordered_map<std::string, std::size_t> m_index;
        };

        std::vector<std::string> ColumnsFromBytes(const std::vector<std::uint8_t>& raw, const std::string& fallbackEncoding)
        {
            bool usedFallback = false;
            const std::string text = util::decodeText(reinterpret_cast<const char*>(raw.data()), raw.size(), fallbackEncoding, usedFallback);
            std::vector<std::string> columns = ParseStructure(util::trim(text));
            if (columns.empty()) {
                LOG_DEBUG("Parser: structure.info is empty, using the default columns\n");
                return ParseStructure(kDefaultStructure);
            }
            return columns;
        }

        bool TryParseUnsigned(const std::string& text, std::uint64_t& out)
        {
            std::int64_t value = 0;
            if (!util::tryParseInt64(text, value) || value < 0)
                return false;
            out = static_cast<std::uint64_t>(value);
            return true;
        }

        const std::string& FieldOrEmpty(const std::map<std::string, std::string>& fields, const std::string& key)
        {
            static const std::string kEmpty;
            auto it = fields.find(key);
            return it == fields.end() ? kEmpty : it->second;
        }
    }

    std::vector<std::string> ParseStructure(const std::string& line)
    {
        std::vector<std::string> columns;
        for (const auto& part : util::splitString(line, ';', true)) {
            std::string name = util::trim(part);
            if (!name.empty())
                columns.push_back(std::move(name));
        }
        return columns;
    }

    bool ParseRecordLine(const std::string& line, const std::vector<std::string>& columns, CatalogRecord& out)
    {
        if (line.empty())
            return false;

        out = CatalogRecord();
        const std::vector<std::string> values = util::splitString(line, kFieldSeparator, false);
        for (std::size_t i = 0; i < columns.size(); i++)
            out.fields[util::toLower(columns[i])] = i < values.size() ? values[i] : std::string();

        const auto& fields = out.fields;
        out.authors = util::splitString(FieldOrEmpty(fields, "author"), ':', true);
        out.genres = util::splitString(FieldOrEmpty(fields, "genre"), ':', true);
        out.title = FieldOrEmpty(fields, "title");
        out.series = FieldOrEmpty(fields, "series");
        out.fileStub = FieldOrEmpty(fields, "file");
        out.fileExt = FieldOrEmpty(fields, "ext");
        out.lang = FieldOrEmpty(fields, "lang");
        out.keywords = FieldOrEmpty(fields, "keywords");
        out.folder = FieldOrEmpty(fields, "folder");
        out.deleted = util::trim(FieldOrEmpty(fields, "del")) == "1";

        out.hasSerNo = util::tryParseInt64(FieldOrEmpty(fields, "serno"), out.serNo);
        out.hasSize = TryParseUnsigned(FieldOrEmpty(fields, "size"), out.size);
        out.hasLibId = TryParseUnsigned(FieldOrEmpty(fields, "libid"), out.libId);

        out.date = util::trim(FieldOrEmpty(fields, "date"));
        out.hasDate = !out.date.empty() && TryParseIsoDate(out.date, out.parsedDate);
        return true;
    }

    RecordStream::RecordStream(std::unique_ptr<DumpSource> source, std::vector<std::string> columns,
        std::string fallbackEncoding, std::uint64_t progressInterval, ProgressCallback progress)
        : m_source(std::move(source)), m_columns(std::move(columns)), m_fallbackEncoding(std::move(fallbackEncoding)),
          m_progressInterval(progressInterval), m_progress(std::move(progress))
    {
    }

    bool RecordStream::LoadNextMember()
    {
        const auto& members = m_source->recordMembers();
        if (m_memberIndex >= members.size())
            return false;

        m_memberName = members[m_memberIndex++];
        m_memberData = m_source->Load(m_memberName);
        m_offset = 0;
        m_lastReported = 0;
        m_memberOpen = true;
        LOG_DEBUG("Parser: reading %s (%zu bytes)\n", m_memberName.c_str(), m_memberData.size());
        return true;
    }

    void RecordStream::ReportProgress(bool force)
    {
        m_lastReported = m_offset;
        if (!m_progress)
            return;
        const std::uint64_t total = m_memberData.size();
        m_progress(m_memberName, force ? total : static_cast<std::uint64_t>(m_offset), total);
    }

    bool RecordStream::Next(CatalogRecord& out)
    {
        while (true) {
            if (!m_memberOpen && !LoadNextMember())
                return false;

            const std::size_t size = m_memberData.size();
            if (m_offset >= size) {
                ReportProgress(true);
                m_memberOpen = false;
                std::vector<std::uint8_t>().swap(m_memberData);
                continue;
            }

            const std::uint8_t* base = m_memberData.data();
            const std::size_t lineStart = m_offset;
            const void* newline = std::memchr(base + lineStart, '\n', size - lineStart);
            const std::size_t lineEnd = newline ? static_cast<std::size_t>(static_cast<const std::uint8_t*>(newline) - base) : size;
            m_offset = newline ? lineEnd + 1 : size;

            std::size_t length = lineEnd - lineStart;
            if (length > 0 && base[lineStart + length - 1] == '\r')
                length--;

            if (m_progressInterval > 0 && m_offset - m_lastReported >= m_progressInterval)
                ReportProgress(false);

            if (length == 0)
                continue;

            bool usedFallback = false;
            const std::string line = util::decodeText(reinterpret_cast<const char*>(base + lineStart), length,
                m_fallbackEncoding, usedFallback);
            if (!ParseRecordLine(line, m_columns, out))
                continue;

            out.decodedWithFallback = usedFallback;
            if (usedFallback) {
                m_fallbackDecoded++;
                LOG_DEBUG("Parser: %s line at offset %zu decoded as %s\n", m_memberName.c_str(), lineStart, m_fallbackEncoding.c_str());
            }
            if (!out.hasLibId)
                m_missingId++;
            m_recordCount++;
            return true;
        }
    }

    InpxParser::InpxParser() : InpxParser(config::fallbackEncoding, config::progressIntervalBytes)
    {
    }

    InpxParser::InpxParser(std::string fallbackEncoding, std::uint64_t progressInterval)
        : m_fallbackEncoding(std::move(fallbackEncoding)), m_progressInterval(progressInterval)
    {
    }

    RecordStream InpxParser::Parse(const std::filesystem::path& dump, ProgressCallback progress) const
    {
        const std::string pathText = dump.string();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(dump, ec))
            THROW_ERROR(ErrorKind::NotFound, pathText, "", "dump %s does not exist", pathText.c_str());

        std::unique_ptr<DumpSource> source;
        std::vector<std::string> columns;

        archive::ZipArchive zip(dump);
        std::vector<archive::MemberInfo> listing;
        if (zip.TryListMembers(listing) && !listing.empty()) {
            std::vector<std::string> members;
            std::unordered_set<std::string> seen;
            std::string structureName;
            for (const auto& info : listing) {
                if (info.isDirectory)
                    continue;
                if (IsStructureMember(info.name) && structureName.empty()) {
                    structureName = info.name;
                } else if (IsRecordMember(info.name)) {
                    if (seen.insert(info.name).second)
                        members.push_back(info.name);
                    else
                        LOG_DEBUG("Parser: duplicate member %s in %s ignored\n", info.name.c_str(), pathText.c_str());
                }
            }
            if (!structureName.empty())
                columns = ColumnsFromBytes(zip.OpenMember(structureName)->ReadAll(), m_fallbackEncoding);
            LOG_DEBUG("Parser: %s opened as zip, %zu record members\n", pathText.c_str(), members.size());
            source = std::make_unique<ZipDumpSource>(std::move(zip), std::move(members));
        } else {
            LOG_DEBUG("Parser: %s has no usable directory end, scanning central directory\n", pathText.c_str());
            std::vector<std::uint8_t> bytes;
            if (!util::readFileBytes(dump, bytes))
                THROW_ERROR(ErrorKind::NotFound, pathText, "", "cannot read dump %s", pathText.c_str());

            std::vector<archive::ContainerEntry> entries = archive::RecoverEntries(bytes, pathText);
            for (auto& entry : entries) {
                if (IsStructureMember(entry.name)) {
                    columns = ColumnsFromBytes(entry.data, m_fallbackEncoding);
                    break;
                }
            }
            auto recovered = std::make_unique<RecoveredDumpSource>(std::move(entries));
            LOG_DEBUG("Parser: recovered %zu record members from %s\n", recovered->recordMembers().size(), pathText.c_str());
            source = std::move(recovered);
        }

        if (columns.empty())
            columns = ParseStructure(kDefaultStructure);

        return RecordStream(std::move(source), std::move(columns), m_fallbackEncoding, m_progressInterval, std::move(progress));
    }
}
