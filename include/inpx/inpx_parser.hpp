#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "inpx/catalog_record.hpp"

namespace flib::inpx
{
    // (member name, bytes processed, member total bytes)
    using ProgressCallback = std::function<void(const std::string& member, std::uint64_t processed, std::uint64_t total)>;

    extern const char* const kDefaultStructure;

    // Semicolon separated column names, empty names dropped.
    std::vector<std::string> ParseStructure(const std::string& line);

    // Maps one decoded line onto the columns and normalizes the known fields.
    // Returns false for a blank line.
    bool ParseRecordLine(const std::string& line, const std::vector<std::string>& columns, CatalogRecord& out);

    // Members of a dump that carry records, in container order.
    class DumpSource
    {
        public:
            virtual ~DumpSource() = default;

            virtual const std::vector<std::string>& recordMembers() const = 0;
            virtual std::vector<std::uint8_t> Load(const std::string& member) = 0;
    };

    // Pull-based sequence of records from one dump. Not restartable.
    class RecordStream
    {
        public:
            RecordStream(std::unique_ptr<DumpSource> source, std::vector<std::string> columns,
                std::string fallbackEncoding, std::uint64_t progressInterval, ProgressCallback progress);

            RecordStream(RecordStream&&) = default;
            RecordStream& operator=(RecordStream&&) = default;

            // Fills the next non-blank line. False once every member is consumed.
            bool Next(CatalogRecord& out);

            const std::vector<std::string>& columns() const { return m_columns; }
            std::uint64_t recordCount() const { return m_recordCount; }
            std::uint64_t fallbackDecodedCount() const { return m_fallbackDecoded; }
            std::uint64_t missingIdCount() const { return m_missingId; }

        private:
            bool LoadNextMember();
            void ReportProgress(bool force);

            std::unique_ptr<DumpSource> m_source;
            std::vector<std::string> m_columns;
            std::string m_fallbackEncoding;
            std::uint64_t m_progressInterval;
            ProgressCallback m_progress;

            std::size_t m_memberIndex = 0;
            bool m_memberOpen = false;
            std::string m_memberName;
            std::vector<std::uint8_t> m_memberData;
            std::size_t m_offset = 0;
            std::size_t m_lastReported = 0;

            std::uint64_t m_recordCount = 0;
            std::uint64_t m_fallbackDecoded = 0;
            std::uint64_t m_missingId = 0;
    };

    class InpxParser
    {
        public:
            InpxParser();
            InpxParser(std::string fallbackEncoding, std::uint64_t progressInterval);

            // Throws flib::Error: NotFound for a missing dump, MalformedContainer
            // when minizip lists nothing and the bytes hold no central directory
            // header. Headers whose entries cannot be decoded give an empty stream.
            RecordStream Parse(const std::filesystem::path& dump, ProgressCallback progress = {}) const;

        private:
            std::string m_fallbackEncoding;
            std::uint64_t m_progressInterval;
    };
}
