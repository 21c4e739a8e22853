#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace flib::inpx
{
    struct Date {
        int year = 0;
        int month = 0;
        int day = 0;
    };

    struct AuthorName {
        std::string last;
        std::string first;
        std::string middle;
    };

    // One parsed line of an .inp member. Optional values carry a has* flag;
    // archive locations are empty until the resolver fills them.
    struct CatalogRecord {
        std::uint64_t libId = 0;
        bool hasLibId = false;

        std::string title;
        std::vector<std::string> authors;
        std::vector<std::string> genres;
        std::string series;
        std::int64_t serNo = 0;
        bool hasSerNo = false;

        std::string fileStub;
        std::string fileExt;
        std::uint64_t size = 0;
        bool hasSize = false;

        std::string date;
        Date parsedDate;
        bool hasDate = false;

        bool deleted = false;
        std::string lang;
        std::string keywords;
        std::string folder;
        bool decodedWithFallback = false;

        // Lower-cased column name to raw value, for every column of the
        // structure line.
        std::map<std::string, std::string> fields;

        std::filesystem::path payloadArchive;
        std::filesystem::path coverArchive;
        std::filesystem::path illustrationArchive;
    };

    // "Last,First,Middle"; parts are trimmed and may be missing. A missing last
    // name takes the first name in its place.
    AuthorName SplitAuthorName(const std::string& raw);

    // Strict YYYY-MM-DD with a real calendar day.
    bool TryParseIsoDate(const std::string& text, Date& out);
}
