#include <doctest/doctest.h>

#include <tuple>
#include "inpx/inpx_parser.hpp"
#include "test_helpers.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

using namespace flib;
using flib_test::InpLine;

namespace {
    std::vector<inpx::CatalogRecord> ReadAll(inpx::RecordStream& stream)
    {
        std::vector<inpx::CatalogRecord> records;
        inpx::CatalogRecord record;
        while (stream.Next(record))
            records.push_back(record);
        return records;
    }

    std::string SampleLine()
    {
        return InpLine({"Doe,John,:", "sf:", "Sample Book", "Sample Series", "1", "1234", "1234", "1234", "", "fb2",
            "2020-01-01", "en", "", "fb2-1000-2000.7z"});
    }
}

TEST_CASE("the sample record with the default columns") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const auto dump = dir.path() / "library.inpx";
    flib_test::WriteZip(dump, {{"fb2-1000-2000.inp", SampleLine() + "\n"}});

    inpx::RecordStream stream = inpx::InpxParser("CP1251", 500000).Parse(dump);
    const auto records = ReadAll(stream);
    REQUIRE(records.size() == 1);

    const auto& r = records[0];
    CHECK(r.authors == std::vector<std::string>{"Doe,John,"});
    CHECK(r.genres == std::vector<std::string>{"sf"});
    CHECK(r.title == "Sample Book");
    CHECK(r.series == "Sample Series");
    REQUIRE(r.hasSerNo);
    CHECK(r.serNo == 1);
    REQUIRE(r.hasLibId);
    CHECK(r.libId == 1234);
    REQUIRE(r.hasSize);
    CHECK(r.size == 1234);
    CHECK(r.fileStub == "1234");
    CHECK(r.fileExt == "fb2");
    CHECK(r.date == "2020-01-01");
    REQUIRE(r.hasDate);
    CHECK(r.parsedDate.year == 2020);
    CHECK(r.parsedDate.month == 1);
    CHECK(r.parsedDate.day == 1);
    CHECK(r.lang == "en");
    CHECK(r.folder == "fb2-1000-2000.7z");
    CHECK_FALSE(r.deleted);
    CHECK_FALSE(r.decodedWithFallback);
    CHECK(r.fields.at("libid") == "1234");
    CHECK(r.payloadArchive.empty());
    CHECK(stream.recordCount() == 1);
}

TEST_CASE("structure.info defines the columns") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const auto dump = dir.path() / "library.inpx";
    const std::string lines = InpLine({"First", "10", "Roe,Jane,:Poe,Edgar,Allan:", "1"}) + "\r\n" +
                              "\r\n" +
                              InpLine({"Second", "11"}) + "\n";
    flib_test::WriteZip(dump, {{"structure.info", "Title;LibId;Author;Del;\n"}, {"a.inp", lines}, {"notes.txt", "ignored"}});

    inpx::RecordStream stream = inpx::InpxParser().Parse(dump);
    CHECK(stream.columns() == std::vector<std::string>{"Title", "LibId", "Author", "Del"});
    const auto records = ReadAll(stream);
    REQUIRE(records.size() == 2);

    CHECK(records[0].title == "First");
    CHECK(records[0].libId == 10);
    CHECK(records[0].authors == std::vector<std::string>{"Roe,Jane,", "Poe,Edgar,Allan"});
    CHECK(records[0].deleted);

    CHECK(records[1].title == "Second");
    CHECK(records[1].libId == 11);
    CHECK(records[1].authors.empty());
    CHECK_FALSE(records[1].deleted);
    CHECK(records[1].fields.at("del").empty());
    CHECK_FALSE(records[1].hasSize);
}

TEST_CASE("records without a usable id are still produced") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const auto dump = dir.path() / "library.inpx";
    const std::string lines = InpLine({"A", "", "No id"}) + "\n" + InpLine({"A", "", "Bad id", "", "", "", "", "12x"}) + "\n" + SampleLine();
    flib_test::WriteZip(dump, {{"x.inp", lines}});

    inpx::RecordStream stream = inpx::InpxParser().Parse(dump);
    const auto records = ReadAll(stream);
    REQUIRE(records.size() == 3);
    CHECK_FALSE(records[0].hasLibId);
    CHECK_FALSE(records[1].hasLibId);
    CHECK(records[2].hasLibId);
    CHECK(stream.missingIdCount() == 2);
}

TEST_CASE("a dump without the end record parses like the intact one") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const std::vector<flib_test::RawEntry> entries = {
        {"structure.info", "AUTHOR;GENRE;TITLE;SERIES;SERNO;FILE;SIZE;LIBID;DEL;EXT;DATE;LANG;KEYWORDS;FOLDER;", 0},
        {"one.inp", SampleLine() + "\n" + InpLine({"Roe,Jane,:", "", "Other", "", "", "77", "10", "77"}) + "\n", 8},
        {"two.inp", InpLine({"Poe,Edgar,:", "", "Third", "", "", "78", "", "78"}) + "\n", 0},
    };
    const auto intactPath = dir.path() / "intact.inpx";
    const auto brokenPath = dir.path() / "broken.inpx";
    flib_test::WriteFile(intactPath, flib_test::BuildZipBytes(entries, true));
    flib_test::WriteFile(brokenPath, flib_test::BuildZipBytes(entries, false));

    inpx::RecordStream intactStream = inpx::InpxParser().Parse(intactPath);
    inpx::RecordStream brokenStream = inpx::InpxParser().Parse(brokenPath);
    const auto intact = ReadAll(intactStream);
    const auto broken = ReadAll(brokenStream);

    REQUIRE(intact.size() == 3);
    REQUIRE(broken.size() == intact.size());
    for (std::size_t i = 0; i < intact.size(); i++) {
        CHECK(broken[i].libId == intact[i].libId);
        CHECK(broken[i].title == intact[i].title);
        CHECK(broken[i].authors == intact[i].authors);
        CHECK(broken[i].fields == intact[i].fields);
    }
    CHECK(broken[2].title == "Third");
}

TEST_CASE("a record member listed twice is read once") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const std::vector<flib_test::RawEntry> entries = {
        {"one.inp", SampleLine() + "\n", 0},
        {"one.inp", InpLine({"Roe,Jane,:", "", "Shadow copy", "", "", "77", "10", "77"}) + "\n", 0},
        {"two.inp", InpLine({"Poe,Edgar,:", "", "Third", "", "", "78", "", "78"}) + "\n", 0},
    };
    const auto intactPath = dir.path() / "intact.inpx";
    const auto brokenPath = dir.path() / "broken.inpx";
    flib_test::WriteFile(intactPath, flib_test::BuildZipBytes(entries, true));
    flib_test::WriteFile(brokenPath, flib_test::BuildZipBytes(entries, false));

    inpx::RecordStream intactStream = inpx::InpxParser().Parse(intactPath);
    inpx::RecordStream brokenStream = inpx::InpxParser().Parse(brokenPath);
    const auto intact = ReadAll(intactStream);
    const auto broken = ReadAll(brokenStream);

    REQUIRE(intact.size() == 2);
    CHECK(intact[0].title == "Sample Book");
    CHECK(intact[1].title == "Third");
    REQUIRE(broken.size() == intact.size());
    CHECK(broken[0].libId == intact[0].libId);
    CHECK(broken[1].libId == intact[1].libId);
}

TEST_CASE("recovered dumps skip entries with unknown compression") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const std::vector<flib_test::RawEntry> entries = {
        {"lost.inp", InpLine({"A", "", "Lost", "", "", "", "", "5"}), 14},
        {"kept.inp", InpLine({"B", "", "Kept", "", "", "", "", "6"}), 0},
    };
    const auto path = dir.path() / "mixed.inpx";
    flib_test::WriteFile(path, flib_test::BuildZipBytes(entries, false));

    inpx::RecordStream stream = inpx::InpxParser().Parse(path);
    const auto records = ReadAll(stream);
    REQUIRE(records.size() == 1);
    CHECK(records[0].title == "Kept");
}

TEST_CASE("legacy encoded lines are decoded and flagged") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const auto dump = dir.path() / "library.inpx";
    // "Война и мир" in CP1251.
    const std::string title = "\xC2\xEE\xE9\xED\xE0 \xE8 \xEC\xE8\xF0";
    const std::string lines = InpLine({"Tolstoy,Lev,:", "prose:", title, "", "", "9", "", "9"}) + "\n" + SampleLine() + "\n";
    flib_test::WriteZip(dump, {{"ru.inp", lines}});

    inpx::RecordStream stream = inpx::InpxParser("CP1251", 500000).Parse(dump);
    const auto records = ReadAll(stream);
    REQUIRE(records.size() == 2);
    CHECK(records[0].decodedWithFallback);
    CHECK(records[0].title == "\xD0\x92\xD0\xBE\xD0\xB9\xD0\xBD\xD0\xB0 \xD0\xB8 \xD0\xBC\xD0\xB8\xD1\x80");
    CHECK_FALSE(records[1].decodedWithFallback);
    CHECK(stream.fallbackDecodedCount() == 1);
}

TEST_CASE("progress cadence") {
    util::ScratchDirectory dir("flibook-test-inpx");
    const auto dump = dir.path() / "library.inpx";
    std::string big;
    for (int i = 0; i < 40; i++)
        big += InpLine({"Doe,John,:", "", "Title " + std::to_string(i), "", "", "", "", std::to_string(100 + i)}) + "\n";
    flib_test::WriteZip(dump, {{"big.inp", big}, {"empty.inp", ""}});

    std::vector<std::tuple<std::string, std::uint64_t, std::uint64_t>> calls;
    const std::uint64_t interval = 256;
    inpx::RecordStream stream = inpx::InpxParser("CP1251", interval).Parse(dump,
        [&calls](const std::string& member, std::uint64_t processed, std::uint64_t total) {
            calls.emplace_back(member, processed, total);
        });
    CHECK(ReadAll(stream).size() == 40);

    std::vector<std::tuple<std::string, std::uint64_t, std::uint64_t>> bigCalls;
    std::vector<std::tuple<std::string, std::uint64_t, std::uint64_t>> emptyCalls;
    for (const auto& call : calls)
        (std::get<0>(call) == "big.inp" ? bigCalls : emptyCalls).push_back(call);

    REQUIRE(bigCalls.size() >= 2);
    CHECK(bigCalls.size() <= big.size() / interval + 1);
    CHECK(std::get<1>(bigCalls.back()) == big.size());
    CHECK(std::get<2>(bigCalls.back()) == big.size());
    std::uint64_t previous = 0;
    for (std::size_t i = 0; i + 1 < bigCalls.size(); i++) {
        CHECK(std::get<1>(bigCalls[i]) - previous >= interval);
        previous = std::get<1>(bigCalls[i]);
    }

    REQUIRE(emptyCalls.size() == 1);
    CHECK(std::get<0>(emptyCalls[0]) == "empty.inp");
    CHECK(std::get<1>(emptyCalls[0]) == 0);
    CHECK(std::get<2>(emptyCalls[0]) == 0);
}

TEST_CASE("dump failures") {
    util::ScratchDirectory dir("flibook-test-inpx");

    SUBCASE("missing dump") {
        try {
            inpx::InpxParser().Parse(dir.path() / "absent.inpx");
            FAIL("expected NotFound");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::NotFound);
        }
    }

    SUBCASE("no central directory") {
        const auto junk = dir.path() / "junk.inpx";
        flib_test::WriteFile(junk, std::string(4096, '\x7f'));
        try {
            inpx::InpxParser().Parse(junk);
            FAIL("expected MalformedContainer");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::MalformedContainer);
            CHECK(e.path() == junk.string());
        }
    }
}

TEST_CASE("structure parsing and line mapping") {
    CHECK(inpx::ParseStructure("A;;B;") == std::vector<std::string>{"A", "B"});
    CHECK(inpx::ParseStructure(inpx::kDefaultStructure).size() == 14);

    inpx::CatalogRecord record;
    CHECK_FALSE(inpx::ParseRecordLine("", {"TITLE"}, record));
    REQUIRE(inpx::ParseRecordLine(InpLine({"T", "bad-date", "-3"}), {"TITLE", "DATE", "SIZE"}, record));
    CHECK(record.title == "T");
    CHECK(record.date == "bad-date");
    CHECK_FALSE(record.hasDate);
    CHECK_FALSE(record.hasSize);
}

TEST_CASE("author names and dates") {
    const auto doe = inpx::SplitAuthorName("Doe,John,");
    CHECK(doe.last == "Doe");
    CHECK(doe.first == "John");
    CHECK(doe.middle.empty());

    const auto full = inpx::SplitAuthorName(" Poe , Edgar , Allan ");
    CHECK(full.last == "Poe");
    CHECK(full.first == "Edgar");
    CHECK(full.middle == "Allan");

    const auto shifted = inpx::SplitAuthorName(",Homer,");
    CHECK(shifted.last == "Homer");
    CHECK(shifted.first.empty());

    inpx::Date date;
    CHECK(inpx::TryParseIsoDate("2020-02-29", date));
    CHECK(date.month == 2);
    CHECK(date.day == 29);
    CHECK_FALSE(inpx::TryParseIsoDate("2019-02-29", date));
    CHECK_FALSE(inpx::TryParseIsoDate("2020-13-01", date));
    CHECK_FALSE(inpx::TryParseIsoDate("2020-1-01", date));
    CHECK_FALSE(inpx::TryParseIsoDate("", date));
}
