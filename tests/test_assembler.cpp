#include <doctest/doctest.h>

#include <pugixml.hpp>
#include "fb2/assembler.hpp"
#include "test_helpers.hpp"
#include "util/error.hpp"
#include "util/util.hpp"

using namespace flib;

namespace {
    const std::string kCoverBytes = std::string("\xFF\xD8\xFF\xE0", 4) + std::string(300, '\x11') + std::string("\0\x01\x02", 3);
    const std::string kPicBytes = std::string("\x89PNG\r\n\x1A\n", 8) + std::string(90, '\x22');

    const char* const kPayload =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<FictionBook xmlns=\"http://www.gribuser.ru/xml/fictionbook/2.0\" xmlns:l=\"http://www.w3.org/1999/xlink\">\n"
        "<description><title-info><genre>sf</genre><book-title>Sample Book</book-title>"
        "<coverpage><image l:href=\"#cover-img\"/></coverpage><lang>en</lang></title-info></description>\n"
        "<body><section><p>Some <emphasis>text</emphasis> here</p>"
        "<image l:href=\"#pic1\"/><p>More</p><image l:href=\"#pic1\"/><image l:href=\"#missing\"/></section></body>\n"
        "</FictionBook>\n";

    struct Library {
        util::ScratchDirectory root{"flibook-test-assembler"};
        inpx::CatalogRecord record;

        Library()
        {
            record.libId = 1234;
            record.hasLibId = true;
            record.fileExt = "fb2";
            record.payloadArchive = root.path() / "fb2-1000-2000.7z";
            record.coverArchive = root.path() / "covers" / "fb2-1000-2000.zip";
            record.illustrationArchive = root.path() / "images" / "fb2-1000-2000.zip";
        }

        void WritePayload(const std::string& xml)
        {
            flib_test::Write7z(record.payloadArchive, {{"1233.fb2", "<FictionBook/>"}, {"1234.fb2", xml}});
        }

        void WriteAssets()
        {
            flib_test::WriteZip(record.coverArchive, {{"covers/", ""}, {"1234.jpg", kCoverBytes}});
            flib_test::WriteZip(record.illustrationArchive, {
                {"999/pic1.png", "wrong book"},
                {"1234/", ""},
                {"1234/pic1.png", kPicBytes},
                {"1234/unused.jpg", "unused"},
            });
        }
    };

    void Load(pugi::xml_document& doc, const std::vector<std::uint8_t>& bytes)
    {
        const pugi::xml_parse_result parsed = doc.load_buffer(bytes.data(), bytes.size());
        REQUIRE(parsed);
    }

    std::vector<pugi::xml_node> Binaries(const pugi::xml_document& doc)
    {
        std::vector<pugi::xml_node> nodes;
        for (pugi::xml_node node : doc.document_element().children("binary"))
            nodes.push_back(node);
        return nodes;
    }

    std::string Decoded(const pugi::xml_node& binary)
    {
        std::vector<std::uint8_t> data;
        REQUIRE(util::base64Decode(binary.text().get(), data));
        return flib_test::ToString(data);
    }
}

TEST_CASE("cover and one illustration are embedded") {
    Library lib;
    lib.WritePayload(kPayload);
    lib.WriteAssets();

    const auto bytes = fb2::AssembleFb2(lib.record);
    const std::string text = flib_test::ToString(bytes);
    CHECK(text.rfind("<?xml version=\"1.0\" encoding=\"utf-8\"?>", 0) == 0);

    pugi::xml_document doc;
    Load(doc, bytes);
    const auto binaries = Binaries(doc);
    REQUIRE(binaries.size() == 2);

    CHECK(std::string(binaries[0].attribute("id").value()) == "cover-img");
    CHECK(std::string(binaries[0].attribute("content-type").value()) == "image/jpeg");
    CHECK(Decoded(binaries[0]) == kCoverBytes);

    CHECK(std::string(binaries[1].attribute("id").value()) == "pic1");
    CHECK(std::string(binaries[1].attribute("content-type").value()) == "image/png");
    CHECK(Decoded(binaries[1]) == kPicBytes);

    const pugi::xml_node cover = doc.document_element().child("description").child("title-info").child("coverpage").child("image");
    CHECK(std::string(cover.attribute("l:href").value()) == "#cover-img");

    CHECK(text.find("<p>Some <emphasis>text</emphasis> here</p>") != std::string::npos);
}

TEST_CASE("assembly is deterministic") {
    Library lib;
    lib.WritePayload(kPayload);
    lib.WriteAssets();
    CHECK(fb2::AssembleFb2(lib.record) == fb2::AssembleFb2(lib.record));
}

TEST_CASE("a coverpage is added when the document has none") {
    Library lib;
    lib.WritePayload(
        "<?xml version=\"1.0\"?>"
        "<FictionBook xmlns=\"http://www.gribuser.ru/xml/fictionbook/2.0\" xmlns:xlink=\"http://www.w3.org/1999/xlink\">"
        "<description><title-info><book-title>T</book-title><lang>ru</lang></title-info></description>"
        "<body><section><image xlink:href=\"#pic1\"/></section></body></FictionBook>");
    lib.WriteAssets();

    pugi::xml_document doc;
    Load(doc, fb2::AssembleFb2(lib.record));
    const pugi::xml_node titleInfo = doc.document_element().child("description").child("title-info");
    const pugi::xml_node coverpage = titleInfo.child("coverpage");
    REQUIRE(coverpage);
    CHECK(std::string(coverpage.next_sibling().name()) == "lang");
    CHECK(std::string(coverpage.child("image").attribute("xlink:href").value()) == std::string("#") + fb2::kDefaultCoverId);

    const auto binaries = Binaries(doc);
    REQUIRE(binaries.size() == 2);
    CHECK(std::string(binaries[0].attribute("id").value()) == "cover.jpg");
    CHECK(std::string(binaries[1].attribute("id").value()) == "pic1");
}

TEST_CASE("xlink references are found under any bound prefix") {
    Library lib;
    lib.WritePayload(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<FictionBook xmlns=\"http://www.gribuser.ru/xml/fictionbook/2.0\""
        " xmlns:l=\"http://www.w3.org/1999/xlink\" xmlns:xlink=\"http://www.w3.org/1999/xlink\">"
        "<description><title-info><book-title>T</book-title>"
        "<coverpage><image l:href=\"#front\"/></coverpage></title-info></description>"
        "<body><section><image xlink:href=\"#pic1\"/></section>"
        "<section xmlns:x=\"http://www.w3.org/1999/xlink\"><image x:href=\"#pic2\"/></section>"
        "<section xmlns:o=\"urn:other\"><image o:href=\"#pic3\"/></section></body></FictionBook>");
    flib_test::WriteZip(lib.record.coverArchive, {{"1234.jpg", kCoverBytes}});
    flib_test::WriteZip(lib.record.illustrationArchive, {
        {"1234/pic1.png", kPicBytes},
        {"1234/pic2.gif", "GIF89a"},
        {"1234/pic3.png", "not referenced through xlink"},
    });

    pugi::xml_document doc;
    Load(doc, fb2::AssembleFb2(lib.record));
    const auto binaries = Binaries(doc);
    REQUIRE(binaries.size() == 3);
    CHECK(std::string(binaries[0].attribute("id").value()) == "front");
    CHECK(std::string(binaries[1].attribute("id").value()) == "pic1");
    CHECK(std::string(binaries[2].attribute("id").value()) == "pic2");
    CHECK(std::string(binaries[2].attribute("content-type").value()) == "image/gif");

    const pugi::xml_node cover = doc.document_element().child("description").child("title-info").child("coverpage").child("image");
    int hrefs = 0;
    for (pugi::xml_attribute attr : cover.attributes()) {
        const std::string name = attr.name();
        if (name.size() >= 5 && name.compare(name.size() - 5, 5, ":href") == 0)
            hrefs++;
    }
    CHECK(hrefs == 1);
    CHECK(std::string(cover.attribute("l:href").value()) == "#front");
}

TEST_CASE("a coverpage href under a second prefix is rewritten in place") {
    Library lib;
    lib.record.illustrationArchive.clear();
    lib.WritePayload(
        "<FictionBook xmlns=\"http://www.gribuser.ru/xml/fictionbook/2.0\""
        " xmlns:l=\"http://www.w3.org/1999/xlink\" xmlns:xlink=\"http://www.w3.org/1999/xlink\">"
        "<description><title-info><coverpage><image xlink:href=\"#c1\"/></coverpage></title-info></description>"
        "<body><section><p>x</p></section></body></FictionBook>");
    flib_test::WriteZip(lib.record.coverArchive, {{"1234.jpg", kCoverBytes}});

    pugi::xml_document doc;
    Load(doc, fb2::AssembleFb2(lib.record));
    const pugi::xml_node cover = doc.document_element().child("description").child("title-info").child("coverpage").child("image");
    CHECK(std::string(cover.attribute("xlink:href").value()) == "#c1");
    CHECK_FALSE(cover.attribute("l:href"));
    const auto binaries = Binaries(doc);
    REQUIRE(binaries.size() == 1);
    CHECK(std::string(binaries[0].attribute("id").value()) == "c1");
}

TEST_CASE("an empty cover member is not embedded") {
    Library lib;
    lib.WritePayload(kPayload);
    flib_test::WriteZip(lib.record.coverArchive, {{"1234.jpg", ""}});
    flib_test::WriteZip(lib.record.illustrationArchive, {{"1234/cover-img.jpg", kCoverBytes}});

    pugi::xml_document doc;
    Load(doc, fb2::AssembleFb2(lib.record));
    const auto binaries = Binaries(doc);
    REQUIRE(binaries.size() == 1);
    CHECK(std::string(binaries[0].attribute("id").value()) == "cover-img");
    CHECK(Decoded(binaries[0]) == kCoverBytes);
}

TEST_CASE("missing asset archives only leave assets out") {
    Library lib;
    lib.WritePayload(kPayload);

    SUBCASE("archives resolved but absent on disk") {
        pugi::xml_document doc;
        Load(doc, fb2::AssembleFb2(lib.record));
        CHECK(Binaries(doc).empty());
    }

    SUBCASE("nothing resolved") {
        lib.record.coverArchive.clear();
        lib.record.illustrationArchive.clear();
        pugi::xml_document doc;
        Load(doc, fb2::AssembleFb2(lib.record));
        CHECK(Binaries(doc).empty());
        const pugi::xml_node cover = doc.document_element().child("description").child("title-info").child("coverpage").child("image");
        CHECK(std::string(cover.attribute("l:href").value()) == "#cover-img");
    }
}

TEST_CASE("cover archive without a matching name uses its first file") {
    Library lib;
    lib.WritePayload(kPayload);
    flib_test::WriteZip(lib.record.coverArchive, {{"dir/", ""}, {"dir/front.gif", "GIF89a"}, {"back.jpg", "jpeg"}});
    lib.record.illustrationArchive.clear();

    pugi::xml_document doc;
    Load(doc, fb2::AssembleFb2(lib.record));
    const auto binaries = Binaries(doc);
    REQUIRE(binaries.size() == 1);
    CHECK(std::string(binaries[0].attribute("id").value()) == "cover-img");
    CHECK(std::string(binaries[0].attribute("content-type").value()) == "image/gif");
    CHECK(Decoded(binaries[0]) == "GIF89a");
}

TEST_CASE("payload errors") {
    Library lib;

    SUBCASE("no payload archive") {
        lib.record.payloadArchive.clear();
        try {
            fb2::AssembleFb2(lib.record);
            FAIL("expected MissingPayload");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::MissingPayload);
        }
    }

    SUBCASE("payload archive missing on disk") {
        try {
            fb2::AssembleFb2(lib.record);
            FAIL("expected NotFound");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::NotFound);
            CHECK(e.path() == lib.record.payloadArchive.string());
        }
    }

    SUBCASE("member missing from the payload archive") {
        flib_test::Write7z(lib.record.payloadArchive, {{"1.fb2", "<FictionBook/>"}});
        try {
            fb2::AssembleFb2(lib.record);
            FAIL("expected NotFound");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::NotFound);
            CHECK(e.member() == "1234.fb2");
        }
    }
}

TEST_CASE("windows-1251 payloads come out as UTF-8") {
    Library lib;
    lib.record.coverArchive.clear();
    lib.record.illustrationArchive.clear();
    // "Мир" in CP1251.
    lib.WritePayload(
        "<?xml version=\"1.0\" encoding=\"windows-1251\"?>"
        "<FictionBook xmlns=\"http://www.gribuser.ru/xml/fictionbook/2.0\" xmlns:l=\"http://www.w3.org/1999/xlink\">"
        "<description><title-info><book-title>\xCC\xE8\xF0</book-title></title-info></description>"
        "<body><section><p>x</p></section></body></FictionBook>");

    const auto bytes = fb2::AssembleFb2(lib.record);
    CHECK(flib_test::ToString(bytes).rfind("<?xml version=\"1.0\" encoding=\"utf-8\"?>", 0) == 0);
    pugi::xml_document doc;
    Load(doc, bytes);
    CHECK(std::string(doc.document_element().child("description").child("title-info").child("book-title").text().get()) ==
          "\xD0\x9C\xD0\xB8\xD1\x80");
}

TEST_CASE("zip payload archives fall back to their only document") {
    Library lib;
    lib.record.payloadArchive = lib.root.path() / "fb2-1000-2000.zip";
    lib.record.coverArchive.clear();
    lib.record.illustrationArchive.clear();
    flib_test::WriteZip(lib.record.payloadArchive, {{"book.fb2", kPayload}});

    pugi::xml_document doc;
    Load(doc, fb2::AssembleFb2(lib.record));
    CHECK(std::string(doc.document_element().child("description").child("title-info").child("book-title").text().get()) == "Sample Book");
}

TEST_CASE("content types and member names") {
    CHECK(fb2::ContentTypeFor("a.jpg") == "image/jpeg");
    CHECK(fb2::ContentTypeFor("dir/a.JPEG") == "image/jpeg");
    CHECK(fb2::ContentTypeFor("a.png") == "image/png");
    CHECK(fb2::ContentTypeFor("a.gif") == "image/gif");
    CHECK(fb2::ContentTypeFor("a.bmp") == "application/octet-stream");
    CHECK(fb2::ContentTypeFor("1234") == "image/jpeg");
    CHECK(fb2::ContentTypeFor("v1.2/cover") == "image/jpeg");

    inpx::CatalogRecord record;
    record.libId = 77;
    record.hasLibId = true;
    CHECK(fb2::PayloadMemberName(record) == "77.fb2");
    record.fileExt = "epub";
    CHECK(fb2::PayloadMemberName(record) == "77.epub");
}
