#include <doctest/doctest.h>

#include "test_helpers.hpp"
#include "util/config.hpp"
#include "util/util.hpp"

using namespace flib;

TEST_CASE("config defaults") {
    config::resetDefaults();
    CHECK(config::fallbackEncoding == "CP1251");
    CHECK(config::progressIntervalBytes == 500000);
    CHECK(config::importChunkSize == 1000);
    CHECK(config::archiveToken == "fb2");
    CHECK(config::payloadArchiveExt == "7z");
    CHECK(config::assetArchiveExt == "zip");
    CHECK(config::coversDirName == "covers");
    CHECK(config::imagesDirName == "images");
    CHECK_FALSE(config::debugLog);
}

TEST_CASE("config survives a save and load") {
    util::ScratchDirectory dir("flibook-test-config");
    const std::string path = (dir.path() / "flibook.json").string();

    config::resetDefaults();
    config::libraryRoot = "/srv/library";
    config::dumpPath = "/srv/library/flibusta_fb2_local.inpx";
    config::importChunkSize = 250;
    config::imagesDirName = "pics";
    REQUIRE(config::setConfig(path));

    config::resetDefaults();
    REQUIRE(config::parseConfig(path));
    CHECK(config::libraryRoot == "/srv/library");
    CHECK(config::dumpPath == "/srv/library/flibusta_fb2_local.inpx");
    CHECK(config::importChunkSize == 250);
    CHECK(config::imagesDirName == "pics");
    CHECK(config::coversDirName == "covers");
    config::resetDefaults();
}

TEST_CASE("config keeps defaults for missing keys and broken files") {
    util::ScratchDirectory dir("flibook-test-config");

    SUBCASE("missing file") {
        CHECK_FALSE(config::parseConfig((dir.path() / "absent.json").string()));
        CHECK(config::importChunkSize == 1000);
    }

    SUBCASE("partial file") {
        const auto path = dir.path() / "partial.json";
        flib_test::WriteFile(path, std::string("{\"fallbackEncoding\": \"KOI8-R\", \"importChunkSize\": -5}"));
        REQUIRE(config::parseConfig(path.string()));
        CHECK(config::fallbackEncoding == "KOI8-R");
        CHECK(config::importChunkSize == 1000);
        CHECK(config::progressIntervalBytes == 500000);
    }

    SUBCASE("malformed file") {
        const auto path = dir.path() / "broken.json";
        flib_test::WriteFile(path, std::string("{\"libraryRoot\": \"/srv\", "));
        CHECK_FALSE(config::parseConfig(path.string()));
        CHECK(config::libraryRoot.empty());
    }
    config::resetDefaults();
}
