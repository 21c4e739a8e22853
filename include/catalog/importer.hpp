#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "catalog/catalog_sink.hpp"
#include "inpx/inpx_parser.hpp"

namespace flib::catalog
{
    struct ImportOptions {
        // Archives are resolved only when this is set.
        std::string libraryRoot;
        std::size_t chunkSize = 1000;
        std::string fallbackEncoding = "CP1251";
        std::uint64_t progressIntervalBytes = 500000;
        inpx::ProgressCallback progress;

        static ImportOptions FromConfig();
    };

    struct ImportResult {
        bool success = false;
        std::uint64_t imported = 0;
        std::uint64_t skipped = 0;
        std::uint64_t duplicates = 0;
        std::uint64_t fallbackDecoded = 0;
        std::string error;
    };

    ImportResult ImportInpx(const std::filesystem::path& dump, CatalogSink& sink, const ImportOptions& options = ImportOptions());
}
