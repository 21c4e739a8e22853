#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace flib::config {
    static const std::string defaultConfigPath = "flibook.json";

    extern std::string libraryRoot;
    extern std::string dumpPath;
    extern std::string fallbackEncoding;
    extern std::uint64_t progressIntervalBytes;
    extern std::size_t importChunkSize;
    extern bool debugLog;
    extern std::string logPath;

    extern std::string archiveToken;
    extern std::string payloadArchiveExt;
    extern std::string assetArchiveExt;
    extern std::string coversDirName;
    extern std::string imagesDirName;

    void resetDefaults();
    bool setConfig(const std::string& path = defaultConfigPath);
    bool parseConfig(const std::string& path = defaultConfigPath);
}
