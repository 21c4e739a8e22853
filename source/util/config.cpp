#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include "util/config.hpp"
#include "util/error.hpp"

namespace flib::config {
    std::string libraryRoot;
    std::string dumpPath;
    std::string fallbackEncoding;
    std::uint64_t progressIntervalBytes;
    std::size_t importChunkSize;
    bool debugLog;
    std::string logPath;

    std::string archiveToken;
    std::string payloadArchiveExt;
    std::string assetArchiveExt;
    std::string coversDirName;
    std::string imagesDirName;

    namespace {
        struct DefaultsInitializer {
            DefaultsInitializer() { resetDefaults(); }
        };
        const DefaultsInitializer g_defaultsInitializer;

        void ReadString(const nlohmann::json& j, const char* key, std::string& out)
        {
            if (j.contains(key) && j[key].is_string())
                out = j[key].get<std::string>();
        }

        void ReadBool(const nlohmann::json& j, const char* key, bool& out)
        {
            if (j.contains(key) && j[key].is_boolean())
                out = j[key].get<bool>();
        }

        template <typename T>
        void ReadUnsigned(const nlohmann::json& j, const char* key, T& out)
        {
            if (!j.contains(key))
                return;
            const auto& value = j[key];
            if (value.is_number_unsigned()) {
                out = static_cast<T>(value.get<std::uint64_t>());
            } else if (value.is_number_integer()) {
                const auto parsed = value.get<std::int64_t>();
                if (parsed > 0)
                    out = static_cast<T>(parsed);
            }
        }
    }

    void resetDefaults()
    {
        libraryRoot.clear();
        dumpPath.clear();
        fallbackEncoding = "CP1251";
        progressIntervalBytes = 500000;
        importChunkSize = 1000;
        debugLog = false;
        logPath.clear();

        archiveToken = "fb2";
        payloadArchiveExt = "7z";
        assetArchiveExt = "zip";
        coversDirName = "covers";
        imagesDirName = "images";
    }

    bool setConfig(const std::string& path)
    {
        nlohmann::json j = {
            {"libraryRoot", libraryRoot},
            {"dumpPath", dumpPath},
            {"fallbackEncoding", fallbackEncoding},
            {"progressIntervalBytes", progressIntervalBytes},
            {"importChunkSize", importChunkSize},
            {"debugLog", debugLog},
            {"logPath", logPath},
            {"archiveToken", archiveToken},
            {"payloadArchiveExt", payloadArchiveExt},
            {"assetArchiveExt", assetArchiveExt},
            {"coversDirName", coversDirName},
            {"imagesDirName", imagesDirName}
        };
        std::ofstream file(path);
        if (!file.is_open()) {
            LOG_DEBUG("Config: unable to write %s\n", path.c_str());
            return false;
        }
        file << std::setw(4) << j << std::endl;
        return file.good();
    }

    bool parseConfig(const std::string& path)
    {
        resetDefaults();

        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
            return false;

        try {
            std::ifstream file(path);
            nlohmann::json j;
            file >> j;
            ReadString(j, "libraryRoot", libraryRoot);
            ReadString(j, "dumpPath", dumpPath);
            ReadString(j, "fallbackEncoding", fallbackEncoding);
            ReadUnsigned(j, "progressIntervalBytes", progressIntervalBytes);
            ReadUnsigned(j, "importChunkSize", importChunkSize);
            ReadBool(j, "debugLog", debugLog);
            ReadString(j, "logPath", logPath);
            ReadString(j, "archiveToken", archiveToken);
            ReadString(j, "payloadArchiveExt", payloadArchiveExt);
            ReadString(j, "assetArchiveExt", assetArchiveExt);
            ReadString(j, "coversDirName", coversDirName);
            ReadString(j, "imagesDirName", imagesDirName);
        }
        catch (const nlohmann::json::exception& e) {
            // Keep whatever defaults are in place; the broken file is left untouched.
            resetDefaults();
            LOG_DEBUG("Config: failed to parse %s: %s\n", path.c_str(), e.what());
            return false;
        }
        return true;
    }
}
