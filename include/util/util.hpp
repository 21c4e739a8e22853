#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace flib::util {
    std::string toLower(std::string value);
    std::string trim(const std::string& value);
    bool endsWith(const std::string& value, const std::string& suffix);
    bool ignoreCaseCompare(const std::string& a, const std::string& b);
    std::vector<std::string> splitString(const std::string& value, char separator, bool dropEmpty);
    bool tryParseInt64(const std::string& text, std::int64_t& out);

    std::string base64Encode(const std::uint8_t* data, std::size_t size);
    std::string base64Encode(const std::vector<std::uint8_t>& data);
    bool base64Decode(const std::string& text, std::vector<std::uint8_t>& out);

    bool readFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& out);

    // Private directory under the system temp dir, removed with everything in
    // it when the object goes out of scope.
    class ScratchDirectory
    {
        public:
            explicit ScratchDirectory(const std::string& prefix);
            ~ScratchDirectory();

            ScratchDirectory(const ScratchDirectory&) = delete;
            ScratchDirectory& operator=(const ScratchDirectory&) = delete;

            const std::filesystem::path& path() const { return m_path; }

        private:
            std::filesystem::path m_path;
    };
}
