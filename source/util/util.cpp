#include "util/util.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <random>
#include <utility>
#include <unistd.h>
#include "util/error.hpp"

namespace flib::util {
    namespace {
        constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

        std::atomic<std::uint64_t> g_scratchCounter{0};

        int Base64Value(unsigned char c)
        {
            if (c >= 'A' && c <= 'Z')
                return c - 'A';
            if (c >= 'a' && c <= 'z')
                return c - 'a' + 26;
            if (c >= '0' && c <= '9')
                return c - '0' + 52;
            if (c == '+')
                return 62;
            if (c == '/')
                return 63;
            return -1;
        }
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return value;
    }

    std::string trim(const std::string& value)
    {
        if (value.empty())
            return "";
        std::size_t start = value.find_first_not_of(" \t\r\n");
        if (start == std::string::npos)
            return "";
        std::size_t end = value.find_last_not_of(" \t\r\n");
        return value.substr(start, (end - start) + 1);
    }

    bool endsWith(const std::string& value, const std::string& suffix)
    {
        return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    bool ignoreCaseCompare(const std::string& a, const std::string& b)
    {
        if (a.size() != b.size())
            return false;
        return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) == std::tolower(y);
        });
    }

    std::vector<std::string> splitString(const std::string& value, char separator, bool dropEmpty)
    {
        std::vector<std::string> parts;
        std::size_t begin = 0;
        while (true) {
            const std::size_t pos = value.find(separator, begin);
            std::string part = value.substr(begin, pos == std::string::npos ? std::string::npos : pos - begin);
            if (!(dropEmpty && part.empty()))
                parts.push_back(std::move(part));
            if (pos == std::string::npos)
                break;
            begin = pos + 1;
        }
        return parts;
    }

    bool tryParseInt64(const std::string& text, std::int64_t& out)
    {
        const std::string trimmed = trim(text);
        if (trimmed.empty())
            return false;
        char* end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll(trimmed.c_str(), &end, 10);
        if (end == trimmed.c_str() || (end != nullptr && *end != '\0') || errno == ERANGE)
            return false;
        out = static_cast<std::int64_t>(parsed);
        return true;
    }

    std::string base64Encode(const std::uint8_t* data, std::size_t size)
    {
        std::string out;
        out.reserve(((size + 2) / 3) * 4);
        std::size_t i = 0;
        for (; i + 2 < size; i += 3) {
            const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                         (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                         static_cast<std::uint32_t>(data[i + 2]);
            out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
            out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
            out.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
            out.push_back(kBase64Alphabet[triple & 0x3F]);
        }
        const std::size_t remaining = size - i;
        if (remaining == 1) {
            const std::uint32_t triple = static_cast<std::uint32_t>(data[i]) << 16;
            out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
            out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
            out.append("==");
        } else if (remaining == 2) {
            const std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                         (static_cast<std::uint32_t>(data[i + 1]) << 8);
            out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
            out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
            out.push_back(kBase64Alphabet[(triple >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }

    std::string base64Encode(const std::vector<std::uint8_t>& data)
    {
        return base64Encode(data.data(), data.size());
    }

    bool base64Decode(const std::string& text, std::vector<std::uint8_t>& out)
    {
        out.clear();
        std::uint32_t accum = 0;
        int bits = 0;
        bool sawPadding = false;
        for (unsigned char c : text) {
            if (std::isspace(c))
                continue;
            if (c == '=') {
                sawPadding = true;
                continue;
            }
            if (sawPadding)
                return false;
            const int value = Base64Value(c);
            if (value < 0)
                return false;
            accum = (accum << 6) | static_cast<std::uint32_t>(value);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back(static_cast<std::uint8_t>((accum >> bits) & 0xFF));
            }
        }
        return true;
    }

    bool readFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>& out)
    {
        std::error_code ec;
        const auto fileSize = std::filesystem::file_size(path, ec);
        if (ec)
            return false;

        std::ifstream in(path, std::ios::binary);
        if (!in)
            return false;

        out.resize(static_cast<std::size_t>(fileSize));
        if (!out.empty()) {
            in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
            if (!in)
                return false;
        }
        return true;
    }

    ScratchDirectory::ScratchDirectory(const std::string& prefix)
    {
        std::error_code ec;
        const std::filesystem::path base = std::filesystem::temp_directory_path(ec);
        if (ec)
            THROW_FORMAT("no temp directory available: %s", ec.message().c_str());

        std::random_device rd;
        for (int attempt = 0; attempt < 16; attempt++) {
            const std::string name = prefix + "-" + std::to_string(::getpid()) + "-" +
                std::to_string(g_scratchCounter.fetch_add(1)) + "-" + std::to_string(rd());
            std::filesystem::path candidate = base / name;
            if (std::filesystem::create_directory(candidate, ec)) {
                m_path = std::move(candidate);
                return;
            }
        }
        THROW_FORMAT("unable to create scratch directory under %s", base.string().c_str());
    }

    ScratchDirectory::~ScratchDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
        if (ec)
            LOG_DEBUG("Scratch directory cleanup failed for %s: %s\n", m_path.string().c_str(), ec.message().c_str());
    }
}
