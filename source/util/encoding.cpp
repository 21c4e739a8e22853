#include "util/encoding.hpp"

#include <cerrno>
#include <cstdint>
#include <iconv.h>
#include <vector>
#include "util/error.hpp"

namespace flib::util {
    namespace {
        constexpr const char kReplacementChar[] = "\xEF\xBF\xBD";

        class IconvHandle
        {
            public:
                IconvHandle(const char* to, const char* from) : m_cd(iconv_open(to, from)) {}
                ~IconvHandle()
                {
                    if (valid())
                        iconv_close(m_cd);
                }

                IconvHandle(const IconvHandle&) = delete;
                IconvHandle& operator=(const IconvHandle&) = delete;

                bool valid() const { return m_cd != reinterpret_cast<iconv_t>(-1); }
                iconv_t get() const { return m_cd; }

            private:
                iconv_t m_cd;
        };
    }

    bool isValidUtf8(const char* data, std::size_t size)
    {
        const auto* p = reinterpret_cast<const unsigned char*>(data);
        std::size_t i = 0;
        while (i < size) {
            const unsigned char c = p[i];
            std::size_t extra = 0;
            std::uint32_t codepoint = 0;
            if (c < 0x80) {
                i++;
                continue;
            } else if ((c & 0xE0) == 0xC0) {
                extra = 1;
                codepoint = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                codepoint = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                codepoint = c & 0x07;
            } else {
                return false;
            }
            if (i + extra >= size)
                return false;
            for (std::size_t k = 1; k <= extra; k++) {
                const unsigned char cc = p[i + k];
                if ((cc & 0xC0) != 0x80)
                    return false;
                codepoint = (codepoint << 6) | (cc & 0x3F);
            }
            // Overlong forms, surrogates and values past U+10FFFF.
            if ((extra == 1 && codepoint < 0x80) || (extra == 2 && codepoint < 0x800) ||
                (extra == 3 && codepoint < 0x10000) || codepoint > 0x10FFFF ||
                (codepoint >= 0xD800 && codepoint <= 0xDFFF))
                return false;
            i += extra + 1;
        }
        return true;
    }

    bool legacyToUtf8(const char* data, std::size_t size, const std::string& encoding, std::string& out)
    {
        out.clear();
        IconvHandle cd("UTF-8", encoding.c_str());
        if (!cd.valid()) {
            LOG_DEBUG("Encoding: iconv does not know %s\n", encoding.c_str());
            return false;
        }

        out.reserve(size * 2);
        std::vector<char> buffer(4096);
        char* in = const_cast<char*>(data);
        std::size_t inLeft = size;
        while (inLeft > 0) {
            char* outPtr = buffer.data();
            std::size_t outLeft = buffer.size();
            const std::size_t rc = iconv(cd.get(), &in, &inLeft, &outPtr, &outLeft);
            out.append(buffer.data(), buffer.size() - outLeft);
            if (rc != static_cast<std::size_t>(-1))
                continue;
            if (errno == E2BIG)
                continue;
            // EILSEQ / EINVAL: substitute and step over the offending byte.
            out.append(kReplacementChar);
            in++;
            inLeft--;
            iconv(cd.get(), nullptr, nullptr, nullptr, nullptr);
        }
        return true;
    }

    std::string decodeText(const char* data, std::size_t size, const std::string& fallbackEncoding, bool& usedFallback)
    {
        usedFallback = false;
        if (isValidUtf8(data, size))
            return std::string(data, size);

        usedFallback = true;
        std::string out;
        if (legacyToUtf8(data, size, fallbackEncoding, out))
            return out;

        // Unknown fallback encoding: keep ASCII, replace everything else.
        out.clear();
        for (std::size_t i = 0; i < size; i++) {
            const unsigned char c = static_cast<unsigned char>(data[i]);
            if (c < 0x80)
                out.push_back(static_cast<char>(c));
            else
                out.append(kReplacementChar);
        }
        return out;
    }
}
