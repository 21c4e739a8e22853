#pragma once

#include <cstddef>
#include <string>

namespace flib::util {
    bool isValidUtf8(const char* data, std::size_t size);

    // Converts bytes in a legacy single-byte encoding (e.g. "CP1251") to UTF-8.
    // Bytes the converter rejects become U+FFFD. Returns false only if the
    // encoding itself is unknown to iconv.
    bool legacyToUtf8(const char* data, std::size_t size, const std::string& encoding, std::string& out);

    // Decodes as UTF-8, falling back to the legacy encoding. usedFallback is
    // set when the fallback path was taken.
    std::string decodeText(const char* data, std::size_t size, const std::string& fallbackEncoding, bool& usedFallback);
}
