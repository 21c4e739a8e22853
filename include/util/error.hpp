#pragma once

#include <cstdio>
#include <stdexcept>
#include <string>

namespace flib
{
    enum class ErrorKind {
        NotFound,
        UnsupportedFormat,
        MalformedContainer,
        MissingPayload
    };

    const char* ErrorKindName(ErrorKind kind);

    // Fatal condition raised by the library. Carries the archive/dump path and,
    // where one is involved, the member name.
    class Error : public std::runtime_error
    {
        public:
            Error(ErrorKind kind, std::string path, std::string member, const std::string& message);

            ErrorKind kind() const { return m_kind; }
            const std::string& path() const { return m_path; }
            const std::string& member() const { return m_member; }

        private:
            ErrorKind m_kind;
            std::string m_path;
            std::string m_member;
    };
}

namespace flib::util
{
    void LogDebug(const char* format, ...) __attribute__((format(printf, 1, 2)));
    std::string FormatMessage(const char* format, ...) __attribute__((format(printf, 1, 2)));
}

#define LOG_DEBUG(format, ...) flib::util::LogDebug(format, ##__VA_ARGS__)

#define THROW_FORMAT(format, ...) { \
    std::string error_prefix = flib::util::FormatMessage("%s:%u: ", __func__, __LINE__); \
    throw std::runtime_error(error_prefix + flib::util::FormatMessage(format, ##__VA_ARGS__)); }

#define THROW_ERROR(kind, path, member, format, ...) { \
    std::string error_prefix = flib::util::FormatMessage("%s:%u: ", __func__, __LINE__); \
    throw flib::Error(kind, path, member, error_prefix + flib::util::FormatMessage(format, ##__VA_ARGS__)); }
