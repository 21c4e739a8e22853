#include "util/error.hpp"

#include <cstdarg>
#include <mutex>
#include <utility>
#include <vector>

#include "util/config.hpp"

namespace flib
{
    const char* ErrorKindName(ErrorKind kind)
    {
        switch (kind) {
            case ErrorKind::NotFound:
                return "NotFound";
            case ErrorKind::UnsupportedFormat:
                return "UnsupportedFormat";
            case ErrorKind::MalformedContainer:
                return "MalformedContainer";
            case ErrorKind::MissingPayload:
                return "MissingPayload";
        }
        return "Unknown";
    }

    Error::Error(ErrorKind kind, std::string path, std::string member, const std::string& message)
        : std::runtime_error(message), m_kind(kind), m_path(std::move(path)), m_member(std::move(member))
    {
    }
}

namespace flib::util
{
    namespace {
        std::mutex g_logMutex;

        std::string VFormat(const char* format, va_list args)
        {
            va_list copy;
            va_copy(copy, args);
            const int needed = std::vsnprintf(nullptr, 0, format, copy);
            va_end(copy);
            if (needed <= 0)
                return std::string();
            std::vector<char> buf(static_cast<std::size_t>(needed) + 1, '\0');
            std::vsnprintf(buf.data(), buf.size(), format, args);
            return std::string(buf.data(), static_cast<std::size_t>(needed));
        }
    }

    std::string FormatMessage(const char* format, ...)
    {
        va_list args;
        va_start(args, format);
        std::string out = VFormat(format, args);
        va_end(args);
        return out;
    }

    void LogDebug(const char* format, ...)
    {
        if (!flib::config::debugLog)
            return;

        va_list args;
        va_start(args, format);
        const std::string msg = VFormat(format, args);
        va_end(args);

        std::lock_guard<std::mutex> lock(g_logMutex);
        if (flib::config::logPath.empty()) {
            std::fputs(msg.c_str(), stderr);
            return;
        }
        FILE* f = std::fopen(flib::config::logPath.c_str(), "ab");
        if (!f) {
            std::fputs(msg.c_str(), stderr);
            return;
        }
        std::fputs(msg.c_str(), f);
        std::fclose(f);
    }
}
