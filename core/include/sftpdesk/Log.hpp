// Minimal logging utility (header-only) for the transport core.
// Enabled with SFTPDESK_LOG=1; the service layer uses Qt logging categories.
#pragma once
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace sftpdesk {

inline bool logEnabled() {
    const char* v = std::getenv("SFTPDESK_LOG");
    return v && *v && *v != '0';
}

// Lower-cased, trimmed value of an environment variable ("" when unset).
inline std::string envValueLower(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw)
        return {};
    std::string v(raw);
    const auto first = v.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    v = v.substr(first, v.find_last_not_of(" \t\r\n") - first + 1);
    for (char& c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return v;
}

// Host names and usernames only reach the log when SFTPDESK_ENV is a dev
// environment and SFTPDESK_LOG_SENSITIVE is switched on.
inline bool sensitiveLoggingEnabled() {
    const std::string env = envValueLower("SFTPDESK_ENV");
    const std::string flag = envValueLower("SFTPDESK_LOG_SENSITIVE");
    const bool dev = env == "dev" || env == "development" || env == "debug";
    return dev && (flag == "1" || flag == "true" || flag == "on");
}

inline std::string redacted(const std::string& value) {
    return sensitiveLoggingEnabled() ? value : std::string("<redacted>");
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    std::fprintf(stderr, "[SftpDesk][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace sftpdesk

#define LOGI(...) \
    do { \
        if (sftpdesk::logEnabled()) \
            sftpdesk::logf("INFO", __VA_ARGS__); \
    } while (0)

#define LOGW(...) \
    do { \
        if (sftpdesk::logEnabled()) \
            sftpdesk::logf("WARN", __VA_ARGS__); \
    } while (0)

#define LOGE(...) \
    do { \
        if (sftpdesk::logEnabled()) \
            sftpdesk::logf("ERROR", __VA_ARGS__); \
    } while (0)
