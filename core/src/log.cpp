#include "warden/log.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <unistd.h>

namespace warden {

namespace {

std::atomic<int> g_level{-1};

int level_from_env() {
    const char* e = std::getenv("WARDEN_LOG_LEVEL");
    return static_cast<int>(e ? parse_log_level(e) : LogLevel::INFO);
}

} // namespace

LogLevel parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void set_log_level(LogLevel lvl) {
    g_level.store(static_cast<int>(lvl));
}

LogLevel log_level() {
    int cur = g_level.load();
    if (cur < 0) {
        int fresh = level_from_env();
        g_level.compare_exchange_strong(cur, fresh);
        cur = g_level.load();
    }
    return static_cast<LogLevel>(cur);
}

void log_line(LogLevel lvl, const char* component, const std::string& msg) {
    if (static_cast<int>(lvl) < static_cast<int>(log_level())) return;

    std::string line;
    line.reserve(msg.size() + 32);
    if (lvl == LogLevel::WARN) line += "[WARN] ";
    else if (lvl == LogLevel::ERROR) line += "[ERROR] ";
    line += "[";
    line += component;
    line += "] ";
    line += msg;
    line += "\n";

    const char* p = line.data();
    size_t left = line.size();
    while (left > 0) {
        ssize_t n = ::write(STDERR_FILENO, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;  // stderr gone; nothing else to report to
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
}

} // namespace warden
