// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <atomic>
#include <cstring>
#include <ctime>
#include <mutex>
#include <fcntl.h>
#include <unistd.h>

namespace {
    std::mutex        g_mu;
    std::string       g_path;
#ifdef KVSTASH_DEBUG
    std::atomic<int>  g_level{static_cast<int>(Logger::Level::Debug)};
#else
    std::atomic<int>  g_level{static_cast<int>(Logger::Level::Info)};
#endif
}

static const char* level_name(Logger::Level level) {
    switch (level) {
        case Logger::Level::Debug: return "debug";
        case Logger::Level::Info:  return "info";
        case Logger::Level::Warn:  return "warn";
        case Logger::Level::Error: return "error";
    }
    return "?";
}

void Logger::set_path(const std::string& path) {
    std::lock_guard<std::mutex> lk(g_mu);
    g_path = path;
}

void Logger::set_level(Level level) {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

Logger::Level Logger::level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}


// Desc: append a timestamped line to the log file (or stderr)
// In: Level level, const char* component, const std::string& msg
// Out: void
void Logger::log(Level level, const char* component, const std::string& msg) {
    if (static_cast<int>(level) < g_level.load(std::memory_order_relaxed)) return;

    std::string path;
    {
        std::lock_guard<std::mutex> lk(g_mu);
        path = g_path;
    }
    if (path.empty() && level < Level::Warn) return;

    time_t now = ::time(nullptr);
    char buf[64];
    ctime_r(&now, buf);
    buf[std::strlen(buf) - 1] = '\0';
    const std::string line = "[" + std::string(buf) + "] [" + level_name(level) + "] [" +
                             (component ? component : "-") + "] " + msg + "\n";

    int fd = path.empty() ? STDERR_FILENO
                          : ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) return;
    ssize_t wr = ::write(fd, line.c_str(), line.size());
    (void)wr;
    if (fd != STDERR_FILENO) ::close(fd);
}
