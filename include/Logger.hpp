// include/Logger.hpp
#pragma once
#include <string>

// Process-wide line logger. Lines are appended with one write(2) on an
// O_APPEND descriptor so processes sharing a log file never interleave.
class Logger {
public:
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    // empty path: Warn and above go to stderr
    static void set_path(const std::string& path);
    static void set_level(Level level);
    static Level level();

    static void log(Level level, const char* component, const std::string& msg);

    static void debug(const char* component, const std::string& msg) { log(Level::Debug, component, msg); }
    static void info(const char* component, const std::string& msg)  { log(Level::Info, component, msg); }
    static void warn(const char* component, const std::string& msg)  { log(Level::Warn, component, msg); }
    static void error(const char* component, const std::string& msg) { log(Level::Error, component, msg); }
};
