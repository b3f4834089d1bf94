// include/ConfigManager.hpp
#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

#include "StorageManager.hpp"

// Settings shared by every namespace of one cache directory.
struct CacheOptions {
    std::string directory    = "~/.kvstash";
    std::string name         = "default.sqlite3";
    int64_t     max_size     = 1LL << 24;
    int64_t     iter_size    = 256;
    std::string evict_policy = "lru";
    size_t      raw_max_size = 128 * 1024;
    double      timeout      = 5.0;
    Pragmas     pragmas      = default_pragmas();
    std::string log_path;
};

class ConfigManager {
public:
    explicit ConfigManager() = default;

    // false (with the reason on stderr) when the file is unreadable or invalid
    bool loadFromFile(const std::string& config_path);
    // throws ValidationError
    void parse(const nlohmann::json& j);

    const CacheOptions& options() const { return options_; }

    // "128KB" / "1MB" / "512" -> bytes
    static std::uint64_t parse_size_kb_mb(const std::string& s);
    // leading "~" -> $HOME
    static std::string expand_home(const std::string& path);
    // throws ValidationError on a bad field
    static void validate(const CacheOptions& opts);

private:
    CacheOptions options_;
};
