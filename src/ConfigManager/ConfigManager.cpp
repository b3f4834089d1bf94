// === src/ConfigManager/ConfigManager.cpp ===
#include "ConfigManager.hpp"
#include "CacheErrors.hpp"
#include "Evictor.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <regex>
using nlohmann::json;

// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}

static inline std::string toLower(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}


// Desc: parse size string (plain bytes, KB or MB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws ValidationError on invalid input
std::uint64_t ConfigManager::parse_size_kb_mb(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmM]?[bB]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw ValidationError("invalid size (bytes, KB or MB): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw ValidationError("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    if (unit.empty() || unit == "B") return n;
    if (unit == "K" || unit == "KB") return n * 1024ULL;
    if (unit == "M" || unit == "MB") return n * 1024ULL * 1024ULL;
    throw ValidationError("invalid size unit: '" + raw + "'");
}

std::string ConfigManager::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;   // ~user is left alone
    const char* home = std::getenv("HOME");
    if (!home || !*home) throw ValidationError("cannot expand '~': HOME is not set");
    return std::string(home) + path.substr(1);
}

// Desc: check option ranges and names
// In: const CacheOptions& opts
// Out: void; throws ValidationError
void ConfigManager::validate(const CacheOptions& opts) {
    if (opts.directory.empty()) throw ValidationError("'directory' must be non-empty");
    if (opts.name.empty() || opts.name.find('/') != std::string::npos) {
        throw ValidationError("'name' must be a non-empty file name");
    }
    if (opts.max_size <= 0)     throw ValidationError("'max_size' must be > 0");
    if (opts.iter_size <= 0)    throw ValidationError("'iter_size' must be > 0");
    if (opts.raw_max_size == 0) throw ValidationError("'raw_max_size' must be > 0");
    if (opts.timeout < 0)       throw ValidationError("'timeout' must be >= 0");
    if (!EvictorRegistry::instance().lookup(opts.evict_policy)) {
        throw ValidationError("unknown evict_policy '" + opts.evict_policy + "'");
    }

    static const std::regex ident(R"(^[A-Za-z_][A-Za-z0-9_]*$)");
    static const std::regex word(R"(^-?[A-Za-z0-9_]+$)");
    for (const auto& kv : opts.pragmas) {
        if (!std::regex_match(kv.first, ident)) {
            throw ValidationError("invalid pragma name '" + kv.first + "'");
        }
        if (!std::regex_match(kv.second, word)) {
            throw ValidationError("invalid value for pragma " + kv.first + ": '" + kv.second + "'");
        }
    }
}


// Desc: fill options from a JSON document; absent keys keep defaults
// In: const json& j
// Out: void; throws ValidationError
void ConfigManager::parse(const json& j) {
    if (!j.is_object()) throw ValidationError("configuration must be a JSON object");
    CacheOptions o;

    if (j.contains("directory")) {
        if (!j["directory"].is_string()) throw ValidationError("'directory' must be a string");
        o.directory = j["directory"].get<std::string>();
    }
    if (j.contains("name")) {
        if (!j["name"].is_string()) throw ValidationError("'name' must be a string");
        o.name = j["name"].get<std::string>();
    }
    if (j.contains("max_size")) {
        if (!j["max_size"].is_number_integer()) throw ValidationError("'max_size' must be an integer");
        o.max_size = j["max_size"].get<int64_t>();
    }
    if (j.contains("iter_size")) {
        if (!j["iter_size"].is_number_integer()) throw ValidationError("'iter_size' must be an integer");
        o.iter_size = j["iter_size"].get<int64_t>();
    }
    if (j.contains("evict_policy")) {
        if (!j["evict_policy"].is_string()) throw ValidationError("'evict_policy' must be a string");
        o.evict_policy = toLower(j["evict_policy"].get<std::string>());
    }
    if (j.contains("raw_max_size")) {
        const auto& r = j["raw_max_size"];
        if (r.is_string()) {
            o.raw_max_size = static_cast<size_t>(parse_size_kb_mb(r.get<std::string>()));
        } else if (r.is_number_integer()) {
            if (r.get<int64_t>() <= 0) throw ValidationError("'raw_max_size' must be > 0");
            o.raw_max_size = static_cast<size_t>(r.get<int64_t>());
        } else {
            throw ValidationError("'raw_max_size' must be like '128KB' or an integer");
        }
    }
    if (j.contains("timeout")) {
        if (!j["timeout"].is_number()) throw ValidationError("'timeout' must be a number");
        o.timeout = j["timeout"].get<double>();
    }
    if (j.contains("pragmas")) {
        const auto& p = j["pragmas"];
        if (!p.is_object()) throw ValidationError("'pragmas' must be an object");
        for (auto it = p.begin(); it != p.end(); ++it) {
            const json& v = it.value();
            if (v.is_string())               o.pragmas[it.key()] = v.get<std::string>();
            else if (v.is_number_integer())  o.pragmas[it.key()] = std::to_string(v.get<int64_t>());
            else if (v.is_boolean())         o.pragmas[it.key()] = v.get<bool>() ? "1" : "0";
            else throw ValidationError("pragma '" + it.key() + "' must be a string or integer");
        }
    }
    if (j.contains("log_path")) {
        if (!j["log_path"].is_string()) throw ValidationError("'log_path' must be a string");
        o.log_path = j["log_path"].get<std::string>();
    }

    o.directory = expand_home(o.directory);
    if (!o.log_path.empty()) o.log_path = expand_home(o.log_path);
    validate(o);
    options_ = std::move(o);
}

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }

    json j;
    try { file >> j; }
    catch (const json::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    try {
        parse(j);
    } catch (const ValidationError& e) {
        std::cerr << "[ConfigManager] " << e.what() << "\n";
        return false;
    }
    return true;
}
