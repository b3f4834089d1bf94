// requirements.cpp
#include "requirements.hpp"
#include "CacheErrors.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <system_error>
#include <nlohmann/json.hpp>


// Desc: load JSON config into StartupResult::config
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (config_path.empty()) {
        try {
            out.config.parse(nlohmann::json::object());
        } catch (const ValidationError& e) {
            out.error = std::string("[config] invalid defaults: ") + e.what();
            out.logs.push_back(out.error);
            return false;
        }
        out.logs.push_back("[config] no file given, using defaults");
        return true;
    }
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back(std::string("[config] loaded: ") + config_path);
    return true;
}

// Desc: create directory (and parents) if missing and record status
// In: const std::string& path, StartupResult& out
// Out: bool (true when the directory exists afterwards)
bool Requirements::ensureDir(const std::string& path, StartupResult& out) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec || !std::filesystem::is_directory(path, ec)) {
        out.error = "[ensureDir] cannot create " + path + (ec ? ": " + ec.message() : "");
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
    return true;
}

void Requirements::initLogger(StartupResult& out) {
    const auto& o = out.config.options();
    Logger::set_path(o.log_path);
    out.logs.push_back("[log] " + (o.log_path.empty() ? std::string("stderr") : o.log_path));
}

// Desc: construct the namespace router over the configured directory
// In: StartupResult& out
// Out: bool (true on success)
bool Requirements::initRouter(StartupResult& out) {
    const auto& o = out.config.options();
    try {
        out.router = std::make_unique<NamespaceRouter>(o);
    } catch (const CacheError& e) {
        out.error = std::string("[cache] ") + e.what();
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[cache] directory=" + o.directory + " name=" + o.name +
                       " max_size=" + std::to_string(o.max_size) +
                       " evict_policy=" + o.evict_policy +
                       " raw_max_size=" + std::to_string(o.raw_max_size));
    return true;
}


// Desc: orchestrate startup: config, dirs, logger, router; log results
// In: const std::string& config_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path) {
    StartupResult res;

    auto flush = [&res]() {
        for (auto& l : res.logs) {
            if (l == res.error) Logger::error("Requirements", l);
            else Logger::info("Requirements", l);
        }
    };

    // 1) config load + validate
    if (!loadConfig(config_path, res)) {
        flush();
        return res;
    }

    // 2) logger, then dirs
    initLogger(res);
    const auto& o = res.config.options();
    if (!ensureDir(o.directory, res)) {
        flush();
        return res;
    }
    if (!o.log_path.empty()) {
        const auto parent = std::filesystem::path(o.log_path).parent_path();
        if (!parent.empty() && !ensureDir(parent.string(), res)) {
            flush();
            return res;
        }
    }

    // 3) router
    if (!initRouter(res)) {
        flush();
        return res;
    }

    // Ok
    res.ok = true;
    flush();
    return res;
}
