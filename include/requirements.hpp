// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include "NamespaceRouter.hpp"
#include <memory>
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    std::unique_ptr<NamespaceRouter> router;
};

class Requirements {
public:
    // empty config_path: built-in defaults
    static StartupResult run(const std::string& config_path);

private:
    static bool loadConfig(const std::string& config_path, StartupResult& out);
    static bool ensureDir(const std::string& path, StartupResult& out);
    static void initLogger(StartupResult& out);
    static bool initRouter(StartupResult& out);
};
