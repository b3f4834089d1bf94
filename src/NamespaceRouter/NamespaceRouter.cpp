// === src/NamespaceRouter/NamespaceRouter.cpp ===
#include "NamespaceRouter.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <mutex>

const char* const NamespaceRouter::kDefaultTag = "default";

NamespaceRouter::NamespaceRouter(CacheOptions opts) : opts_(std::move(opts)) {
    ConfigManager::validate(opts_);
}

std::string NamespaceRouter::location(const std::string& tag) const {
    return opts_.directory + "/" + tag + ":" + opts_.name;
}

// Desc: shared lock for the common case, exclusive lock to open a new engine
// In: const std::string& tag
// Out: std::shared_ptr<CacheEngine>
std::shared_ptr<CacheEngine> NamespaceRouter::get_recipe(const std::string& tag) {
    {
        std::shared_lock<std::shared_mutex> rlk(mu_);
        auto it = engines_.find(tag);
        if (it != engines_.end()) return it->second;
    }

    std::unique_lock<std::shared_mutex> wlk(mu_);
    auto it = engines_.find(tag);
    if (it != engines_.end()) return it->second;

    auto engine = std::make_shared<CacheEngine>(opts_, tag);
    engines_.emplace(tag, engine);
    Logger::info("NamespaceRouter", "opened namespace '" + tag + "'");
    return engine;
}

// Desc: destroy one namespace; a tag never opened is opened first when its
//       file exists so its overflow references are released too. Calls
//       still running on the old engine keep it alive until they return.
// In: const std::string& tag
// Out: bool (false when nothing existed)
bool NamespaceRouter::drop(const std::string& tag) {
    std::unique_lock<std::shared_mutex> wlk(mu_);
    std::shared_ptr<CacheEngine> engine;

    auto it = engines_.find(tag);
    if (it != engines_.end()) {
        engine = std::move(it->second);
        engines_.erase(it);
    } else {
        std::error_code ec;
        if (!std::filesystem::exists(location(tag), ec)) return false;
        engine = std::make_shared<CacheEngine>(opts_, tag);
    }

    engine->destroy();
    Logger::info("NamespaceRouter", "dropped namespace '" + tag + "'");
    return true;
}

void NamespaceRouter::clear() {
    std::vector<std::shared_ptr<CacheEngine>> opened;
    {
        std::shared_lock<std::shared_mutex> rlk(mu_);
        for (const auto& kv : engines_) opened.push_back(kv.second);
    }
    for (auto& e : opened) e->clear();
}

int64_t NamespaceRouter::len() const {
    std::shared_lock<std::shared_mutex> rlk(mu_);
    int64_t total = 0;
    for (const auto& kv : engines_) total += kv.second->len();
    return total;
}

std::vector<std::string> NamespaceRouter::tags() const {
    std::shared_lock<std::shared_mutex> rlk(mu_);
    std::vector<std::string> out;
    for (const auto& kv : engines_) out.push_back(kv.first);
    return out;
}
