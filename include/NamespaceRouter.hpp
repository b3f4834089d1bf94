// include/NamespaceRouter.hpp
#pragma once
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "CacheEngine.hpp"
#include "ConfigManager.hpp"

// Routes every call to the CacheEngine of its tag. Engines are opened on
// first use and share the directory (and thus the overflow files).
//
// get_recipe() hands out shared ownership: a call keeps its engine alive
// until it returns, even if the tag is dropped meanwhile.
class NamespaceRouter {
public:
    static const char* const kDefaultTag;

    explicit NamespaceRouter(CacheOptions opts);

    NamespaceRouter(const NamespaceRouter&) = delete;
    NamespaceRouter& operator=(const NamespaceRouter&) = delete;

    // engine of tag, opened on first use
    std::shared_ptr<CacheEngine> get_recipe(const std::string& tag = kDefaultTag);

    bool set(const Value& key, const Value& value, Timeout timeout = std::nullopt,
             const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->set(key, value, timeout);
    }
    bool ex_set(const Value& key, const Value& value, Timeout timeout = std::nullopt,
                const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->ex_set(key, value, timeout);
    }
    std::optional<Value> get(const Value& key, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->get(key);
    }
    Value get(const Value& key, const Value& dflt, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->get(key, dflt);
    }
    std::map<Value, Value> get_many(const std::vector<Value>& keys, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->get_many(keys);
    }
    Value incr(const Value& key, const Value& delta = Value(1), const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->incr(key, delta);
    }
    Value decr(const Value& key, const Value& delta = Value(1), const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->decr(key, delta);
    }
    bool touch(const Value& key, Timeout timeout, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->touch(key, timeout);
    }
    bool erase(const Value& key, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->erase(key);
    }
    std::optional<Value> pop(const Value& key, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->pop(key);
    }
    Value pop(const Value& key, const Value& dflt, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->pop(key, dflt);
    }
    std::optional<double> ttl(const Value& key, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->ttl(key);
    }
    std::optional<CacheRecord> inspect(const Value& key, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->inspect(key);
    }
    bool exists(const Value& key, const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->exists(key);
    }
    std::vector<Value> keys(const std::string& tag = kDefaultTag) { return get_recipe(tag)->keys(); }
    std::vector<Value> values(const std::string& tag = kDefaultTag) { return get_recipe(tag)->values(); }
    std::vector<std::pair<Value, Value>> items(const std::string& tag = kDefaultTag) {
        return get_recipe(tag)->items();
    }

    // release the tag's overflow references and delete its store
    bool drop(const std::string& tag);
    // clear every opened namespace
    void clear();
    // sum of the opened namespaces' counters
    int64_t len() const;
    std::vector<std::string> tags() const;

    const CacheOptions& options() const { return opts_; }
    std::string location(const std::string& tag = kDefaultTag) const;

private:
    CacheOptions opts_;
    mutable std::shared_mutex mu_;
    std::map<std::string, std::shared_ptr<CacheEngine>> engines_;
};
