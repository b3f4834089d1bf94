// include/CacheEngine.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CacheCounter.hpp"
#include "ConfigManager.hpp"
#include "Evictor.hpp"
#include "StorageManager.hpp"
#include "Value.hpp"
#include "ValueStore.hpp"

// Seconds from now; empty means the entry never expires. Zero or negative
// values produce an entry that is already expired.
using Timeout = std::optional<double>;

// Full stored row of a key, as returned by CacheEngine::inspect().
struct CacheRecord {
    Value key;
    DataFormat key_format = DataFormat::Raw;
    std::optional<Value> value;          // empty when the overflow file is gone
    DataFormat value_format = DataFormat::Raw;
    Value stored_key;                    // payloads as kept in the table
    Value stored_value;
    double store_time = 0;
    std::optional<double> expire_time;
    double last_access_time = 0;
    int64_t access_count = 0;
};

// Wall clock in seconds since the epoch.
double now_seconds();

// One namespace: a SQLite file, its overflow files, a Counter and an
// eviction policy.
class CacheEngine {
public:
    CacheEngine(const CacheOptions& opts, const std::string& tag);

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    bool set(const Value& key, const Value& value, Timeout timeout = std::nullopt);
    // false without writing when a live entry exists
    bool ex_set(const Value& key, const Value& value, Timeout timeout = std::nullopt);

    std::optional<Value> get(const Value& key);
    Value get(const Value& key, const Value& dflt);
    // misses are left out of the result
    std::map<Value, Value> get_many(const std::vector<Value>& keys);

    // throws NotFoundError / TypeMismatchError
    Value incr(const Value& key, const Value& delta = Value(1));
    Value decr(const Value& key, const Value& delta = Value(1));

    bool touch(const Value& key, Timeout timeout);
    bool erase(const Value& key);
    std::optional<Value> pop(const Value& key);
    Value pop(const Value& key, const Value& dflt);

    // -1 for a miss, empty for "never expires", else seconds left
    std::optional<double> ttl(const Value& key);
    std::optional<CacheRecord> inspect(const Value& key);
    bool exists(const Value& key);

    std::vector<Value> keys();
    std::vector<Value> values();
    std::vector<std::pair<Value, Value>> items();

    void clear();
    int64_t len() const { return counter_.count(); }
    const std::string& location() const { return storage_.path(); }
    const std::string& tag() const { return tag_; }
    const char* evict_policy() const { return evictor_->name(); }

    // close the calling thread's connection; the next call reopens it
    void close();
    // clear and remove the backing files; other threads' connections are
    // released with the engine
    void destroy();

private:
    struct Row {
        int64_t rowid = 0;
        Value key;
        DataFormat key_format = DataFormat::Raw;
        Value value;
        DataFormat value_format = DataFormat::Raw;
        std::optional<double> expire_time;

        bool live(double now) const { return !expire_time || *expire_time > now; }
    };
    using ScanSink = std::function<void(std::optional<Value>&&, std::optional<Value>&&)>;

    std::optional<Row> find_row(sqlite3* db, const ValueStore::Dumped& sk);
    bool write_entry(const Value& key, const Value& value, Timeout timeout, bool only_if_missing);
    Value apply_delta(const Value& key, const Value& delta, bool subtract);
    std::optional<Value> read_entry(sqlite3* db, const ValueStore::Dumped& sk,
                                    std::vector<std::string>& orphans);
    bool delete_row(sqlite3* db, const Row& row, std::vector<std::string>& orphans,
                    bool must_exist = true);
    void sweep(sqlite3* db, std::vector<std::string>& orphans);
    int64_t count_live(sqlite3* db, double now);
    void scan(bool want_key, bool want_value, const ScanSink& sink);
    void release_refs(const std::vector<std::string>& sigs);

    static void collect_refs(const Row& row, std::vector<std::string>& orphans);

    std::string tag_;
    int64_t max_size_;
    int64_t iter_size_;
    ValueStore store_;
    StorageManager storage_;
    CacheCounter counter_;
    std::unique_ptr<Evictor> evictor_;
};
