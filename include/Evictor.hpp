// include/Evictor.hpp
#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

// Eviction policy. run() removes up to batch rows, lowest ranked first,
// and appends the overflow digests the removed rows referenced to orphans.
class Evictor {
public:
    virtual ~Evictor() = default;

    virtual const char* name() const = 0;
    virtual const char* index_name() const = 0;
    virtual void create_index(sqlite3* db) const = 0;
    virtual int run(sqlite3* db, int batch, std::vector<std::string>& orphans) const = 0;

protected:
    // SELECT ... ORDER BY order_by LIMIT batch, then delete each row by rowid
    static int evict_ordered(sqlite3* db, const char* order_by, int batch,
                             std::vector<std::string>& orphans);
};

class LruEvictor : public Evictor {
public:
    const char* name() const override { return "lru"; }
    const char* index_name() const override { return "idx_evict_lru"; }
    void create_index(sqlite3* db) const override;
    int run(sqlite3* db, int batch, std::vector<std::string>& orphans) const override;
};

class LfuEvictor : public Evictor {
public:
    const char* name() const override { return "lfu"; }
    const char* index_name() const override { return "idx_evict_lfu"; }
    void create_index(sqlite3* db) const override;
    int run(sqlite3* db, int batch, std::vector<std::string>& orphans) const override;
};

class FifoEvictor : public Evictor {
public:
    const char* name() const override { return "fifo"; }
    const char* index_name() const override { return "idx_evict_fifo"; }
    void create_index(sqlite3* db) const override;
    int run(sqlite3* db, int batch, std::vector<std::string>& orphans) const override;
};

// Soonest-expiring first, rows without expiry last. Rides on the schema's
// idx_cache_expire so it creates nothing.
class DefaultEvictor : public Evictor {
public:
    const char* name() const override { return "default"; }
    const char* index_name() const override { return "idx_cache_expire"; }
    void create_index(sqlite3*) const override {}
    int run(sqlite3* db, int batch, std::vector<std::string>& orphans) const override;
};

// Drop every idx_evict_* index that is not ev's, then create ev's index.
void install(sqlite3* db, const Evictor& ev);

class EvictorRegistry {
public:
    using Factory = std::function<std::unique_ptr<Evictor>()>;

    // lru, lfu, fifo and default are registered up front
    static EvictorRegistry& instance();

    // false when name is already taken
    bool register_policy(const std::string& name, Factory factory);
    // nullptr for an unknown name
    std::unique_ptr<Evictor> lookup(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    EvictorRegistry();

    mutable std::mutex mu_;
    std::map<std::string, Factory> factories_;
};
