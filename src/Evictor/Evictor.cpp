// === src/Evictor/Evictor.cpp ===
#include "Evictor.hpp"
#include "Logger.hpp"
#include "StorageManager.hpp"

// Desc: remove the batch lowest ranked rows and collect their overflow digests
// In: sqlite3* db, const char* order_by, int batch, std::vector<std::string>& orphans
// Out: int (rows removed)
int Evictor::evict_ordered(sqlite3* db, const char* order_by, int batch,
                           std::vector<std::string>& orphans) {
    if (!db || batch <= 0) return 0;

    // 1) overflow digests of the victims
    const std::string victims =
        std::string("SELECT rowid FROM cache ORDER BY ") + order_by + " LIMIT ?";
    const std::string sel_sql =
        "SELECT key, key_format, value, value_format FROM cache WHERE rowid IN (" + victims +
        ") AND (key_format IN (2, 3, 5) OR value_format IN (2, 3, 5));";
    {
        Statement sel(db, sel_sql.c_str());
        sel.bind_int64(1, batch);
        while (sel.step()) {
            if (is_file_format(static_cast<DataFormat>(sel.column_int64(1)))) {
                orphans.push_back(sel.column_text(0));
            }
            if (is_file_format(static_cast<DataFormat>(sel.column_int64(3)))) {
                orphans.push_back(sel.column_text(2));
            }
        }
    }

    // 2) one ordered, limited delete of the same rows
    const std::string del_sql = "DELETE FROM cache WHERE rowid IN (" + victims + ");";
    Statement del(db, del_sql.c_str());
    del.bind_int64(1, batch);
    return del.run();
}

void LruEvictor::create_index(sqlite3* db) const {
    exec_sql(db, "CREATE INDEX IF NOT EXISTS idx_evict_lru ON cache(last_access_time);",
             "[Evictor] create idx_evict_lru");
}

int LruEvictor::run(sqlite3* db, int batch, std::vector<std::string>& orphans) const {
    return evict_ordered(db, "last_access_time ASC, rowid ASC", batch, orphans);
}

void LfuEvictor::create_index(sqlite3* db) const {
    exec_sql(db, "CREATE INDEX IF NOT EXISTS idx_evict_lfu ON cache(access_count);",
             "[Evictor] create idx_evict_lfu");
}

int LfuEvictor::run(sqlite3* db, int batch, std::vector<std::string>& orphans) const {
    return evict_ordered(db, "access_count ASC, rowid ASC", batch, orphans);
}

void FifoEvictor::create_index(sqlite3* db) const {
    exec_sql(db, "CREATE INDEX IF NOT EXISTS idx_evict_fifo ON cache(store_time);",
             "[Evictor] create idx_evict_fifo");
}

int FifoEvictor::run(sqlite3* db, int batch, std::vector<std::string>& orphans) const {
    return evict_ordered(db, "store_time ASC, rowid ASC", batch, orphans);
}

int DefaultEvictor::run(sqlite3* db, int batch, std::vector<std::string>& orphans) const {
    return evict_ordered(db, "expire_time IS NULL, expire_time ASC, rowid ASC", batch, orphans);
}


// Desc: make ev's supporting index the only idx_evict_* index of the table
// In: sqlite3* db, const Evictor& ev
// Out: void
void install(sqlite3* db, const Evictor& ev) {
    std::vector<std::string> stale;
    {
        Statement s(db,
            "SELECT name FROM sqlite_master "
            "WHERE type='index' AND tbl_name='cache' AND name LIKE 'idx_evict_%';");
        while (s.step()) {
            std::string idx = s.column_text(0);
            if (idx != ev.index_name()) stale.push_back(idx);
        }
    }
    for (const auto& idx : stale) {
        const std::string sql = "DROP INDEX IF EXISTS \"" + idx + "\";";
        exec_sql(db, sql.c_str(), "[Evictor] drop index");
        Logger::debug("Evictor", "dropped " + idx);
    }
    ev.create_index(db);
}


// ---------------------------
// EvictorRegistry
// ---------------------------
EvictorRegistry::EvictorRegistry() {
    factories_["lru"]     = [] { return std::make_unique<LruEvictor>(); };
    factories_["lfu"]     = [] { return std::make_unique<LfuEvictor>(); };
    factories_["fifo"]    = [] { return std::make_unique<FifoEvictor>(); };
    factories_["default"] = [] { return std::make_unique<DefaultEvictor>(); };
}

EvictorRegistry& EvictorRegistry::instance() {
    static EvictorRegistry reg;
    return reg;
}

bool EvictorRegistry::register_policy(const std::string& name, Factory factory) {
    if (name.empty() || !factory) return false;
    std::lock_guard<std::mutex> lk(mu_);
    return factories_.emplace(name, std::move(factory)).second;
}

std::unique_ptr<Evictor> EvictorRegistry::lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = factories_.find(name);
    if (it == factories_.end()) return nullptr;
    return it->second();
}

std::vector<std::string> EvictorRegistry::names() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& kv : factories_) out.push_back(kv.first);
    return out;
}
