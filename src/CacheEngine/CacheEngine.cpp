// === src/CacheEngine/CacheEngine.cpp ===
#include "CacheEngine.hpp"
#include "CacheErrors.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

static const char* kLiveClause = "(expire_time IS NULL OR expire_time > ?)";

double now_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

static std::optional<double> expire_at(const Timeout& timeout, double now) {
    if (!timeout) return std::nullopt;
    return now + *timeout;
}

// Desc: open (or create) the namespace file and bring policy and counter in line
// In: const CacheOptions& opts, const std::string& tag
// Out: -; throws ValidationError / EngineError
CacheEngine::CacheEngine(const CacheOptions& opts, const std::string& tag)
    : tag_(tag),
      max_size_(opts.max_size),
      iter_size_(opts.iter_size),
      store_(opts.directory, opts.raw_max_size),
      storage_(opts.directory + "/" + tag + ":" + opts.name, opts.timeout, opts.pragmas),
      counter_(opts.max_size),
      evictor_(EvictorRegistry::instance().lookup(opts.evict_policy)) {
    if (!evictor_) throw ValidationError("unknown evict_policy '" + opts.evict_policy + "'");
    if (tag.empty() || tag.find('/') != std::string::npos) {
        throw ValidationError("invalid namespace tag '" + tag + "'");
    }

    std::error_code ec;
    std::filesystem::create_directories(opts.directory, ec);
    if (ec) throw EngineError("[CacheEngine] cannot create " + opts.directory + ": " + ec.message());

    storage_.open();

    Transaction txn(storage_);
    install(txn.db(), *evictor_);
    const auto prev = storage_.meta_get("evict_policy");
    if (!prev || *prev != evictor_->name()) {
        storage_.meta_set("evict_policy", evictor_->name());
        if (prev) Logger::info("CacheEngine", tag_ + ": evict policy " + *prev + " -> " + evictor_->name());
    }
    counter_.align(count_live(txn.db(), now_seconds()));
    txn.commit();

    Logger::debug("CacheEngine", "opened " + location() + " policy=" + evictor_->name() +
                  " count=" + std::to_string(counter_.count()));
}


// ---------------------------
// helpers
// ---------------------------
void CacheEngine::collect_refs(const Row& row, std::vector<std::string>& orphans) {
    if (is_file_format(row.key_format))   orphans.push_back(row.key.as_string());
    if (is_file_format(row.value_format)) orphans.push_back(row.value.as_string());
}

// Desc: drop overflow references once the rows using them are gone
// In: const std::vector<std::string>& sigs
// Out: void (failures are logged, the rows are already committed)
void CacheEngine::release_refs(const std::vector<std::string>& sigs) {
    for (const auto& sig : sigs) {
        try {
            store_.release(sig);
        } catch (const CacheError& e) {
            Logger::warn("CacheEngine", "release " + sig + " failed: " + e.what());
        }
    }
}

std::optional<CacheEngine::Row> CacheEngine::find_row(sqlite3* db, const ValueStore::Dumped& sk) {
    Statement s(db,
        "SELECT rowid, key, key_format, value, value_format, expire_time "
        "FROM cache WHERE key=? AND key_format=?;");
    s.bind(1, sk.first).bind_int64(2, static_cast<int64_t>(sk.second));
    if (!s.step()) return std::nullopt;

    Row r;
    r.rowid        = s.column_int64(0);
    r.key          = s.column_value(1);
    r.key_format   = static_cast<DataFormat>(s.column_int64(2));
    r.value        = s.column_value(3);
    r.value_format = static_cast<DataFormat>(s.column_int64(4));
    r.expire_time  = s.column_time(5);
    return r;
}

bool CacheEngine::delete_row(sqlite3* db, const Row& row, std::vector<std::string>& orphans,
                             bool must_exist) {
    Statement del(db, "DELETE FROM cache WHERE rowid=?;");
    del.bind_int64(1, row.rowid);
    if (del.run() != 1) {
        if (must_exist) {
            throw EngineError("[CacheEngine] row " + std::to_string(row.rowid) + " vanished during delete");
        }
        return false;
    }
    collect_refs(row, orphans);
    counter_.sub(1);
    return true;
}

int64_t CacheEngine::count_live(sqlite3* db, double now) {
    const std::string sql = std::string("SELECT COUNT(*) FROM cache WHERE ") + kLiveClause + ";";
    Statement s(db, sql.c_str());
    s.bind_double(1, now);
    return s.step() ? s.column_int64(0) : 0;
}

// Desc: two-phase eviction; expired rows first, then a policy batch while
//       the live count is still at or above max_size
// In: sqlite3* db (inside a write transaction), std::vector<std::string>& orphans
// Out: void
void CacheEngine::sweep(sqlite3* db, std::vector<std::string>& orphans) {
    const double now = now_seconds();

    // 1) expired rows
    {
        Statement sel(db,
            "SELECT key, key_format, value, value_format FROM cache "
            "WHERE expire_time IS NOT NULL AND expire_time <= ? "
            "AND (key_format IN (2, 3, 5) OR value_format IN (2, 3, 5));");
        sel.bind_double(1, now);
        while (sel.step()) {
            if (is_file_format(static_cast<DataFormat>(sel.column_int64(1)))) orphans.push_back(sel.column_text(0));
            if (is_file_format(static_cast<DataFormat>(sel.column_int64(3)))) orphans.push_back(sel.column_text(2));
        }
    }
    Statement del(db, "DELETE FROM cache WHERE expire_time IS NOT NULL AND expire_time <= ?;");
    del.bind_double(1, now);
    const int expired = del.run();
    counter_.sub(expired);

    const int64_t live = count_live(db, now);
    counter_.align(live);
    if (live < max_size_) {
        Logger::debug("CacheEngine", tag_ + ": sweep removed " + std::to_string(expired) + " expired rows");
        return;
    }

    // 2) policy batch
    const int batch = static_cast<int>(std::max<int64_t>(max_size_ / 100, 2));
    const int evicted = evictor_->run(db, batch, orphans);
    counter_.sub(evicted);
    Logger::debug("CacheEngine", tag_ + ": sweep removed " + std::to_string(expired) +
                  " expired and " + std::to_string(evicted) + " " + evictor_->name() + " rows");
}


// ---------------------------
// writes
// ---------------------------

// Desc: shared body of set() and ex_set()
// In: key, value, timeout, bool only_if_missing
// Out: bool (false when only_if_missing and a live row exists)
bool CacheEngine::write_entry(const Value& key, const Value& value, Timeout timeout,
                              bool only_if_missing) {
    const ValueStore::Dumped sk = store_.signature(key);
    std::vector<std::string> taken;     // references this call added
    std::vector<std::string> orphans;   // references to drop after commit

    try {
        Transaction txn(storage_);
        sqlite3* db = txn.db();
        const double now = now_seconds();
        const auto row = find_row(db, sk);

        if (row && only_if_missing && row->live(now)) {
            txn.commit();
            return false;
        }

        const ValueStore::Dumped sv = store_.dump(value);
        if (is_file_format(sv.second)) taken.push_back(sv.first.as_string());

        if (row) {
            if (is_file_format(row->value_format)) orphans.push_back(row->value.as_string());

            if (!row->live(now)) {
                Statement up(db,
                    "UPDATE cache SET value=?, value_format=?, store_time=?, expire_time=?, "
                    "last_access_time=?, access_count=0 WHERE rowid=?;");
                up.bind(1, sv.first).bind_int64(2, static_cast<int64_t>(sv.second))
                  .bind_double(3, now).bind_time(4, expire_at(timeout, now))
                  .bind_double(5, now).bind_int64(6, row->rowid);
                if (up.run() != 1) throw EngineError("[CacheEngine] reset of expired row affected no row");
            } else {
                Statement up(db,
                    "UPDATE cache SET value=?, value_format=?, expire_time=?, "
                    "last_access_time=?, access_count=access_count+1 WHERE rowid=?;");
                up.bind(1, sv.first).bind_int64(2, static_cast<int64_t>(sv.second))
                  .bind_time(3, expire_at(timeout, now))
                  .bind_double(4, now).bind_int64(5, row->rowid);
                if (up.run() != 1) throw EngineError("[CacheEngine] update affected no row");
            }
        } else {
            const ValueStore::Dumped dk = store_.dump(key);
            if (is_file_format(dk.second)) taken.push_back(dk.first.as_string());

            Statement ins(db,
                "INSERT INTO cache(key, key_format, value, value_format, store_time, "
                "expire_time, last_access_time, access_count) VALUES(?, ?, ?, ?, ?, ?, ?, 0);");
            ins.bind(1, dk.first).bind_int64(2, static_cast<int64_t>(dk.second))
               .bind(3, sv.first).bind_int64(4, static_cast<int64_t>(sv.second))
               .bind_double(5, now).bind_time(6, expire_at(timeout, now)).bind_double(7, now);
            if (ins.run() != 1) throw EngineError("[CacheEngine] insert affected no row");

            if (!counter_.add(1)) sweep(db, orphans);
        }
        txn.commit();
    } catch (const std::exception&) {
        release_refs(taken);
        throw;
    }

    release_refs(orphans);
    return true;
}

bool CacheEngine::set(const Value& key, const Value& value, Timeout timeout) {
    return write_entry(key, value, timeout, false);
}

bool CacheEngine::ex_set(const Value& key, const Value& value, Timeout timeout) {
    return write_entry(key, value, timeout, true);
}

// Desc: add (or subtract) delta to a live numeric entry with one SQL UPDATE
// In: const Value& key, const Value& delta, bool subtract
// Out: Value (stored result); throws NotFoundError / TypeMismatchError
Value CacheEngine::apply_delta(const Value& key, const Value& delta, bool subtract) {
    if (!delta.is_number()) {
        throw TypeMismatchError("unsupported delta type for incr/decr: " + delta.to_string());
    }
    const ValueStore::Dumped sk = store_.signature(key);

    Transaction txn(storage_);
    sqlite3* db = txn.db();
    const auto row = find_row(db, sk);
    if (!row || !row->live(now_seconds())) {
        throw NotFoundError("key " + key.to_string() + " not found in cache");
    }
    if (row->value_format != DataFormat::Number || !row->value.is_number()) {
        throw TypeMismatchError("value of " + key.to_string() + " is not a number");
    }

    Statement up(db, subtract ? "UPDATE cache SET value = value - ? WHERE rowid=?;"
                              : "UPDATE cache SET value = value + ? WHERE rowid=?;");
    up.bind(1, delta).bind_int64(2, row->rowid);
    if (up.run() != 1) throw EngineError("[CacheEngine] increment of " + key.to_string() + " affected no row");

    Statement sel(db, "SELECT value FROM cache WHERE rowid=?;");
    sel.bind_int64(1, row->rowid);
    if (!sel.step()) throw EngineError("[CacheEngine] row of " + key.to_string() + " vanished after increment");
    Value result = sel.column_value(0);
    txn.commit();
    return result;
}

Value CacheEngine::incr(const Value& key, const Value& delta) {
    return apply_delta(key, delta, false);
}

Value CacheEngine::decr(const Value& key, const Value& delta) {
    return apply_delta(key, delta, true);
}

bool CacheEngine::touch(const Value& key, Timeout timeout) {
    const ValueStore::Dumped sk = store_.signature(key);
    const double now = now_seconds();
    const std::string sql =
        std::string("UPDATE cache SET expire_time=? WHERE key=? AND key_format=? AND ") + kLiveClause + ";";

    Transaction txn(storage_);
    Statement up(txn.db(), sql.c_str());
    up.bind_time(1, expire_at(timeout, now)).bind(2, sk.first)
      .bind_int64(3, static_cast<int64_t>(sk.second)).bind_double(4, now);
    const bool ok = up.run() == 1;
    txn.commit();
    return ok;
}

bool CacheEngine::erase(const Value& key) {
    const ValueStore::Dumped sk = store_.signature(key);
    std::vector<std::string> orphans;
    {
        Transaction txn(storage_);
        const auto row = find_row(txn.db(), sk);
        if (!row) {
            txn.commit();
            return false;
        }
        delete_row(txn.db(), *row, orphans);
        txn.commit();
    }
    release_refs(orphans);
    return true;
}

void CacheEngine::clear() {
    std::vector<std::string> orphans;
    {
        Transaction txn(storage_);
        Statement sel(txn.db(),
            "SELECT key, key_format, value, value_format FROM cache "
            "WHERE key_format IN (2, 3, 5) OR value_format IN (2, 3, 5);");
        while (sel.step()) {
            if (is_file_format(static_cast<DataFormat>(sel.column_int64(1)))) orphans.push_back(sel.column_text(0));
            if (is_file_format(static_cast<DataFormat>(sel.column_int64(3)))) orphans.push_back(sel.column_text(2));
        }
        exec_sql(txn.db(), "DELETE FROM cache;", "[CacheEngine] clear");
        txn.commit();
    }
    counter_.reset();
    release_refs(orphans);
    Logger::info("CacheEngine", tag_ + ": cleared, released " + std::to_string(orphans.size()) + " overflow refs");
}


// ---------------------------
// reads
// ---------------------------

// Desc: lookup inside an open transaction; bumps access stats on a hit and
//       deletes a row whose overflow content is gone
// In: sqlite3* db, const ValueStore::Dumped& sk, std::vector<std::string>& orphans
// Out: std::optional<Value>
std::optional<Value> CacheEngine::read_entry(sqlite3* db, const ValueStore::Dumped& sk,
                                             std::vector<std::string>& orphans) {
    const double now = now_seconds();
    const auto row = find_row(db, sk);
    if (!row || !row->live(now)) return std::nullopt;

    std::optional<Value> v = store_.load(row->value, row->value_format);
    if (!v) {
        delete_row(db, *row, orphans);
        return std::nullopt;
    }

    Statement up(db, "UPDATE cache SET access_count=access_count+1, last_access_time=? WHERE rowid=?;");
    up.bind_double(1, now).bind_int64(2, row->rowid);
    if (up.run() != 1) throw EngineError("[CacheEngine] access update affected no row");
    return v;
}

std::optional<Value> CacheEngine::get(const Value& key) {
    const ValueStore::Dumped sk = store_.signature(key);
    std::vector<std::string> orphans;
    std::optional<Value> v;
    {
        Transaction txn(storage_);
        v = read_entry(txn.db(), sk, orphans);
        txn.commit();
    }
    release_refs(orphans);
    return v;
}

Value CacheEngine::get(const Value& key, const Value& dflt) {
    auto v = get(key);
    return v ? std::move(*v) : dflt;
}

std::map<Value, Value> CacheEngine::get_many(const std::vector<Value>& keys) {
    std::map<Value, Value> out;
    std::vector<std::string> orphans;
    {
        Transaction txn(storage_);
        for (const auto& k : keys) {
            auto v = read_entry(txn.db(), store_.signature(k), orphans);
            if (v) out.emplace(k, std::move(*v));
        }
        txn.commit();
    }
    release_refs(orphans);
    return out;
}

std::optional<Value> CacheEngine::pop(const Value& key) {
    const ValueStore::Dumped sk = store_.signature(key);
    std::vector<std::string> orphans;
    std::optional<Value> v;
    {
        Transaction txn(storage_);
        v = read_entry(txn.db(), sk, orphans);
        if (v) {
            const auto row = find_row(txn.db(), sk);
            if (!row) throw EngineError("[CacheEngine] row of " + key.to_string() + " vanished during pop");
            delete_row(txn.db(), *row, orphans);
        }
        txn.commit();
    }
    release_refs(orphans);
    return v;
}

Value CacheEngine::pop(const Value& key, const Value& dflt) {
    auto v = pop(key);
    return v ? std::move(*v) : dflt;
}

std::optional<double> CacheEngine::ttl(const Value& key) {
    const ValueStore::Dumped sk = store_.signature(key);
    const double now = now_seconds();

    Transaction txn(storage_);
    const auto row = find_row(txn.db(), sk);
    if (!row || !row->live(now)) {
        txn.commit();
        return -1.0;
    }
    Statement up(txn.db(), "UPDATE cache SET access_count=access_count+1, last_access_time=? WHERE rowid=?;");
    up.bind_double(1, now).bind_int64(2, row->rowid);
    if (up.run() != 1) throw EngineError("[CacheEngine] access update affected no row");
    txn.commit();

    if (!row->expire_time) return std::nullopt;
    return *row->expire_time - now;
}

// Desc: the raw stored row of key, expired or not; no stats are touched
// In: const Value& key
// Out: std::optional<CacheRecord>
std::optional<CacheRecord> CacheEngine::inspect(const Value& key) {
    const ValueStore::Dumped sk = store_.signature(key);
    Statement s(storage_.session(),
        "SELECT key, key_format, value, value_format, store_time, expire_time, "
        "last_access_time, access_count FROM cache WHERE key=? AND key_format=?;");
    s.bind(1, sk.first).bind_int64(2, static_cast<int64_t>(sk.second));
    if (!s.step()) return std::nullopt;

    CacheRecord rec;
    rec.stored_key       = s.column_value(0);
    rec.key_format       = static_cast<DataFormat>(s.column_int64(1));
    rec.stored_value     = s.column_value(2);
    rec.value_format     = static_cast<DataFormat>(s.column_int64(3));
    rec.store_time       = s.column_double(4);
    rec.expire_time      = s.column_time(5);
    rec.last_access_time = s.column_double(6);
    rec.access_count     = s.column_int64(7);

    auto k = store_.load(rec.stored_key, rec.key_format);
    rec.key   = k ? std::move(*k) : key;
    rec.value = store_.load(rec.stored_value, rec.value_format);
    return rec;
}

bool CacheEngine::exists(const Value& key) {
    const ValueStore::Dumped sk = store_.signature(key);
    const std::string sql =
        std::string("SELECT 1 FROM cache WHERE key=? AND key_format=? AND ") + kLiveClause + ";";
    Statement s(storage_.session(), sql.c_str());
    s.bind(1, sk.first).bind_int64(2, static_cast<int64_t>(sk.second)).bind_double(3, now_seconds());
    return s.step();
}


// ---------------------------
// scans
// ---------------------------

// Desc: walk live rows by store_time in windows of iter_size rows; rows whose
//       overflow content is gone are deleted between windows
// In: bool want_key, bool want_value, const ScanSink& sink
// Out: void
void CacheEngine::scan(bool want_key, bool want_value, const ScanSink& sink) {
    const double now = now_seconds();
    const std::string sql =
        std::string("SELECT rowid, key, key_format, value, value_format, expire_time FROM cache WHERE ") +
        kLiveClause + " ORDER BY store_time, rowid LIMIT ? OFFSET ?;";

    int64_t offset = 0;
    while (true) {
        std::vector<Row> stale;
        int64_t fetched = 0;
        {
            Statement s(storage_.session(), sql.c_str());
            s.bind_double(1, now).bind_int64(2, iter_size_).bind_int64(3, offset);
            while (s.step()) {
                ++fetched;
                Row r;
                r.rowid        = s.column_int64(0);
                r.key          = s.column_value(1);
                r.key_format   = static_cast<DataFormat>(s.column_int64(2));
                r.value        = s.column_value(3);
                r.value_format = static_cast<DataFormat>(s.column_int64(4));
                r.expire_time  = s.column_time(5);

                std::optional<Value> k, v;
                if (want_key)   k = store_.load(r.key, r.key_format);
                if (want_value) v = store_.load(r.value, r.value_format);
                if ((want_key && !k) || (want_value && !v)) {
                    stale.push_back(std::move(r));
                    continue;
                }
                sink(std::move(k), std::move(v));
            }
        }

        if (!stale.empty()) {
            std::vector<std::string> orphans;
            {
                Transaction txn(storage_);
                // another process may have removed them since the window was read
                for (const auto& r : stale) delete_row(txn.db(), r, orphans, false);
                txn.commit();
            }
            release_refs(orphans);
            Logger::debug("CacheEngine", tag_ + ": scan dropped " + std::to_string(stale.size()) + " tombstoned rows");
        }

        if (fetched < iter_size_) break;
        offset += fetched - static_cast<int64_t>(stale.size());
    }
}

std::vector<Value> CacheEngine::keys() {
    std::vector<Value> out;
    scan(true, false, [&](std::optional<Value>&& k, std::optional<Value>&&) {
        out.push_back(std::move(*k));
    });
    return out;
}

std::vector<Value> CacheEngine::values() {
    std::vector<Value> out;
    scan(false, true, [&](std::optional<Value>&&, std::optional<Value>&& v) {
        out.push_back(std::move(*v));
    });
    return out;
}

std::vector<std::pair<Value, Value>> CacheEngine::items() {
    std::vector<std::pair<Value, Value>> out;
    scan(true, true, [&](std::optional<Value>&& k, std::optional<Value>&& v) {
        out.emplace_back(std::move(*k), std::move(*v));
    });
    return out;
}


void CacheEngine::close() {
    storage_.close();
}

void CacheEngine::destroy() {
    clear();
    storage_.destroy();
    Logger::info("CacheEngine", "destroyed " + location());
}
