// === src/StorageManager/StorageManager.cpp ===
#include "StorageManager.hpp"
#include "CacheErrors.hpp"
#include "Logger.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <unistd.h>

using SteadyClock = std::chrono::steady_clock;

static const double kPragmaRetrySeconds = 60.0;

// Create tables query
static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS cache (
  key              BLOB    NOT NULL,
  key_format       INTEGER NOT NULL,
  value            BLOB,
  value_format     INTEGER NOT NULL,
  store_time       REAL    NOT NULL,
  expire_time      REAL,
  last_access_time REAL    NOT NULL,
  access_count     INTEGER NOT NULL DEFAULT 0
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_cache_key ON cache(key, key_format);
CREATE INDEX IF NOT EXISTS idx_cache_expire ON cache(expire_time);

CREATE TABLE IF NOT EXISTS meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)SQL";


const Pragmas& default_pragmas() {
    static const Pragmas p = {
        {"auto_vacuum",  "1"},
        {"cache_size",   "8192"},
        {"journal_mode", "wal"},
        {"temp_store",   "2"},
        {"mmap_size",    "67108864"},
        {"synchronous",  "1"},
        {"threads",      "4"},
    };
    return p;
}

void exec_sql(sqlite3* db, const char* sql, const char* what) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : sqlite3_errmsg(db);
        if (err) sqlite3_free(err);
        throw EngineError(std::string(what) + ": " + e);
    }
}


// ---------------------------
// Statement
// ---------------------------
Statement::Statement(sqlite3* db, const char* sql)
    : db_(db), stmt_(nullptr, &sqlite3_finalize) {
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
        throw EngineError(std::string("prepare failed: ") + sqlite3_errmsg(db) + " [" + sql + "]");
    }
    stmt_.reset(raw);
}

void Statement::check_bind(int rc, int idx) {
    if (rc != SQLITE_OK) {
        throw EngineError("bind #" + std::to_string(idx) + " failed: " + sqlite3_errmsg(db_));
    }
}

Statement& Statement::bind(int idx, const Value& v) {
    switch (v.type()) {
        case Value::Type::None:
            return bind_null(idx);
        case Value::Type::Integer:
            return bind_int64(idx, v.as_int());
        case Value::Type::Real:
            return bind_double(idx, v.as_real());
        case Value::Type::String:
            return bind_text(idx, v.as_string());
        case Value::Type::Bytes: {
            const Bytes& b = v.as_bytes();
            // sqlite3_bind_blob with a NULL pointer binds SQL NULL
            if (b.empty()) {
                check_bind(sqlite3_bind_zeroblob(stmt_.get(), idx, 0), idx);
            } else {
                check_bind(sqlite3_bind_blob(stmt_.get(), idx, b.data(),
                                             static_cast<int>(b.size()), SQLITE_TRANSIENT), idx);
            }
            return *this;
        }
        case Value::Type::Object:
            break;
    }
    throw EngineError("objects must be serialized before binding");
}

Statement& Statement::bind_int64(int idx, int64_t v) {
    check_bind(sqlite3_bind_int64(stmt_.get(), idx, static_cast<sqlite3_int64>(v)), idx);
    return *this;
}

Statement& Statement::bind_double(int idx, double v) {
    check_bind(sqlite3_bind_double(stmt_.get(), idx, v), idx);
    return *this;
}

Statement& Statement::bind_text(int idx, const std::string& v) {
    check_bind(sqlite3_bind_text(stmt_.get(), idx, v.c_str(),
                                 static_cast<int>(v.size()), SQLITE_TRANSIENT), idx);
    return *this;
}

Statement& Statement::bind_null(int idx) {
    check_bind(sqlite3_bind_null(stmt_.get(), idx), idx);
    return *this;
}

Statement& Statement::bind_time(int idx, const std::optional<double>& t) {
    return t ? bind_double(idx, *t) : bind_null(idx);
}

bool Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW)  return true;
    if (rc == SQLITE_DONE) return false;
    throw EngineError(std::string("step failed: ") + sqlite3_errmsg(db_) +
                      " [" + sqlite3_sql(stmt_.get()) + "]");
}

int Statement::run() {
    while (step()) {}
    return sqlite3_changes(db_);
}

void Statement::reset() {
    (void)sqlite3_reset(stmt_.get());
    (void)sqlite3_clear_bindings(stmt_.get());
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL;
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_.get(), col));
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_.get(), col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* t = sqlite3_column_text(stmt_.get(), col);
    const int n = sqlite3_column_bytes(stmt_.get(), col);
    return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(n)) : std::string();
}

// Desc: convert a result column into a Value, keeping its storage class
// In: int col
// Out: Value
Value Statement::column_value(int col) const {
    switch (sqlite3_column_type(stmt_.get(), col)) {
        case SQLITE_INTEGER:
            return Value(static_cast<long long>(sqlite3_column_int64(stmt_.get(), col)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt_.get(), col));
        case SQLITE_TEXT:
            return Value(column_text(col));
        case SQLITE_BLOB: {
            const auto* p = static_cast<const unsigned char*>(sqlite3_column_blob(stmt_.get(), col));
            const int n = sqlite3_column_bytes(stmt_.get(), col);
            return p ? Value(Bytes(p, p + n)) : Value(Bytes());
        }
        default:
            return Value();
    }
}

std::optional<double> Statement::column_time(int col) const {
    if (column_is_null(col)) return std::nullopt;
    return column_double(col);
}


// ---------------------------
// Migrations
// ---------------------------

// Desc: 0 -> 1, drop rows pointing at overflow files written before
//       reference counting existed
// In: sqlite3* db
// Out: void
static void migrate_0to1(sqlite3* db) {
    Statement del(db,
        "DELETE FROM cache "
        "WHERE key_format IN (2, 3, 5) OR value_format IN (2, 3, 5);");
    const int removed = del.run();
    Logger::info("StorageManager", "migrate 0->1: removed " + std::to_string(removed) +
                 " rows with unreferenced overflow files");
}

using MigrateFn = void (*)(sqlite3*);
static const MigrateFn kMigrations[] = {
    migrate_0to1,
};

static bool table_exists(sqlite3* db, const char* name) {
    Statement s(db, "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?;");
    s.bind_text(1, name);
    return s.step() && s.column_int64(0) > 0;
}


// ---------------------------
// StorageManager
// ---------------------------
StorageManager::StorageManager(std::string path, double timeout_sec, const Pragmas& pragmas)
    : path_(std::move(path)), timeout_sec_(timeout_sec), owner_pid_(::getpid()) {
    for (const auto& kv : pragmas) {
        pragmas_sql_ += "PRAGMA " + kv.first + "=" + kv.second + ";";
    }
}

StorageManager::~StorageManager() {
    close_all();
}

// Desc: find or create the session of the calling (pid, thread); sessions
//       inherited through fork() are abandoned without closing them
// In: (none)
// Out: Session&
StorageManager::Session& StorageManager::session_entry() {
    const pid_t pid = ::getpid();
    const SessionKey key{pid, std::this_thread::get_id()};

    std::lock_guard<std::mutex> lk(mu_);
    if (pid != owner_pid_) {
        // SQLite handles must never be used or closed across fork()
        sessions_.clear();
        owner_pid_ = pid;
        Logger::debug("StorageManager", "fork detected, dropped inherited connections of " + path_);
    }

    auto it = sessions_.find(key);
    if (it != sessions_.end()) return *it->second;

    auto s = std::make_unique<Session>();
    s->db = connect();
    Session& ref = *s;
    sessions_.emplace(key, std::move(s));
    return ref;
}

sqlite3* StorageManager::session() {
    return session_entry().db;
}

// Desc: open a connection and configure it
// In: (none)
// Out: sqlite3*; throws EngineError
sqlite3* StorageManager::connect() {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path_.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string e = std::string("[StorageManager] sqlite open failed: ") +
                        (raw ? sqlite3_errmsg(raw) : "unknown") + " (" + path_ + ")";
        if (raw) sqlite3_close(raw);
        throw EngineError(e);
    }
    sqlite3_busy_timeout(raw, static_cast<int>(timeout_sec_ * 1000.0));

    try {
        apply_pragmas(raw);
    } catch (...) {
        sqlite3_close(raw);
        throw;
    }
    return raw;
}

// Desc: run the pragma script, retrying lock contention for up to 60s
// In: sqlite3* db
// Out: void; throws EngineError
void StorageManager::apply_pragmas(sqlite3* db) {
    if (pragmas_sql_.empty()) return;
    const auto start = SteadyClock::now();
    while (true) {
        char* err = nullptr;
        const int rc = sqlite3_exec(db, pragmas_sql_.c_str(), nullptr, nullptr, &err);
        std::string e = err ? err : "";
        if (err) sqlite3_free(err);
        if (rc == SQLITE_OK) return;

        const int primary = rc & 0xff;
        const double waited = std::chrono::duration<double>(SteadyClock::now() - start).count();
        if ((primary != SQLITE_BUSY && primary != SQLITE_LOCKED) || waited > kPragmaRetrySeconds) {
            throw EngineError("[StorageManager] pragma setup failed: " + e);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

// Desc: create schema and bring the stored schema version up to date
// In: (none)
// Out: void; throws EngineError on a newer stored version
void StorageManager::open() {
    Transaction txn(*this);
    sqlite3* db = txn.db();

    const bool had_cache = table_exists(db, "cache");
    exec_sql(db, kSchemaSQL, "[StorageManager] schema exec failed");

    int stored = kSchemaMajor;
    if (auto v = meta_get("schema_major")) {
        try {
            stored = std::stoi(*v);
        } catch (const std::exception&) {
            throw EngineError("[StorageManager] corrupt schema_major '" + *v + "' in " + path_);
        }
    } else if (had_cache) {
        stored = 0;     // cache table written before versioning
    }

    if (stored > kSchemaMajor) {
        throw EngineError("[StorageManager] cannot downgrade " + path_ + " from schema " +
                          std::to_string(stored) + " to " + std::to_string(kSchemaMajor));
    }
    if (stored < kSchemaMajor) migrate(db, stored);

    meta_set("schema_major", std::to_string(kSchemaMajor));
    txn.commit();
    Logger::debug("StorageManager", "opened " + path_ + " (schema " + std::to_string(kSchemaMajor) + ")");
}

void StorageManager::migrate(sqlite3* db, int from_major) {
    for (int v = from_major; v < kSchemaMajor; ++v) {
        kMigrations[v](db);
    }
}

void StorageManager::close() {
    const SessionKey key{::getpid(), std::this_thread::get_id()};
    std::lock_guard<std::mutex> lk(mu_);
    if (key.pid != owner_pid_) return;
    auto it = sessions_.find(key);
    if (it == sessions_.end()) return;
    if (it->second->depth > 0) {
        throw EngineError("[StorageManager] close inside an open transaction on " + path_);
    }
    if (sqlite3_close_v2(it->second->db) != SQLITE_OK) {
        Logger::warn("StorageManager", std::string("close failed: ") + sqlite3_errmsg(it->second->db));
    }
    sessions_.erase(it);
}

void StorageManager::close_all() {
    std::lock_guard<std::mutex> lk(mu_);
    if (::getpid() == owner_pid_) {
        for (auto& kv : sessions_) {
            if (sqlite3_close_v2(kv.second->db) != SQLITE_OK) {
                Logger::warn("StorageManager", std::string("close failed: ") + sqlite3_errmsg(kv.second->db));
            }
        }
    }
    sessions_.clear();
}

void StorageManager::destroy() {
    close();
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::error_code ec;
        std::filesystem::remove(path_ + suffix, ec);
        if (ec) Logger::warn("StorageManager", "remove " + path_ + suffix + ": " + ec.message());
    }
}

std::optional<std::string> StorageManager::meta_get(const std::string& key) {
    Statement s(session(), "SELECT value FROM meta WHERE key=?;");
    s.bind_text(1, key);
    if (!s.step()) return std::nullopt;
    return s.column_text(0);
}

void StorageManager::meta_set(const std::string& key, const std::string& value) {
    Statement s(session(), "INSERT OR REPLACE INTO meta(key, value) VALUES(?, ?);");
    s.bind_text(1, key).bind_text(2, value);
    if (s.run() != 1) {
        throw EngineError("[StorageManager] meta_set(" + key + ") affected no row");
    }
}


// ---------------------------
// Transaction
// ---------------------------
Transaction::Transaction(StorageManager& storage, double timeout_sec)
    : session_(&storage.session_entry()), outermost_(session_->depth == 0) {
    if (outermost_) {
        const auto start = SteadyClock::now();
        while (true) {
            char* err = nullptr;
            const int rc = sqlite3_exec(session_->db, "BEGIN IMMEDIATE;", nullptr, nullptr, &err);
            std::string e = err ? err : "";
            if (err) sqlite3_free(err);
            if (rc == SQLITE_OK) break;

            const int primary = rc & 0xff;
            if (primary != SQLITE_BUSY && primary != SQLITE_LOCKED) {
                throw EngineError("[Transaction] BEGIN IMMEDIATE failed: " + e);
            }
            const double waited = std::chrono::duration<double>(SteadyClock::now() - start).count();
            if (timeout_sec >= 0 && waited >= timeout_sec) {
                throw LockTimeoutError("[Transaction] write lock not acquired within " +
                                       std::to_string(timeout_sec) + "s on " + storage.path());
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    ++session_->depth;
}

Transaction::~Transaction() {
    if (done_) return;
    --session_->depth;
    if (!outermost_) return;
    // a failed statement may already have ended the transaction
    if (sqlite3_get_autocommit(session_->db)) return;
    if (sqlite3_exec(session_->db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::error("Transaction", std::string("ROLLBACK failed: ") + sqlite3_errmsg(session_->db));
    }
}

void Transaction::commit() {
    if (done_) return;
    done_ = true;
    --session_->depth;
    if (!outermost_) return;

    char* err = nullptr;
    if (sqlite3_exec(session_->db, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::string e = err ? err : sqlite3_errmsg(session_->db);
        if (err) sqlite3_free(err);
        if (!sqlite3_get_autocommit(session_->db)) {
            (void)sqlite3_exec(session_->db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
        throw EngineError("[Transaction] COMMIT failed: " + e);
    }
}
