// include/StorageManager.hpp
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <sys/types.h>
#include <sqlite3.h>

#include "Value.hpp"

using Pragmas = std::map<std::string, std::string>;

// auto_vacuum, cache_size, journal_mode, temp_store, mmap_size, synchronous, threads
const Pragmas& default_pragmas();

// Run a SQL script on db; throws EngineError with sqlite's message.
void exec_sql(sqlite3* db, const char* sql, const char* what);

// Prepared statement; every bind/step is checked and failures throw EngineError.
class Statement {
public:
    Statement(sqlite3* db, const char* sql);

    Statement& bind(int idx, const Value& v);
    Statement& bind_int64(int idx, int64_t v);
    Statement& bind_double(int idx, double v);
    Statement& bind_text(int idx, const std::string& v);
    Statement& bind_null(int idx);
    // NULL when t is empty ("never expires")
    Statement& bind_time(int idx, const std::optional<double>& t);

    bool step();       // true while a row is available
    int  run();        // step to completion, returns sqlite3_changes()
    void reset();

    bool        column_is_null(int col) const;
    int64_t     column_int64(int col) const;
    double      column_double(int col) const;
    std::string column_text(int col) const;
    Value       column_value(int col) const;
    std::optional<double> column_time(int col) const;

private:
    void check_bind(int rc, int idx);

    sqlite3* db_;
    std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> stmt_;
};

class Transaction;

// Owns the per (process, thread) SQLite connections of one store file,
// its schema and its schema version.
class StorageManager {
public:
    static constexpr int kSchemaMajor = 1;

    StorageManager(std::string path, double timeout_sec, const Pragmas& pragmas);
    ~StorageManager();

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    // create tables/indexes and check/migrate the schema version
    void open();

    // connection of the calling thread (created on first use)
    sqlite3* session();

    // close the calling thread's connection; other threads keep theirs
    void close();
    // close the calling thread's connection and remove the file with its
    // -wal/-shm companions. Connections of other threads stay valid (on the
    // unlinked file) until the manager is destroyed.
    void destroy();

    std::optional<std::string> meta_get(const std::string& key);
    void meta_set(const std::string& key, const std::string& value);

    const std::string& path() const { return path_; }

private:
    friend class Transaction;

    struct Session {
        sqlite3* db = nullptr;
        int depth = 0;        // open transaction scopes on this connection
    };
    struct SessionKey {
        pid_t pid;
        std::thread::id tid;
        bool operator==(const SessionKey& o) const noexcept { return pid == o.pid && tid == o.tid; }
    };
    struct SessionKeyHash {
        size_t operator()(const SessionKey& k) const noexcept {
            size_t x = std::hash<std::thread::id>()(k.tid);
            x ^= static_cast<size_t>(k.pid) + 0x9e3779b97f4a7c15ULL + (x << 6) + (x >> 2);
            return x;
        }
    };

    Session& session_entry();
    sqlite3* connect();
    // only once no Transaction can be alive, i.e. from the destructor
    void close_all();
    void apply_pragmas(sqlite3* db);
    void migrate(sqlite3* db, int from_major);

    std::string path_;
    double timeout_sec_;
    std::string pragmas_sql_;

    std::mutex mu_;
    pid_t owner_pid_;
    std::unordered_map<SessionKey, std::unique_ptr<Session>, SessionKeyHash> sessions_;
};

// Reentrant write transaction on the calling thread's connection.
// The outermost scope issues BEGIN IMMEDIATE and owns COMMIT/ROLLBACK;
// a scope left without commit() rolls back.
class Transaction {
public:
    // timeout_sec < 0: retry lock contention forever
    explicit Transaction(StorageManager& storage, double timeout_sec = -1.0);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    sqlite3* db() const { return session_->db; }
    bool outermost() const { return outermost_; }
    void commit();

private:
    StorageManager::Session* session_;
    bool outermost_;
    bool done_ = false;
};
