// === src/MetaStore/MetaStore.cpp ===
#include "MetaStore.hpp"
#include "Logger.hpp"


static const char* kSchemaSQL = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
  key   TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)SQL";


MetaStore::MetaStore()
    : db_(nullptr, [](sqlite3* p){ if (p) sqlite3_close(p); }) {}


// Desc: open/init SQLite metadata DB and apply schema
// In: const std::string& db_path
// Out: bool (true on success)
bool MetaStore::open(const std::string& db_path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(db_path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        Logger::error("MetaStore", std::string("sqlite open failed: ") + (raw ? sqlite3_errmsg(raw) : "unknown"));
        if (raw) sqlite3_close(raw);
        return false;
    }
    sqlite3_busy_timeout(raw, 5000);
    if (db_path != ":memory:") {
        sqlite3_exec(raw, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        sqlite3_exec(raw, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    }
    db_.reset(raw);

    if (!exec(kSchemaSQL)) {
        db_.reset();
        return false;
    }
    return true;
}


bool MetaStore::exec(const char* sql) {
    if (!db_) return false;
    char* err = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
        Logger::error("MetaStore", std::string("exec failed: ") + (err ? err : "unknown"));
        if (err) sqlite3_free(err);
        return false;
    }
    return true;
}


// Desc: read one value from meta
// In: const std::string& key
// Out: std::optional<std::string> (empty if absent or on error)
std::optional<std::string> MetaStore::get(const std::string& key) const {
    if (!db_) return std::nullopt;

    sqlite3_stmt* s = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "SELECT value FROM meta WHERE key=?", -1, &s, nullptr) != SQLITE_OK) {
        Logger::error("MetaStore", std::string("prepare failed: ") + sqlite3_errmsg(db_.get()));
        return std::nullopt;
    }
    sqlite3_bind_text(s, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> out;
    if (sqlite3_step(s) == SQLITE_ROW) {
        const unsigned char* t = sqlite3_column_text(s, 0);
        if (t) out = std::string(reinterpret_cast<const char*>(t),
                                 static_cast<size_t>(sqlite3_column_bytes(s, 0)));
    }
    (void)sqlite3_finalize(s);
    return out;
}


// Desc: upsert one value into meta
// In: const std::string& key, const std::string& value
// Out: bool
bool MetaStore::put(const std::string& key, const std::string& value) {
    if (!db_) return false;

    sqlite3_stmt* u = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "INSERT OR REPLACE INTO meta(key,value) VALUES(?,?)", -1, &u, nullptr) != SQLITE_OK) {
        Logger::error("MetaStore", std::string("prepare failed: ") + sqlite3_errmsg(db_.get()));
        return false;
    }
    sqlite3_bind_text(u, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(u, 2, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    const int rc = sqlite3_step(u);
    (void)sqlite3_finalize(u);
    if (rc != SQLITE_DONE) {
        Logger::warn("MetaStore", "write skipped for '" + key + "': " + sqlite3_errmsg(db_.get()));
        return false;
    }
    return true;
}


bool MetaStore::erase(const std::string& key) {
    if (!db_) return false;

    sqlite3_stmt* d = nullptr;
    if (sqlite3_prepare_v2(db_.get(), "DELETE FROM meta WHERE key=?", -1, &d, nullptr) != SQLITE_OK) {
        Logger::error("MetaStore", std::string("prepare failed: ") + sqlite3_errmsg(db_.get()));
        return false;
    }
    sqlite3_bind_text(d, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(d);
    (void)sqlite3_finalize(d);
    return rc == SQLITE_DONE;
}


bool MetaStore::begin()  { return exec("BEGIN IMMEDIATE;"); }
bool MetaStore::commit() { return exec("COMMIT;"); }

void MetaStore::rollback() {
    if (db_) sqlite3_exec(db_.get(), "ROLLBACK;", nullptr, nullptr, nullptr);
}
