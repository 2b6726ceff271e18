// include/MetaStore.hpp
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <sqlite3.h>

// Durable key/value metadata over an SQLite 'meta' table. Failures are
// logged and reported through return values; nothing here throws.
class MetaStore {
public:
    static constexpr const char* kBuildVersionKey     = "build_version";
    static constexpr const char* kDiscoveredAssetsKey = "discovered_assets";
    static constexpr const char* kCacheStatsKey       = "cache_stats";

    MetaStore();

    // Open (creating if needed) and apply the schema. ":memory:" works.
    bool open(const std::string& db_path);
    bool isOpen() const { return db_ != nullptr; }
    sqlite3* handle() const { return db_.get(); }

    std::optional<std::string> get(const std::string& key) const;
    bool put(const std::string& key, const std::string& value);
    bool erase(const std::string& key);

    bool begin();
    bool commit();
    void rollback();

private:
    bool exec(const char* sql);

    std::unique_ptr<sqlite3, void(*)(sqlite3*)> db_;
};
