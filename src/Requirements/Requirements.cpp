// requirements.cpp
#include "requirements.hpp"
#include "CachePolicy.hpp"
#include "Logger.hpp"
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>


// Desc: create directory (and missing parents) and record status
// In: const std::string& path, StartupResult& out
// Out: void
void Requirements::ensureDir(const std::string& path, StartupResult& out) {
    if (path.empty() || path == ".") return;
    for (size_t pos = path.find('/', 1); ; pos = path.find('/', pos + 1)) {
        const std::string part = path.substr(0, pos);
        if (::mkdir(part.c_str(), 0755) == -1 && errno != EEXIST) {
            out.logs.push_back("[ensureDir] failed: " + part + " (" + std::string(::strerror(errno)) + ")");
            return;
        }
        if (pos == std::string::npos) break;
    }
    out.logs.push_back("[ensureDir] ok: " + path);
}

// Desc: load JSON config into StartupResult::config (missing file keeps defaults)
// In: const std::string& config_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::loadConfig(const std::string& config_path, StartupResult& out) {
    if (::access(config_path.c_str(), F_OK) != 0) {
        out.logs.push_back("[config] " + config_path + " not found, using defaults");
        return true;
    }
    if (!out.config.loadFromFile(config_path)) {
        out.error = "[config] failed to load " + config_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[config] loaded: " + config_path);
    return true;
}

// Desc: validate size limits and that the cache patterns compile
// In: const ConfigManager& cfg, StartupResult& out
// Out: bool (true if valid)
bool Requirements::validateConfig(const ConfigManager& cfg, StartupResult& out) {
    const uint64_t max_bytes = cfg.max_cache_bytes();
    const uint64_t MIN_BYTES = 64 * 1024ULL;                       // 64KB
    const uint64_t MAX_BYTES = 4ULL * 1024ULL * 1024ULL * 1024ULL; // 4GB

    if (max_bytes < MIN_BYTES) {
        out.error = "[config] max_cache_size too small (<64KB)";
        out.logs.push_back(out.error);
        return false;
    }
    if (max_bytes > MAX_BYTES) {
        out.error = "[config] max_cache_size too large (>4GB)";
        out.logs.push_back(out.error);
        return false;
    }

    CachePolicy probe;
    if (!probe.buildFromConfig(cfg)) {
        out.error = "[config] cache patterns failed to compile";
        out.logs.push_back(out.error);
        return false;
    }

    out.logs.push_back("[config] max_cache_size: " + std::to_string(max_bytes) + " bytes");
    out.logs.push_back("[config] prewarm: " + std::string(cfg.auto_prewarm() ? "auto" : "manual")
                       + ", concurrency " + std::to_string(cfg.prewarm_concurrency()));
    out.logs.push_back("[config] patterns loaded: " + std::to_string(probe.patternCount()));
    out.logs.push_back("[config] validation ok");
    return true;
}

// Desc: open/init the SQLite metadata store
// In: const std::string& db_path, StartupResult& out
// Out: bool (true on success)
bool Requirements::initMetaStore(const std::string& db_path, StartupResult& out) {
    if (!out.meta.open(db_path)) {
        out.error = "[cache] failed to open metadata store: " + db_path;
        out.logs.push_back(out.error);
        return false;
    }
    out.logs.push_back("[cache] schema ok (meta)");
    return true;
}


// Desc: orchestrate startup: dirs, config, logger, metadata store
// In: const std::string& config_path, const std::string& db_path
// Out: StartupResult
StartupResult Requirements::run(const std::string& config_path,
                                const std::string& db_path) {
    StartupResult res;

    // 1) config load + validate
    if (!loadConfig(config_path, res) || !validateConfig(res.config, res)) {
        for (auto& l : res.logs) Logger::error("Requirements", l);
        return res;
    }

    // 2) dirs + log sink
    const std::string& log_path = res.config.getLogPath();
    const auto log_slash = log_path.find_last_of('/');
    if (log_slash != std::string::npos) ensureDir(log_path.substr(0, log_slash), res);
    Logger::init(log_path);

    const auto db_slash = db_path.find_last_of('/');
    if (db_slash != std::string::npos) ensureDir(db_path.substr(0, db_slash), res);

    // 3) metadata store + schema
    if (!initMetaStore(db_path, res)) {
        for (auto& l : res.logs) Logger::error("Requirements", l);
        return res;
    }

    res.ok = true;
    for (auto& l : res.logs) Logger::info("Requirements", l);
    return res;
}
