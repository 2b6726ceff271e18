// main.cpp
#include "CacheEngine.hpp"
#include "CurlFetcher.hpp"
#include "Discovery.hpp"
#include "Logger.hpp"
#include "VersionGuard.hpp"
#include "requirements.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
using nlohmann::json;

void print_help() {
    std::cout << "Usage:\n"
              << "  ./assetcache                              Init, auto prewarm, print stats (default)\n"
              << "  ./assetcache fetch <url>...               Fetch through the cache\n"
              << "  ./assetcache prewarm <url-file>           Prewarm URLs listed one per line\n"
              << "  ./assetcache manifest <url>               Prewarm from a {\"preload\": [...]} manifest\n"
              << "  ./assetcache discover <html> <page-url>   Record assets referenced by a page snapshot\n"
              << "  ./assetcache stats                        Print the persisted statistics\n"
              << "  ./assetcache clear                        Erase persisted discovery and statistics\n"
              << "  ./assetcache -h, --help                   Show this help message\n";
}

// curl_global_init for the process lifetime
struct CurlGlobal {
    bool ok = CurlFetcher::global_init();
    ~CurlGlobal() { if (ok) CurlFetcher::global_cleanup(); }
};

// Desc: build id from config, falling back to the bundle hash
// In: const ConfigManager& cfg
// Out: std::string (empty if neither is usable)
static std::string resolve_build_id(const ConfigManager& cfg) {
    if (!cfg.getBuildId().empty()) return cfg.getBuildId();
    if (cfg.getBuildBundle().empty()) return {};
    std::string id = VersionGuard::build_id_from_bundle(cfg.getBuildBundle());
    if (id.empty()) Logger::warn("Main", "cannot hash build bundle: " + cfg.getBuildBundle());
    return id;
}

static void print_progress(const PrewarmProgress& p) {
    std::cout << "[Prewarm] " << p.completed << "/" << p.total
              << " (" << p.percent << "%, " << p.failed << " failed)\n";
}

static void print_result(const PrewarmResult& r) {
    if (r.rejected) {
        std::cout << "[Prewarm] rejected: another run is active\n";
        return;
    }
    std::cout << "[Prewarm] done: " << r.success << " ok, " << r.failed << " failed, "
              << r.skipped << " skipped\n";
}

// Desc: read non-empty, non-comment lines from a file
// In: const std::string& path, std::vector<std::string>& out
// Out: bool (false if the file cannot be opened)
static bool read_url_file(const std::string& path, std::vector<std::string>& out) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string line;
    while (std::getline(in, line)) {
        const auto b = line.find_first_not_of(" \t\r");
        if (b == std::string::npos || line[b] == '#') continue;
        const auto e = line.find_last_not_of(" \t\r");
        out.push_back(line.substr(b, e - b + 1));
    }
    return true;
}

static int cmd_fetch(CacheEngine& engine, int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " fetch <url>...\n";
        return 1;
    }
    int rc = 0;
    std::vector<std::string> fetched;
    for (int i = 2; i < argc; ++i) {
        HttpRequest req;
        req.url = argv[i];
        const auto hits_before = engine.stats().hitCount;
        try {
            const HttpResponse resp = engine.fetcher().fetch(req);
            const bool hit = engine.stats().hitCount > hits_before;
            std::cout << resp.status << " " << resp.body.size() << "B "
                      << (hit ? "HIT " : "MISS ") << req.url << "\n";
            if (resp.ok()) fetched.push_back(req.url);
        } catch (const FetchError& e) {
            std::cerr << "[Main] fetch failed: " << req.url << ": " << e.what() << "\n";
            rc = 1;
        }
    }
    (void)engine.record_discovered(fetched);
    return rc;
}

static int cmd_prewarm(CacheEngine& engine, int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " prewarm <url-file>\n";
        return 1;
    }
    std::vector<std::string> urls;
    if (!read_url_file(argv[2], urls)) {
        std::cerr << "[Main] cannot open url file: " << argv[2] << "\n";
        return 1;
    }
    const PrewarmResult r = engine.prewarm(urls, print_progress);
    print_result(r);
    (void)engine.record_discovered(urls);
    return r.rejected ? 1 : 0;
}

static int cmd_manifest(CacheEngine& engine, int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " manifest <url>\n";
        return 1;
    }
    const PrewarmResult r = engine.prewarm_from_manifest(argv[2], print_progress);
    print_result(r);
    (void)engine.record_discovered({});
    return r.rejected ? 1 : 0;
}

static int cmd_discover(CacheEngine& engine, int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " discover <html-file> <page-url>\n";
        return 1;
    }
    std::ifstream in(argv[2]);
    if (!in.is_open()) {
        std::cerr << "[Main] cannot open html file: " << argv[2] << "\n";
        return 1;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    const auto urls = Discovery::from_document(ss.str(), argv[3]);
    for (const auto& u : urls) std::cout << u << "\n";
    return engine.record_discovered(urls) ? 0 : 1;
}

static int cmd_stats(const MetaStore& meta) {
    auto snapshot = load_cache_stats(meta);
    if (!snapshot) {
        std::cout << "no statistics recorded\n";
        return 0;
    }
    snapshot->discoveredAssetCount = Discovery::load(meta).size();
    std::cout << json(*snapshot).dump(2) << "\n";
    return 0;
}


int main(int argc, char** argv) {
    // Handle help flag early
    const std::string cmd = argc > 1 ? argv[1] : "";
    if (cmd == "-h" || cmd == "--help") {
        print_help();
        return 0;
    }
    const char* db_env = std::getenv("ASSETCACHE_DB");
    std::string db_path = db_env ? db_env : "cache/assetcache.sqlite";

    auto boot = Requirements::run("./config.json", db_path);
    if (!boot.ok) {
        std::cerr << "[Main] aborted: " << boot.error << "\n";
        return 1;
    }

    if (cmd == "stats") return cmd_stats(boot.meta);

    CurlGlobal curl;
    if (!curl.ok) {
        std::cerr << "[Main] aborted: curl initialization failed\n";
        return 1;
    }
    CurlFetcher network(boot.config.request_timeout_sec());
    CacheEngine engine(boot.config, boot.meta, network);

    if (cmd == "clear") {
        engine.clear(true);
        return 0;
    }

    engine.init(resolve_build_id(boot.config));

    int rc = 0;
    if (cmd == "fetch")         rc = cmd_fetch(engine, argc, argv);
    else if (cmd == "prewarm")  rc = cmd_prewarm(engine, argc, argv);
    else if (cmd == "manifest") rc = cmd_manifest(engine, argc, argv);
    else if (cmd == "discover") rc = cmd_discover(engine, argc, argv);
    else if (cmd.empty()) {
        engine.auto_prewarm(print_progress);
        std::cout << json(engine.stats()).dump(2) << "\n";
    } else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_help();
        return 1;
    }

    (void)engine.persist_stats();
    return rc;
}
