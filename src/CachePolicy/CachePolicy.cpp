#include "CachePolicy.hpp"
#include "ConfigManager.hpp"
#include "Logger.hpp"

#include <cctype>


// Desc: built-in exclusion rules (api, identity, realtime, hot reload, query)
// In: (none)
// Out: const std::vector<std::string>&
const std::vector<std::string>& CachePolicy::default_never_cache_patterns() {
    static const std::vector<std::string> kNever = {
        // api
        R"(/api/)",
        // identity providers
        R"(/auth/)",
        R"(oauth)",
        R"(accounts\.google\.com)",
        R"(securetoken)",
        R"(identitytoolkit)",
        R"(firebaseapp\.com)",
        // realtime game servers and sockets
        R"(^wss?://)",
        R"(socket\.io)",
        R"(colyseus)",
        R"(/matchmake/)",
        // hot reload
        R"(hot-update)",
        R"(__webpack_hmr)",
        R"(sockjs-node)",
        // dynamic content
        R"(\?)",
    };
    return kNever;
}

const std::vector<std::string>& CachePolicy::default_static_patterns() {
    static const std::vector<std::string> kStatic = {
        R"(\.(png|jpe?g|gif|webp|svg|ico|avif)$)",
        R"(\.(mp3|ogg|wav|m4a|webm)$)",
        R"(\.(woff2?|ttf|otf|eot)$)",
        R"(\.(json|xml|atlas|fnt)$)",
        R"(/assets/)",
        R"(/static/)",
        R"(/tilesets/)",
    };
    return kStatic;
}


bool CachePolicy::build(const std::vector<std::string>& never_cache,
                        const std::vector<std::string>& static_assets) {
    ready_ = false;
    if (!never_.build(never_cache)) {
        Logger::error("CachePolicy", "never-cache rules failed to compile");
        return false;
    }
    if (!static_.build(static_assets)) {
        Logger::error("CachePolicy", "static-asset rules failed to compile");
        return false;
    }
    ready_ = true;
    return true;
}

bool CachePolicy::buildFromConfig(const ConfigManager& cfg) {
    return build(cfg.getNeverCachePatterns(), cfg.getStaticPatterns());
}


// Desc: classify a URL + method as cacheable
// In: const std::string& url, const std::string& method
// Out: bool (true only for GET on a static, non-excluded URL)
bool CachePolicy::should_cache(const std::string& url, const std::string& method) const {
    if (!ready_ || url.empty()) return false;

    if (method.size() != 3 ||
        std::toupper((unsigned char)method[0]) != 'G' ||
        std::toupper((unsigned char)method[1]) != 'E' ||
        std::toupper((unsigned char)method[2]) != 'T') {
        return false;
    }

    if (never_.matches(url)) return false;
    return static_.matches(url);
}

bool CachePolicy::should_cache(const HttpRequest& req) const {
    if (!req.body.empty()) return false;
    return should_cache(canonical_url(req.url), req.method);
}
