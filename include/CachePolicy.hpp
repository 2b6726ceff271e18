// include/CachePolicy.hpp
#pragma once
#include "HttpTypes.hpp"
#include "PatternMatcherHS.hpp"

#include <string>
#include <vector>

class ConfigManager;

// Decides whether a request may be served from / stored in the cache.
// Never-cache rules always win over static-asset rules.
class CachePolicy {
public:
    CachePolicy() = default;

    bool build(const std::vector<std::string>& never_cache,
               const std::vector<std::string>& static_assets);
    bool buildFromConfig(const ConfigManager& cfg);

    bool should_cache(const std::string& url, const std::string& method) const;
    bool should_cache(const HttpRequest& req) const;

    bool is_never_cache(const std::string& url) const { return never_.matches(url); }
    bool is_static_asset(const std::string& url) const { return static_.matches(url); }

    bool isReady() const { return ready_; }
    size_t patternCount() const { return never_.patternCount() + static_.patternCount(); }

    static const std::vector<std::string>& default_never_cache_patterns();
    static const std::vector<std::string>& default_static_patterns();

private:
    PatternMatcherHS never_;
    PatternMatcherHS static_;
    bool ready_{false};
};
