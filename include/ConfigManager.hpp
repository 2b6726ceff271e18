// include/ConfigManager.hpp
#pragma once
#include <vector>
#include <string>
#include <cstdint>

class ConfigManager {
public:
    ConfigManager();
    bool loadFromFile(const std::string& config_path);
    bool loadFromString(const std::string& json_text);

    const std::vector<std::string>& getNeverCachePatterns() const { return never_cache_patterns_; }
    const std::vector<std::string>& getStaticPatterns()     const { return static_patterns_; }

    const std::string& getBuildId()     const { return build_id_; }
    const std::string& getBuildBundle() const { return build_bundle_; }
    const std::string& getLogPath()     const { return log_path_; }

    std::uint64_t max_cache_bytes()     const { return cache_capacity_bytes_; }
    bool          auto_prewarm()        const { return auto_prewarm_; }
    int           prewarm_concurrency() const { return prewarm_concurrency_; }
    std::size_t   discovered_cap()      const { return discovered_cap_; }
    long          request_timeout_sec() const { return request_timeout_sec_; }

    static std::uint64_t parse_size(const std::string& s);

private:
    std::vector<std::string> never_cache_patterns_;
    std::vector<std::string> static_patterns_;
    std::string build_id_;
    std::string build_bundle_;
    std::string log_path_ = "logs/assetcache.log";
    std::uint64_t cache_capacity_bytes_ = 256ULL * 1024ULL * 1024ULL;
    bool auto_prewarm_ = true;
    int prewarm_concurrency_ = 3;
    std::size_t discovered_cap_ = 500;
    long request_timeout_sec_ = 30;
};
