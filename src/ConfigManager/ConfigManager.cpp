// === ConfigManager.cpp ===
#include "ConfigManager.hpp"
#include "CachePolicy.hpp"

#include <fstream>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
using nlohmann::json;


// Desc: trim leading and trailing spaces inplace
// In: std::string& t
// Out: void
static inline void trim_inplace(std::string& t) {
    t.erase(t.begin(), std::find_if(t.begin(), t.end(), [](unsigned char c){ return !std::isspace(c); }));
    t.erase(std::find_if(t.rbegin(), t.rend(), [](unsigned char c){ return !std::isspace(c); }).base(), t.end());
}


ConfigManager::ConfigManager()
    : never_cache_patterns_(CachePolicy::default_never_cache_patterns()),
      static_patterns_(CachePolicy::default_static_patterns()) {}


// Desc: parse size string (KB/MB/GB) into bytes
// In: const std::string& raw
// Out: std::uint64_t (bytes); throws on invalid input
std::uint64_t ConfigManager::parse_size(const std::string& raw) {
    std::string in = raw;
    trim_inplace(in);

    static const std::regex re(R"(^([0-9]+)\s*([kKmMgG][bB]?)$)");
    std::smatch m;
    if (!std::regex_match(in, m, re)) {
        throw std::runtime_error("invalid format (only KB/MB/GB allowed): '" + raw + "'");
    }

    std::uint64_t n = 0;
    try {
        n = std::stoull(m[1].str());
    } catch (const std::exception&) {
        throw std::runtime_error("invalid number : '" + raw + "'");
    }

    std::string unit = m[2].str();
    for (auto& c : unit) c = (char)std::toupper((unsigned char)c);

    std::uint64_t mult = 0;
    if (unit == "K" || unit == "KB") mult = 1024ULL;
    else if (unit == "M" || unit == "MB") mult = 1024ULL * 1024ULL;
    else if (unit == "G" || unit == "GB") mult = 1024ULL * 1024ULL * 1024ULL;
    else throw std::runtime_error("unreachable unit");

    if (n > std::numeric_limits<std::uint64_t>::max() / mult) {
        throw std::runtime_error("size too large: '" + raw + "'");
    }
    return n * mult;
}


// Desc: read a string-or-array-of-strings field
// In: const json& j, const char* key, std::vector<std::string>& out
// Out: bool (false if present with the wrong type)
static bool read_pattern_list(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key)) return true;
    const auto& v = j[key];
    if (v.is_string()) {
        out = { v.get<std::string>() };
        return true;
    }
    if (v.is_array()) {
        std::vector<std::string> pats;
        for (const auto& p : v) {
            if (!p.is_string()) {
                std::cerr << "[ConfigManager] '" << key << "' must contain only strings\n";
                return false;
            }
            pats.push_back(p.get<std::string>());
        }
        out = std::move(pats);
        return true;
    }
    std::cerr << "[ConfigManager] '" << key << "' must be string or array of strings\n";
    return false;
}


bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "[ConfigManager] cannot open file: " << config_path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return loadFromString(ss.str());
}


bool ConfigManager::loadFromString(const std::string& json_text) {
    json j;
    try { j = json::parse(json_text); }
    catch (const std::exception& e) { std::cerr << "[ConfigManager] invalid JSON: " << e.what() << "\n"; return false; }

    if (!j.is_object()) { std::cerr << "[ConfigManager] top level must be an object\n"; return false; }

    // sizes
    if (j.contains("max_cache_size")) {
        if (!j["max_cache_size"].is_string()) {
            std::cerr << "[ConfigManager] 'max_cache_size' must be a string like '256MB'\n";
            return false;
        }
        try { cache_capacity_bytes_ = parse_size(j["max_cache_size"].get<std::string>()); }
        catch (const std::exception&) { std::cerr << "[ConfigManager] 'max_cache_size' must be like '512KB', '256MB' or '1GB'\n"; return false; }
        if (cache_capacity_bytes_ == 0) { std::cerr << "[ConfigManager] 'max_cache_size' must be > 0\n"; return false; }
    }

    // prewarm
    if (j.contains("auto_prewarm")) {
        if (!j["auto_prewarm"].is_boolean()) { std::cerr << "[ConfigManager] 'auto_prewarm' must be boolean\n"; return false; }
        auto_prewarm_ = j["auto_prewarm"].get<bool>();
    }
    if (j.contains("prewarm_concurrency")) {
        if (!j["prewarm_concurrency"].is_number_integer()) { std::cerr << "[ConfigManager] 'prewarm_concurrency' must be integer\n"; return false; }
        const int c = j["prewarm_concurrency"].get<int>();
        if (c < 1 || c > 16) { std::cerr << "[ConfigManager] 'prewarm_concurrency' must be in 1..16\n"; return false; }
        prewarm_concurrency_ = c;
    }
    if (j.contains("discovered_cap")) {
        if (!j["discovered_cap"].is_number_integer() || j["discovered_cap"].get<long long>() <= 0) {
            std::cerr << "[ConfigManager] 'discovered_cap' must be a positive integer\n";
            return false;
        }
        discovered_cap_ = j["discovered_cap"].get<std::size_t>();
    }
    if (j.contains("request_timeout_sec")) {
        if (!j["request_timeout_sec"].is_number_integer() || j["request_timeout_sec"].get<long>() < 0) {
            std::cerr << "[ConfigManager] 'request_timeout_sec' must be a non-negative integer\n";
            return false;
        }
        request_timeout_sec_ = j["request_timeout_sec"].get<long>();
    }

    // build identity
    if (j.contains("build_id")) {
        if (!j["build_id"].is_string()) { std::cerr << "[ConfigManager] 'build_id' must be a string\n"; return false; }
        build_id_ = j["build_id"].get<std::string>();
    }
    if (j.contains("build_bundle")) {
        if (!j["build_bundle"].is_string()) { std::cerr << "[ConfigManager] 'build_bundle' must be a path string\n"; return false; }
        build_bundle_ = j["build_bundle"].get<std::string>();
    }

    if (j.contains("log_path")) {
        if (!j["log_path"].is_string()) { std::cerr << "[ConfigManager] 'log_path' must be a string\n"; return false; }
        log_path_ = j["log_path"].get<std::string>();
    }

    // patterns (Hyperscan compiles/validates later)
    if (!read_pattern_list(j, "never_cache_patterns", never_cache_patterns_)) return false;
    if (!read_pattern_list(j, "static_patterns", static_patterns_)) return false;

    return true;
}
