// requirements.hpp
#pragma once
#include "ConfigManager.hpp"
#include "MetaStore.hpp"
#include <string>
#include <vector>

struct StartupResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> logs;
    ConfigManager config;
    MetaStore meta;
};

class Requirements {
public:
    static StartupResult run(const std::string& config_path,
                             const std::string& db_path);

private:
    static void ensureDir(const std::string& path, StartupResult& out);
    static bool loadConfig(const std::string& config_path,
                           StartupResult& out);
    static bool validateConfig(const ConfigManager& cfg,
                               StartupResult& out);
    static bool initMetaStore(const std::string& db_path,
                              StartupResult& out);
};
