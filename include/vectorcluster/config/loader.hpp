#pragma once
#include <vectorcluster/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    // Throws std::runtime_error naming the offending field
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};
