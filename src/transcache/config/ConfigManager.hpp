#pragma once

#include "LocalizerConfig.hpp"

#include <string>

#include <toml++/toml.h>

namespace transcache
{

/**
 * @brief Loads LocalizerConfig from a TOML file
 *
 * A missing file leaves the defaults in place. A file that fails to parse
 * also leaves the defaults, records lastError() and reports a Configuration
 * warning. Values outside their valid range are clamped with a warning.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "config.toml");

    bool load();
    bool loadFromString(const std::string& content);

    const LocalizerConfig& config() const { return config_; }
    const std::string& path() const { return config_path_; }
    const std::string& lastError() const { return last_error_; }

private:
    bool parse(const std::string& content, const std::string& origin);
    void apply(const toml::table& root);

    void applyLocalizer(const toml::table& section);
    void applyCache(const toml::table& section);
    void applyBackend(const toml::table& section);
    void applyLogging(const toml::table& section);

    long long clamped(const char* key, long long value, long long lo, long long hi);

    std::string config_path_;
    std::string last_error_;
    LocalizerConfig config_;
};

} // namespace transcache
