#pragma once

#include <sift/result.hpp>
#include <sift/log.hpp>
#include <string>
#include <vector>
#include <optional>

namespace sift {

struct FilterConfig {
    std::string root = ".";
    std::vector<std::string> includes;
    std::vector<std::string> excludes;
};

struct LogConfig {
    log::Level level = log::Info;
    bool color = false;
};

// Layered configuration: global ~/.sift/config.toml, then a project file.
// Later layers override scalar settings and extend the pattern lists.
struct Config {
    FilterConfig filter;
    LogConfig logging;
    // Track which scalar fields were explicitly set (for merge)
    bool filter_root_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML file
    static Result<Config> load(const std::string& path);

    // Parse from a TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicit values win)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Map "trace", "debug", "info", "warn" or "error" to a level.
Result<log::Level> parse_level(const std::string& name);

// Discover the global config file path: ~/.sift/config.toml
std::string global_config_path();

} // namespace sift
