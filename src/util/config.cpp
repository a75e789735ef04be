#include <sift/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace sift {

static Result<std::vector<std::string>> string_array(const toml::table& tbl,
                                                     const char* key) {
    std::vector<std::string> out;
    const toml::node* node = tbl.get(key);
    if (!node) return Result<std::vector<std::string>>::ok(std::move(out));

    const toml::array* arr = node->as_array();
    if (!arr) {
        return SiftError{SiftError::Config,
            std::string("filter.") + key + " must be an array of strings"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return SiftError{SiftError::Config,
                std::string("filter.") + key + " must contain only strings"};
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

Result<log::Level> parse_level(const std::string& name) {
    if (name == "trace") return Result<log::Level>::ok(log::Trace);
    if (name == "debug") return Result<log::Level>::ok(log::Debug);
    if (name == "info")  return Result<log::Level>::ok(log::Info);
    if (name == "warn")  return Result<log::Level>::ok(log::Warn);
    if (name == "error") return Result<log::Level>::ok(log::Error);
    return SiftError{SiftError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return SiftError{SiftError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [filter] section
    if (auto filter = doc["filter"].as_table()) {
        if (auto v = (*filter)["root"].value<std::string>()) {
            cfg.filter.root = *v;
            cfg.filter_root_set = true;
        }

        auto inc = string_array(*filter, "include");
        SIFT_TRY(inc);
        cfg.filter.includes = std::move(inc).value();

        auto exc = string_array(*filter, "exclude");
        SIFT_TRY(exc);
        cfg.filter.excludes = std::move(exc).value();
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = parse_level(*v);
            SIFT_TRY(lvl);
            cfg.logging.level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SiftError{SiftError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        SiftError err = std::move(cfg).error();
        err.file = path;
        return err;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.filter_root_set) {
        filter.root = other.filter.root;
        filter_root_set = true;
    }
    filter.includes.insert(filter.includes.end(),
                           other.filter.includes.begin(), other.filter.includes.end());
    filter.excludes.insert(filter.excludes.end(),
                           other.filter.excludes.begin(), other.filter.excludes.end());

    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        logging.color = other.logging.color;
        log_color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.sift/config.toml";
}

} // namespace sift
