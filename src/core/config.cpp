#include <trellis/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace trellis {

static std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (!home) home = "/tmp";
    return home;
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TrellisError{TrellisError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [cache] section
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["path"].value<std::string>()) {
            cfg.cache.path = *v;
            cfg.cache_path_set = true;
        }
        if (auto v = (*cache)["ttl-hours"].value<int64_t>()) {
            if (*v < 0) {
                return TrellisError{TrellisError::Config,
                    "cache.ttl-hours must not be negative, got " + std::to_string(*v)};
            }
            cfg.cache.ttl = std::chrono::hours(*v);
            cfg.cache_ttl_set = true;
        }
    }

    // [inference] section
    if (auto inference = doc["inference"].as_table()) {
        if (auto cmd = (*inference)["command"].as_array()) {
            for (const auto& arg : *cmd) {
                auto s = arg.value<std::string>();
                if (!s) {
                    return TrellisError{TrellisError::Config,
                        "inference.command must be an array of strings"};
                }
                cfg.inference.command.push_back(*s);
            }
            cfg.inference_command_set = true;
        }
        if (auto v = (*inference)["timeout-seconds"].value<int64_t>()) {
            if (*v <= 0) {
                return TrellisError{TrellisError::Config,
                    "inference.timeout-seconds must be positive",
                    "the collaborator call always needs a bound"};
            }
            cfg.inference.timeout_seconds = static_cast<int>(*v);
            cfg.inference_timeout_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return TrellisError{TrellisError::Config,
                    "unknown log level: " + *v,
                    "expected one of trace, debug, info, warn, error"};
            }
            cfg.logging.level = *lvl;
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.logging.color = *v;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TrellisError{TrellisError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::merge(const Config& other) {
    if (other.cache_path_set) {
        cache.path = other.cache.path;
        cache_path_set = true;
    }
    if (other.cache_ttl_set) {
        cache.ttl = other.cache.ttl;
        cache_ttl_set = true;
    }
    if (other.inference_command_set) {
        inference.command = other.inference.command;
        inference_command_set = true;
    }
    if (other.inference_timeout_set) {
        inference.timeout_seconds = other.inference.timeout_seconds;
        inference_timeout_set = true;
    }
    if (other.log_level_set) {
        logging.level = other.logging.level;
        log_level_set = true;
    }
    if (other.logging.color.has_value()) {
        logging.color = other.logging.color;
    }
}

std::string Config::effective_cache_path() const {
    if (cache.path.empty()) return default_cache_path();
    if (cache.path.rfind("~/", 0) == 0) return home_dir() + cache.path.substr(1);
    return cache.path;
}

void Config::apply_logging() const {
    log::set_level(logging.level);
    if (logging.color.has_value()) {
        log::set_color_enabled(*logging.color);
    }
}

std::string default_config_path() {
    return home_dir() + "/.trellis/config.toml";
}

std::string default_cache_path() {
    return home_dir() + "/.trellis/cache/responses.db";
}

} // namespace trellis
