#pragma once

#include <trellis/log.hpp>
#include <trellis/result.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// [cache] section
struct CacheSettings {
    std::string path;                       // empty -> default_cache_path()
    std::chrono::seconds ttl{std::chrono::hours(24)};
};

// [inference] section
struct InferenceSettings {
    std::vector<std::string> command;       // argv of the model CLI
    int timeout_seconds = 60;
};

// [log] section
struct LogSettings {
    log::Level level = log::Info;
    std::optional<bool> color;              // unset -> detect TTY
};

// Process-wide settings, read once at startup and passed to the cache and the
// inference client by value.
struct Config {
    CacheSettings cache;
    InferenceSettings inference;
    LogSettings logging;

    // Track which fields were explicitly set (for merge)
    bool cache_path_set = false;
    bool cache_ttl_set = false;
    bool inference_command_set = false;
    bool inference_timeout_set = false;
    bool log_level_set = false;

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Load from a TOML file
    static Result<Config> load(const std::string& path);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    // cache.path, or default_cache_path() when unset
    std::string effective_cache_path() const;

    // Push [log] settings into trellis::log
    void apply_logging() const;
};

// ~/.trellis/config.toml
std::string default_config_path();

// ~/.trellis/cache/responses.db
std::string default_cache_path();

} // namespace trellis
