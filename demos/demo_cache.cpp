// demo_cache.cpp
//
// Administrative front end for the response cache. Reads
// ~/.trellis/config.toml when it exists, opens the cache it names and runs
// one command:
//
//     ./demo_cache stats               # entry counts, hits, per-call-type table
//     ./demo_cache sweep               # delete expired rows
//     ./demo_cache normalize <file>    # normalized pseudocode and its cache key

#include <trellis/cache_key.hpp>
#include <trellis/config.hpp>
#include <trellis/log.hpp>
#include <trellis/normalize.hpp>
#include <trellis/response_cache.hpp>
#include <trellis/result.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace trellis;

static const char* USAGE = "usage: demo_cache <stats | sweep | normalize <file>>";

Result<Config> load_config() {
    std::string path = default_config_path();
    if (!fs::exists(path)) {
        log::debug("no config at %s, using defaults", path.c_str());
        return Result<Config>::ok(Config{});
    }
    return Config::load(path);
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return TrellisError{TrellisError::IO, "could not open file: " + path,
                            "check the path and file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

Result<ResponseCache> open_cache(const Config& cfg) {
    ResponseCache cache(cfg.effective_cache_path(), cfg.cache.ttl);
    TRELLIS_TRY(cache.open());
    return Result<ResponseCache>::ok(std::move(cache));
}

Status cmd_stats(const Config& cfg) {
    auto cache = open_cache(cfg);
    TRELLIS_TRY(cache);

    auto stats = cache.value().stats();
    TRELLIS_TRY(stats);
    const CacheStats& s = stats.value();

    std::printf("database:  %s\n", cache.value().path().c_str());
    std::printf("ttl:       %lld hours\n",
                static_cast<long long>(s.ttl.count() / 3600));
    std::printf("entries:   %lld (%lld active, %lld expired)\n",
                static_cast<long long>(s.total_entries),
                static_cast<long long>(s.active_entries),
                static_cast<long long>(s.expired_entries));
    std::printf("hits:      %lld\n", static_cast<long long>(s.total_hits));

    if (!s.by_call_type.empty()) {
        std::printf("\n%-24s %8s %8s\n", "call type", "entries", "hits");
        for (const auto& row : s.by_call_type) {
            std::printf("%-24s %8lld %8lld\n", row.call_type.c_str(),
                        static_cast<long long>(row.entries),
                        static_cast<long long>(row.hits));
        }
    }
    return ok_status();
}

Status cmd_sweep(const Config& cfg) {
    auto cache = open_cache(cfg);
    TRELLIS_TRY(cache);

    int64_t removed = cache.value().sweep();
    std::printf("removed %lld expired entries\n", static_cast<long long>(removed));
    return ok_status();
}

Status cmd_normalize(int argc, char** argv) {
    if (argc < 3) {
        return TrellisError{TrellisError::InvalidArg, "no input file specified", USAGE};
    }

    auto source = read_file(argv[2]);
    TRELLIS_TRY(source);

    std::string normalized = normalize_code(source.value());
    std::cout << normalized << "\n";
    std::cout << "key: " << cache_key("pseudocode_to_cfg", {normalized}) << "\n";
    return ok_status();
}

Status run(int argc, char** argv) {
    if (argc < 2) {
        return TrellisError{TrellisError::InvalidArg, "no command given", USAGE};
    }
    std::string command = argv[1];

    auto cfg = load_config();
    TRELLIS_TRY(cfg);
    cfg.value().apply_logging();

    if (command == "stats") return cmd_stats(cfg.value());
    if (command == "sweep") return cmd_sweep(cfg.value());
    if (command == "normalize") return cmd_normalize(argc, argv);

    return TrellisError{TrellisError::InvalidArg, "unknown command: " + command, USAGE};
}

int main(int argc, char** argv) {
    auto result = run(argc, argv);
    if (result.is_err()) {
        std::cerr << result.error().format() << "\n";
        return 1;
    }
    return 0;
}
