#pragma once

#include <trellis/result.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// One row of the ai_cache table. Timestamps are epoch milliseconds.
struct CacheEntry {
    std::string call_type;
    std::string content_hash;
    std::string response;       // serialized validated record (JSON text)
    int64_t created_at = 0;
    int64_t expires_at = 0;
    int64_t hit_count = 0;
};

struct CallTypeStats {
    std::string call_type;
    int64_t entries = 0;
    int64_t hits = 0;
};

struct CacheStats {
    int64_t total_entries = 0;
    int64_t active_entries = 0;
    int64_t expired_entries = 0;
    int64_t total_hits = 0;                 // summed over live entries only
    std::chrono::seconds ttl{0};
    std::vector<CallTypeStats> by_call_type; // live entries, most hits first
};

// Durable TTL-bounded store of collaborator results, keyed by
// (call_type, content_hash).
//
// Every operation acquires its own SQLite connection and releases it on all
// exit paths. Writers are serialized by SQLite's file locks, so several
// ResponseCache objects (or processes) can share one database file.
//
// get/set/sweep never report storage faults to the caller: a broken cache
// behaves like an empty one and the fault is logged.
class ResponseCache {
public:
    // Returns "now" as epoch milliseconds
    using Clock = std::function<int64_t()>;

    ResponseCache(std::string db_path, std::chrono::seconds ttl, Clock clock = {});
    ~ResponseCache();
    ResponseCache(ResponseCache&&) noexcept;
    ResponseCache& operator=(ResponseCache&&) noexcept;

    // Create parent directories and the schema. A corrupt database file is
    // deleted and recreated once.
    Status open();
    bool is_open() const;

    const std::string& path() const;
    std::chrono::seconds ttl() const;

    // Live record for the key, or nullopt. A hit increments hit_count in the
    // same write transaction. Expired rows read as absent but stay on disk.
    std::optional<nlohmann::json> get(const std::string& call_type,
                                      const std::string& content_hash);

    // Insert or replace: created_at = now, expires_at = now + ttl, hit_count = 0.
    void set(const std::string& call_type,
             const std::string& content_hash,
             const nlohmann::json& record);

    Result<CacheStats> stats();

    // Delete every row with expires_at <= now. Returns the number removed.
    int64_t sweep();

    // Raw row regardless of expiry; does not count as a hit.
    Result<CacheEntry> peek(const std::string& call_type,
                            const std::string& content_hash);

    static int64_t system_now_ms();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace trellis
