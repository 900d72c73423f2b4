#include <catch2/catch.hpp>
#include <trellis/response_cache.hpp>
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace trellis;
using nlohmann::json;

static std::string test_db_path() {
    static int counter = 0;
    return "/tmp/trellis_test_response_cache_" + std::to_string(getpid())
           + "_" + std::to_string(counter++) + ".db";
}

static void remove_db(const std::string& path) {
    fs::remove(path);
    fs::remove(path + "-wal");
    fs::remove(path + "-shm");
}

static constexpr int64_t HOUR_MS = 3600 * 1000;

// Cache over a fresh database with a hand-driven clock
struct CacheFixture {
    std::string path = test_db_path();
    std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1700000000000);
    ResponseCache cache{path, std::chrono::hours(24), [n = now] { return *n; }};

    CacheFixture() { REQUIRE(cache.open().is_ok()); }
    ~CacheFixture() { remove_db(path); }

    void advance(int64_t ms) { *now += ms; }
};

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("open creates the database and parent directories", "[response_cache]") {
    std::string dir = "/tmp/trellis_test_cache_dir_" + std::to_string(getpid());
    std::string path = dir + "/nested/responses.db";
    ResponseCache cache(path, std::chrono::hours(1));
    REQUIRE_FALSE(cache.is_open());
    REQUIRE(cache.open().is_ok());
    REQUIRE(cache.is_open());
    REQUIRE(fs::exists(path));
    REQUIRE(cache.path() == path);
    REQUIRE(cache.ttl() == std::chrono::hours(1));
    fs::remove_all(dir);
}

TEST_CASE("open recreates a corrupt database file", "[response_cache]") {
    auto path = test_db_path();
    {
        std::ofstream f(path, std::ios::binary);
        f << std::string(4096, 'x');
    }
    ResponseCache cache(path, std::chrono::hours(1));
    REQUIRE(cache.open().is_ok());
    cache.set("analyze_problem", "h", json{{"ok", true}});
    REQUIRE(cache.get("analyze_problem", "h").has_value());
    remove_db(path);
}

TEST_CASE("open drops rows written under another schema version", "[response_cache]") {
    auto path = test_db_path();
    {
        ResponseCache cache(path, std::chrono::hours(1));
        REQUIRE(cache.open().is_ok());
        cache.set("analyze_problem", "h", json{{"ok", true}});
    }
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
        REQUIRE(sqlite3_exec(db, "UPDATE schema_info SET value='0' WHERE key='version'",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }
    ResponseCache reopened(path, std::chrono::hours(1));
    REQUIRE(reopened.open().is_ok());
    REQUIRE_FALSE(reopened.get("analyze_problem", "h").has_value());
    remove_db(path);
}

TEST_CASE("open leaves a database alone while another connection writes", "[response_cache]") {
    auto path = test_db_path();
    {
        ResponseCache cache(path, std::chrono::hours(1));
        REQUIRE(cache.open().is_ok());
        cache.set("analyze_problem", "h", json{{"ok", true}});
    }

    sqlite3* writer = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &writer) == SQLITE_OK);
    REQUIRE(sqlite3_exec(writer, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK);

    ResponseCache second(path, std::chrono::hours(1));
    REQUIRE(second.open().is_ok());

    REQUIRE(sqlite3_exec(writer, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(writer);

    REQUIRE(second.get("analyze_problem", "h") == json{{"ok", true}});
    remove_db(path);
}

TEST_CASE("open reports a locked database instead of replacing it", "[response_cache]") {
    auto path = test_db_path();
    sqlite3* writer = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &writer) == SQLITE_OK);
    REQUIRE(sqlite3_exec(writer, "PRAGMA journal_mode=WAL; CREATE TABLE other (x INTEGER);",
                         nullptr, nullptr, nullptr) == SQLITE_OK);
    REQUIRE(sqlite3_exec(writer, "BEGIN IMMEDIATE; INSERT INTO other VALUES (1);",
                         nullptr, nullptr, nullptr) == SQLITE_OK);

    // Needs the write lock to create its tables; gives up after the busy timeout
    ResponseCache cache(path, std::chrono::hours(1));
    auto opened = cache.open();
    REQUIRE(opened.is_err());
    REQUIRE(opened.error().code == TrellisError::Storage);
    REQUIRE_FALSE(cache.is_open());

    REQUIRE(sqlite3_exec(writer, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(writer);

    // The other connection's table survived
    sqlite3* reader = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &reader) == SQLITE_OK);
    REQUIRE(sqlite3_exec(reader, "SELECT x FROM other", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(reader);

    REQUIRE(cache.open().is_ok());
    remove_db(path);
}

TEST_CASE("operations on an unopened cache degrade quietly", "[response_cache]") {
    ResponseCache cache(test_db_path(), std::chrono::hours(1));
    cache.set("analyze_problem", "h", json{{"ok", true}});
    REQUIRE_FALSE(cache.get("analyze_problem", "h").has_value());
    REQUIRE(cache.sweep() == 0);
    auto stats = cache.stats();
    REQUIRE(stats.is_err());
    REQUIRE(stats.error().code == TrellisError::Storage);
}

// ---------------------------------------------------------------------------
// get / set
// ---------------------------------------------------------------------------

TEST_CASE("get on a missing key is absent", "[response_cache]") {
    CacheFixture fx;
    REQUIRE_FALSE(fx.cache.get("pseudocode_to_cfg", "nope").has_value());
}

TEST_CASE("set then get returns the record and bumps hit_count by one", "[response_cache]") {
    CacheFixture fx;
    json record{{"nodes", json::array()}, {"complexity", 3}};
    fx.cache.set("pseudocode_to_cfg", "k1", record);

    auto before = fx.cache.peek("pseudocode_to_cfg", "k1");
    REQUIRE(before.is_ok());
    REQUIRE(before.value().hit_count == 0);

    auto got = fx.cache.get("pseudocode_to_cfg", "k1");
    REQUIRE(got.has_value());
    REQUIRE(*got == record);

    auto after = fx.cache.peek("pseudocode_to_cfg", "k1");
    REQUIRE(after.value().hit_count == 1);
}

TEST_CASE("set records created_at and expires_at from the clock", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("analyze_problem", "k", json{{"a", 1}});
    auto row = fx.cache.peek("analyze_problem", "k");
    REQUIRE(row.is_ok());
    REQUIRE(row.value().created_at == *fx.now);
    REQUIRE(row.value().expires_at == *fx.now + 24 * HOUR_MS);
    REQUIRE(row.value().response == R"({"a":1})");
}

TEST_CASE("peek does not count as a hit", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("analyze_problem", "k", json{{"a", 1}});
    fx.cache.peek("analyze_problem", "k");
    fx.cache.peek("analyze_problem", "k");
    REQUIRE(fx.cache.peek("analyze_problem", "k").value().hit_count == 0);
}

TEST_CASE("peek of a missing row is NotFound", "[response_cache]") {
    CacheFixture fx;
    auto r = fx.cache.peek("analyze_problem", "missing");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == TrellisError::NotFound);
}

TEST_CASE("call types do not share entries", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("pseudocode_to_cfg", "same", json{{"from", "pseudo"}});
    REQUIRE_FALSE(fx.cache.get("flowchart_to_cfg", "same").has_value());
}

TEST_CASE("set on an existing key replaces it and resets hits", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("analyze_problem", "k", json{{"v", 1}});
    fx.cache.get("analyze_problem", "k");
    fx.cache.get("analyze_problem", "k");
    REQUIRE(fx.cache.peek("analyze_problem", "k").value().hit_count == 2);

    fx.advance(HOUR_MS);
    fx.cache.set("analyze_problem", "k", json{{"v", 2}});
    auto row = fx.cache.peek("analyze_problem", "k");
    REQUIRE(row.value().hit_count == 0);
    REQUIRE(row.value().created_at == *fx.now);
    REQUIRE((*fx.cache.get("analyze_problem", "k"))["v"] == 2);
}

TEST_CASE("expired entry reads as absent but stays on disk", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("pseudocode_to_cfg", "k", json{{"a", 1}});

    fx.advance(24 * HOUR_MS);    // expires_at == now counts as expired
    REQUIRE_FALSE(fx.cache.get("pseudocode_to_cfg", "k").has_value());

    auto row = fx.cache.peek("pseudocode_to_cfg", "k");
    REQUIRE(row.is_ok());
    REQUIRE(row.value().hit_count == 0);
}

TEST_CASE("entry is live one millisecond before expiry", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("pseudocode_to_cfg", "k", json{{"a", 1}});
    fx.advance(24 * HOUR_MS - 1);
    REQUIRE(fx.cache.get("pseudocode_to_cfg", "k").has_value());
}

TEST_CASE("set revives an expired key", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("analyze_problem", "k", json{{"v", 1}});
    fx.advance(25 * HOUR_MS);
    REQUIRE_FALSE(fx.cache.get("analyze_problem", "k").has_value());
    fx.cache.set("analyze_problem", "k", json{{"v", 2}});
    REQUIRE(fx.cache.get("analyze_problem", "k").has_value());
}

TEST_CASE("zero ttl stores rows that are already expired", "[response_cache]") {
    auto path = test_db_path();
    ResponseCache cache(path, std::chrono::seconds(0), [] { return int64_t{1000}; });
    REQUIRE(cache.open().is_ok());
    cache.set("analyze_problem", "k", json{{"v", 1}});
    REQUIRE_FALSE(cache.get("analyze_problem", "k").has_value());
    REQUIRE(cache.sweep() == 1);
    remove_db(path);
}

TEST_CASE("unparsable stored text reads as absent", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("analyze_problem", "k", json{{"v", 1}});
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(fx.path.c_str(), &db) == SQLITE_OK);
        REQUIRE(sqlite3_exec(db, "UPDATE ai_cache SET response='{not json'",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }
    REQUIRE_FALSE(fx.cache.get("analyze_problem", "k").has_value());
}

TEST_CASE("two handles on one file see each other's writes", "[response_cache]") {
    auto path = test_db_path();
    ResponseCache writer(path, std::chrono::hours(1));
    ResponseCache reader(path, std::chrono::hours(1));
    REQUIRE(writer.open().is_ok());
    REQUIRE(reader.open().is_ok());

    writer.set("analyze_problem", "k", json{{"v", 7}});
    auto got = reader.get("analyze_problem", "k");
    REQUIRE(got.has_value());
    REQUIRE((*got)["v"] == 7);
    REQUIRE(writer.peek("analyze_problem", "k").value().hit_count == 1);
    remove_db(path);
}

// ---------------------------------------------------------------------------
// sweep / stats
// ---------------------------------------------------------------------------

TEST_CASE("sweep removes exactly the expired rows", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("pseudocode_to_cfg", "old1", json{{"v", 1}});
    fx.cache.set("analyze_problem", "old2", json{{"v", 2}});
    fx.advance(23 * HOUR_MS);
    fx.cache.set("pseudocode_to_cfg", "fresh", json{{"v", 3}});
    fx.advance(2 * HOUR_MS);

    REQUIRE(fx.cache.sweep() == 2);
    REQUIRE(fx.cache.sweep() == 0);

    REQUIRE(fx.cache.peek("pseudocode_to_cfg", "old1").has_code(TrellisError::NotFound));
    REQUIRE(fx.cache.peek("analyze_problem", "old2").has_code(TrellisError::NotFound));
    REQUIRE(fx.cache.get("pseudocode_to_cfg", "fresh").has_value());
}

TEST_CASE("sweep on an empty cache returns zero", "[response_cache]") {
    CacheFixture fx;
    REQUIRE(fx.cache.sweep() == 0);
}

TEST_CASE("stats on an empty cache", "[response_cache]") {
    CacheFixture fx;
    auto r = fx.cache.stats();
    REQUIRE(r.is_ok());
    const auto& s = r.value();
    REQUIRE(s.total_entries == 0);
    REQUIRE(s.active_entries == 0);
    REQUIRE(s.expired_entries == 0);
    REQUIRE(s.total_hits == 0);
    REQUIRE(s.ttl == std::chrono::hours(24));
    REQUIRE(s.by_call_type.empty());
}

TEST_CASE("stats counts live and expired entries and live hits", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("analyze_problem", "old", json{{"v", 0}});
    fx.cache.get("analyze_problem", "old");        // hit on a row that will expire
    fx.advance(23 * HOUR_MS);

    fx.cache.set("pseudocode_to_cfg", "a", json{{"v", 1}});
    fx.cache.set("pseudocode_to_cfg", "b", json{{"v", 2}});
    fx.cache.set("compare_cfgs", "c", json{{"v", 3}});
    fx.cache.get("pseudocode_to_cfg", "a");
    fx.cache.get("pseudocode_to_cfg", "a");
    fx.cache.get("pseudocode_to_cfg", "b");
    fx.cache.get("compare_cfgs", "c");
    fx.advance(2 * HOUR_MS);

    auto r = fx.cache.stats();
    REQUIRE(r.is_ok());
    const auto& s = r.value();
    REQUIRE(s.total_entries == 4);
    REQUIRE(s.active_entries == 3);
    REQUIRE(s.expired_entries == 1);
    REQUIRE(s.total_hits == 4);

    REQUIRE(s.by_call_type.size() == 2);
    REQUIRE(s.by_call_type[0].call_type == "pseudocode_to_cfg");
    REQUIRE(s.by_call_type[0].entries == 2);
    REQUIRE(s.by_call_type[0].hits == 3);
    REQUIRE(s.by_call_type[1].call_type == "compare_cfgs");
    REQUIRE(s.by_call_type[1].entries == 1);
    REQUIRE(s.by_call_type[1].hits == 1);
}

TEST_CASE("stats orders equal hit counts by call type", "[response_cache]") {
    CacheFixture fx;
    fx.cache.set("pseudocode_to_cfg", "a", json{{"v", 1}});
    fx.cache.set("analyze_problem", "b", json{{"v", 2}});
    auto s = fx.cache.stats().value();
    REQUIRE(s.by_call_type.size() == 2);
    REQUIRE(s.by_call_type[0].call_type == "analyze_problem");
    REQUIRE(s.by_call_type[1].call_type == "pseudocode_to_cfg");
}
