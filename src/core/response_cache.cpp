#include <trellis/response_cache.hpp>
#include <trellis/cache_key.hpp>
#include <trellis/log.hpp>
#include <sqlite3.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace trellis {

static const std::string SCHEMA_VERSION = "1";
static constexpr int BUSY_TIMEOUT_MS = 5000;

// ---------------------------------------------------------------------------
// Scoped SQLite handles
// ---------------------------------------------------------------------------

namespace {

class Connection {
public:
    Connection() = default;
    ~Connection() { close(); }
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    Status open(const std::string& path) {
        close();
        int rc = sqlite3_open_v2(path.c_str(), &db_,
            SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
            nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            note_failure(rc);
            close();
            return TrellisError(TrellisError::Storage,
                "cannot open cache database " + path + ": " + msg);
        }
        sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
        return exec("PRAGMA synchronous=NORMAL;");
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    Status exec(const char* sql) {
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string msg = errmsg ? errmsg : "unknown error";
            sqlite3_free(errmsg);
            note_failure(rc);
            return TrellisError(TrellisError::Storage, "SQLite exec failed: " + msg);
        }
        return ok_status();
    }

    std::string last_error() const { return db_ ? sqlite3_errmsg(db_) : "no connection"; }

    // Primary result code of the most recent failed call, SQLITE_OK if none
    void note_failure(int rc) { failed_rc_ = rc & 0xff; }
    int failed_rc() const { return failed_rc_; }

    int64_t changes() const { return sqlite3_changes(db_); }
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    int failed_rc_ = SQLITE_OK;
};

class Statement {
public:
    explicit Statement(Connection& conn) : conn_(conn) {}
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Status prepare(const char* sql) {
        int rc = sqlite3_prepare_v2(conn_.handle(), sql, -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            conn_.note_failure(rc);
            return TrellisError(TrellisError::Storage,
                "SQLite prepare failed: " + conn_.last_error());
        }
        return ok_status();
    }

    void bind(int idx, const std::string& s) {
        sqlite3_bind_text(stmt_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t v) {
        sqlite3_bind_int64(stmt_, idx, v);
    }

    // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else -> Storage error
    Result<bool> step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return Result<bool>::ok(true);
        if (rc == SQLITE_DONE) return Result<bool>::ok(false);
        conn_.note_failure(rc);
        return TrellisError(TrellisError::Storage,
            "SQLite step failed: " + conn_.last_error());
    }

    std::string text(int col) const {
        const unsigned char* p = sqlite3_column_text(stmt_, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    Connection& conn_;
    sqlite3_stmt* stmt_ = nullptr;
};

// Rolls back unless commit() succeeded
class Transaction {
public:
    explicit Transaction(Connection& conn) : conn_(conn) {}
    ~Transaction() {
        if (!active_) return;
        auto rolled_back = conn_.exec("ROLLBACK;");
        if (rolled_back.is_err()) {
            log::warn("%s", rolled_back.error().message.c_str());
        }
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    Status begin_immediate() { return begin("BEGIN IMMEDIATE;"); }
    Status begin_deferred() { return begin("BEGIN DEFERRED;"); }

    Status commit() {
        TRELLIS_TRY(conn_.exec("COMMIT;"));
        active_ = false;
        return ok_status();
    }

private:
    Status begin(const char* sql) {
        TRELLIS_TRY(conn_.exec(sql));
        active_ = true;
        return ok_status();
    }

    Connection& conn_;
    bool active_ = false;
};

} // namespace

// ---------------------------------------------------------------------------
// pImpl
// ---------------------------------------------------------------------------

struct ResponseCache::Impl {
    std::string path;
    std::chrono::seconds ttl;
    Clock clock;
    bool opened = false;

    int64_t now() const { return clock ? clock() : system_now_ms(); }

    int64_t ttl_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ttl).count();
    }

    Status connect(Connection& conn) const {
        if (!opened) {
            return TrellisError(TrellisError::Storage,
                "response cache is not open: " + path);
        }
        return conn.open(path);
    }

    // True when both tables exist at the current schema version. Reads only,
    // so it succeeds while another connection holds the write lock.
    Result<bool> schema_current(Connection& conn) {
        int64_t tables = 0;
        {
            Statement count(conn);
            TRELLIS_TRY(count.prepare(
                "SELECT COUNT(*) FROM sqlite_master "
                "WHERE type='table' AND name IN ('schema_info', 'ai_cache')"));
            TRELLIS_TRY(count.step());
            tables = count.int64(0);
        }
        if (tables != 2) return Result<bool>::ok(false);

        Statement ver(conn);
        TRELLIS_TRY(ver.prepare("SELECT value FROM schema_info WHERE key='version'"));
        auto row = ver.step();
        TRELLIS_TRY(row);
        return Result<bool>::ok(row.value() && ver.text(0) == SCHEMA_VERSION);
    }

    Status init_schema(Connection& conn) {
        TRELLIS_TRY(conn.exec("PRAGMA journal_mode=WAL;"));

        auto current = schema_current(conn);
        TRELLIS_TRY(current);
        if (current.value()) return ok_status();

        TRELLIS_TRY(conn.exec(
            "CREATE TABLE IF NOT EXISTS schema_info ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT"
            ");"
        ));

        std::optional<std::string> stored_version;
        {
            Statement ver(conn);
            TRELLIS_TRY(ver.prepare("SELECT value FROM schema_info WHERE key='version'"));
            auto row = ver.step();
            TRELLIS_TRY(row);
            if (row.value()) stored_version = ver.text(0);
        }
        if (stored_version && *stored_version != SCHEMA_VERSION) {
            log::warn("response cache schema %s is outdated, dropping cached responses",
                      stored_version->c_str());
            TRELLIS_TRY(conn.exec("DROP TABLE IF EXISTS ai_cache;"));
        }

        TRELLIS_TRY(conn.exec(
            "CREATE TABLE IF NOT EXISTS ai_cache ("
            "  call_type TEXT NOT NULL,"
            "  content_hash TEXT NOT NULL,"
            "  response TEXT NOT NULL,"
            "  created_at INTEGER NOT NULL,"
            "  expires_at INTEGER NOT NULL,"
            "  hit_count INTEGER NOT NULL DEFAULT 0,"
            "  PRIMARY KEY (call_type, content_hash)"
            ");"
            "CREATE INDEX IF NOT EXISTS idx_ai_cache_expires ON ai_cache (expires_at);"
        ));

        std::string ver_sql = "INSERT OR REPLACE INTO schema_info (key, value) "
            "VALUES ('version', '" + SCHEMA_VERSION + "');";
        return conn.exec(ver_sql.c_str());
    }

    Result<std::optional<std::string>> lookup(const std::string& call_type,
                                              const std::string& content_hash) {
        Connection conn;
        TRELLIS_TRY(connect(conn));

        // Write lock up front so the read and the hit increment are one unit
        Transaction tx(conn);
        TRELLIS_TRY(tx.begin_immediate());

        std::string response;
        {
            Statement select(conn);
            TRELLIS_TRY(select.prepare(
                "SELECT response FROM ai_cache "
                "WHERE call_type=? AND content_hash=? AND expires_at > ?"));
            select.bind(1, call_type);
            select.bind(2, content_hash);
            select.bind(3, now());

            auto row = select.step();
            TRELLIS_TRY(row);
            if (!row.value()) {
                return Result<std::optional<std::string>>::ok(std::nullopt);
            }
            response = select.text(0);
        }
        {
            Statement bump(conn);
            TRELLIS_TRY(bump.prepare(
                "UPDATE ai_cache SET hit_count = hit_count + 1 "
                "WHERE call_type=? AND content_hash=?"));
            bump.bind(1, call_type);
            bump.bind(2, content_hash);
            TRELLIS_TRY(bump.step());
        }

        TRELLIS_TRY(tx.commit());
        return Result<std::optional<std::string>>::ok(std::move(response));
    }

    Status store(const std::string& call_type,
                 const std::string& content_hash,
                 const std::string& response) {
        Connection conn;
        TRELLIS_TRY(connect(conn));

        Transaction tx(conn);
        TRELLIS_TRY(tx.begin_immediate());

        int64_t created = now();
        {
            Statement insert(conn);
            TRELLIS_TRY(insert.prepare(
                "INSERT OR REPLACE INTO ai_cache "
                "(call_type, content_hash, response, created_at, expires_at, hit_count) "
                "VALUES (?, ?, ?, ?, ?, 0)"));
            insert.bind(1, call_type);
            insert.bind(2, content_hash);
            insert.bind(3, response);
            insert.bind(4, created);
            insert.bind(5, created + ttl_ms());
            TRELLIS_TRY(insert.step());
        }

        return tx.commit();
    }

    Result<CacheStats> collect_stats() {
        Connection conn;
        TRELLIS_TRY(connect(conn));

        // One read snapshot for all three queries
        Transaction tx(conn);
        TRELLIS_TRY(tx.begin_deferred());

        CacheStats stats;
        stats.ttl = ttl;
        int64_t cutoff = now();

        {
            Statement total(conn);
            TRELLIS_TRY(total.prepare("SELECT COUNT(*) FROM ai_cache"));
            TRELLIS_TRY(total.step());
            stats.total_entries = total.int64(0);
        }
        {
            Statement live(conn);
            TRELLIS_TRY(live.prepare(
                "SELECT COUNT(*), COALESCE(SUM(hit_count), 0) FROM ai_cache "
                "WHERE expires_at > ?"));
            live.bind(1, cutoff);
            TRELLIS_TRY(live.step());
            stats.active_entries = live.int64(0);
            stats.total_hits = live.int64(1);
            stats.expired_entries = stats.total_entries - stats.active_entries;
        }
        {
            Statement by_type(conn);
            TRELLIS_TRY(by_type.prepare(
                "SELECT call_type, COUNT(*), COALESCE(SUM(hit_count), 0) AS hits "
                "FROM ai_cache WHERE expires_at > ? "
                "GROUP BY call_type ORDER BY hits DESC, call_type ASC"));
            by_type.bind(1, cutoff);
            while (true) {
                auto row = by_type.step();
                TRELLIS_TRY(row);
                if (!row.value()) break;
                stats.by_call_type.push_back(
                    CallTypeStats{by_type.text(0), by_type.int64(1), by_type.int64(2)});
            }
        }

        TRELLIS_TRY(tx.commit());
        return Result<CacheStats>::ok(std::move(stats));
    }

    Result<int64_t> delete_expired() {
        Connection conn;
        TRELLIS_TRY(connect(conn));

        Statement del(conn);
        TRELLIS_TRY(del.prepare("DELETE FROM ai_cache WHERE expires_at <= ?"));
        del.bind(1, now());
        TRELLIS_TRY(del.step());
        return Result<int64_t>::ok(conn.changes());
    }

    Result<CacheEntry> read_row(const std::string& call_type,
                                const std::string& content_hash) {
        Connection conn;
        TRELLIS_TRY(connect(conn));

        Statement select(conn);
        TRELLIS_TRY(select.prepare(
            "SELECT call_type, content_hash, response, created_at, expires_at, hit_count "
            "FROM ai_cache WHERE call_type=? AND content_hash=?"));
        select.bind(1, call_type);
        select.bind(2, content_hash);

        auto row = select.step();
        TRELLIS_TRY(row);
        if (!row.value()) {
            return TrellisError(TrellisError::NotFound,
                "no cache entry for " + call_type + " " + short_hash(content_hash));
        }

        CacheEntry e;
        e.call_type = select.text(0);
        e.content_hash = select.text(1);
        e.response = select.text(2);
        e.created_at = select.int64(3);
        e.expires_at = select.int64(4);
        e.hit_count = select.int64(5);
        return Result<CacheEntry>::ok(std::move(e));
    }
};

// ---------------------------------------------------------------------------
// ResponseCache public interface
// ---------------------------------------------------------------------------

ResponseCache::ResponseCache(std::string db_path, std::chrono::seconds ttl, Clock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = std::move(db_path);
    impl_->ttl = ttl;
    impl_->clock = std::move(clock);
}

ResponseCache::~ResponseCache() = default;
ResponseCache::ResponseCache(ResponseCache&&) noexcept = default;
ResponseCache& ResponseCache::operator=(ResponseCache&&) noexcept = default;

int64_t ResponseCache::system_now_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

Status ResponseCache::open() {
    impl_->opened = false;
    const std::string& db_path = impl_->path;

    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            return TrellisError(TrellisError::IO,
                "failed to create cache directory: " + parent.string());
        }
    }

    int failed_rc = SQLITE_OK;
    auto setup = [&]() -> Status {
        Connection conn;
        auto status = conn.open(db_path);
        if (status.is_ok()) status = impl_->init_schema(conn);
        failed_rc = conn.failed_rc();
        return status;
    };

    auto result = setup();
    if (result.is_err()) {
        // Only a file SQLite cannot read is replaced. Busy or locked means
        // another process is using it.
        if (failed_rc != SQLITE_CORRUPT && failed_rc != SQLITE_NOTADB) {
            return result;
        }
        log::warn("recreating response cache %s: %s",
                  db_path.c_str(), result.error().message.c_str());
        std::error_code ec;
        fs::remove(db_path, ec);
        fs::remove(db_path + "-wal", ec);
        fs::remove(db_path + "-shm", ec);
        TRELLIS_TRY(setup());
    }

    impl_->opened = true;
    log::debug("response cache ready at %s (ttl %llds)", db_path.c_str(),
               static_cast<long long>(impl_->ttl.count()));
    return ok_status();
}

bool ResponseCache::is_open() const {
    return impl_->opened;
}

const std::string& ResponseCache::path() const {
    return impl_->path;
}

std::chrono::seconds ResponseCache::ttl() const {
    return impl_->ttl;
}

std::optional<nlohmann::json> ResponseCache::get(const std::string& call_type,
                                                 const std::string& content_hash) {
    auto found = impl_->lookup(call_type, content_hash);
    if (found.is_err()) {
        log::warn("[cache error] get %s: %s", call_type.c_str(),
                  found.error().message.c_str());
        return std::nullopt;
    }
    if (!found.value()) {
        log::debug("[cache miss] %s (hash: %s...)", call_type.c_str(),
                   short_hash(content_hash).c_str());
        return std::nullopt;
    }

    auto doc = nlohmann::json::parse(*found.value(), nullptr, false);
    if (doc.is_discarded()) {
        log::warn("[cache error] unreadable response stored for %s (hash: %s...)",
                  call_type.c_str(), short_hash(content_hash).c_str());
        return std::nullopt;
    }

    log::info("[cache hit] %s (hash: %s...)", call_type.c_str(),
              short_hash(content_hash).c_str());
    return doc;
}

void ResponseCache::set(const std::string& call_type,
                        const std::string& content_hash,
                        const nlohmann::json& record) {
    std::string text = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto stored = impl_->store(call_type, content_hash, text);
    if (stored.is_err()) {
        log::warn("[cache error] set %s: %s", call_type.c_str(),
                  stored.error().message.c_str());
        return;
    }
    log::info("[cache store] %s (hash: %s..., ttl: %llds)", call_type.c_str(),
              short_hash(content_hash).c_str(),
              static_cast<long long>(impl_->ttl.count()));
}

Result<CacheStats> ResponseCache::stats() {
    auto stats = impl_->collect_stats();
    if (stats.is_err()) {
        log::warn("[cache error] stats: %s", stats.error().message.c_str());
    }
    return stats;
}

int64_t ResponseCache::sweep() {
    auto removed = impl_->delete_expired();
    if (removed.is_err()) {
        log::warn("[cache error] sweep: %s", removed.error().message.c_str());
        return 0;
    }
    if (removed.value() > 0) {
        log::info("[cache sweep] removed %lld expired entries",
                  static_cast<long long>(removed.value()));
    }
    return removed.value();
}

Result<CacheEntry> ResponseCache::peek(const std::string& call_type,
                                       const std::string& content_hash) {
    return impl_->read_row(call_type, content_hash);
}

} // namespace trellis
