#include "pool/postgres_store.hpp"
#include "util/time.hpp"
#include <libpq-fe.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace sandpool::pool {

namespace {

using PgResult = std::unique_ptr<PGresult, decltype(&PQclear)>;

// Run a parameterised statement; all parameters are sent as text
PgResult exec_params(PGconn* conn, const char* sql, const std::vector<std::string>& params,
                     ExecStatusType expected, std::string& error) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    PgResult res(PQexecParams(conn, sql, static_cast<int>(values.size()), nullptr,
                              values.empty() ? nullptr : values.data(), nullptr, nullptr, 0),
                 &PQclear);
    if (!res || PQresultStatus(res.get()) != expected) {
        error = PQerrorMessage(conn);
        return PgResult(nullptr, &PQclear);
    }
    return res;
}

size_t affected_rows(PGresult* res) {
    const char* n = PQcmdTuples(res);
    return (n && *n) ? std::stoul(n) : 0;
}

const char* kMigrations[] = {
    "CREATE TABLE IF NOT EXISTS pool_entries ("
    "  id text PRIMARY KEY,"
    "  partition_key text NOT NULL,"
    "  data jsonb NOT NULL DEFAULT '{}'::jsonb,"
    "  created_at bigint NOT NULL,"
    "  inserted_at timestamp NOT NULL DEFAULT (now() at time zone 'utc'))",
    "CREATE INDEX IF NOT EXISTS pool_entries_partition_key_created_at_index"
    "  ON pool_entries (partition_key, created_at)",
    "CREATE TABLE IF NOT EXISTS pool_entries_pending ("
    "  partition_key text PRIMARY KEY,"
    "  created_at bigint NOT NULL)",
    "CREATE INDEX IF NOT EXISTS pool_entries_pending_created_at_index"
    "  ON pool_entries_pending (created_at)",
};

const char* kDeleteStale =
    "DELETE FROM pool_entries WHERE id IN ("
    "  SELECT id FROM pool_entries"
    "  WHERE partition_key = $1 AND created_at < $2"
    "  FOR UPDATE SKIP LOCKED)";

const char* kPopOldest =
    "DELETE FROM pool_entries WHERE id IN ("
    "  SELECT id FROM pool_entries"
    "  WHERE partition_key = $1 AND created_at >= $2"
    "  ORDER BY created_at ASC"
    "  LIMIT 1"
    "  FOR UPDATE SKIP LOCKED)"
    " RETURNING id, partition_key, data::text, created_at";

const char* kExpirePending = "DELETE FROM pool_entries_pending WHERE created_at < $1";

} // namespace

PostgresStore::PostgresStore(std::string conninfo, int pool_size,
                             std::vector<std::string> partitions, Clock clock)
    : conninfo_(std::move(conninfo)),
      pool_size_(pool_size > 0 ? pool_size : 1),
      partitions_(std::move(partitions)),
      clock_(clock ? std::move(clock) : Clock(util::now_ms)) {}

PostgresStore::~PostgresStore() {
    stop();
}

// ============================================================================
// Connection pool
// ============================================================================

bool PostgresStore::init() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopped_) return true;

        for (int i = 0; i < pool_size_; i++) {
            PGconn* conn = PQconnectdb(conninfo_.c_str());
            if (PQstatus(conn) != CONNECTION_OK) {
                spdlog::error("Postgres connection failed: {}", PQerrorMessage(conn));
                PQfinish(conn);
                for (auto* c : all_) PQfinish(c);
                all_.clear();
                idle_.clear();
                return false;
            }
            all_.push_back(conn);
            idle_.push_back(conn);
        }
        stopped_ = false;
    }

    spdlog::info("Postgres store connected ({} connections)", pool_size_);
    return migrate();
}

PostgresStore::Lease PostgresStore::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_cv_.wait(lock, [this] { return stopped_ || !idle_.empty(); });
    if (stopped_) {
        return Lease(*this, nullptr);
    }

    PGconn* conn = idle_.back();
    idle_.pop_back();
    lock.unlock();

    if (PQstatus(conn) != CONNECTION_OK) {
        spdlog::warn("Postgres connection lost, resetting");
        PQreset(conn);
    }
    return Lease(*this, conn);
}

void PostgresStore::release(PGconn* conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(conn);
    }
    // stop() may be waiting alongside acquirers
    available_cv_.notify_all();
}

void PostgresStore::stop() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopped_) return;
    stopped_ = true;
    available_cv_.notify_all();

    // Wait for leases still out
    available_cv_.wait(lock, [this] { return idle_.size() == all_.size(); });
    for (auto* conn : all_) {
        PQfinish(conn);
    }
    all_.clear();
    idle_.clear();
    spdlog::debug("Postgres store stopped");
}

// ============================================================================
// Schema
// ============================================================================

bool PostgresStore::migrate() {
    auto conn = acquire();
    if (!conn) return false;

    for (const char* sql : kMigrations) {
        std::string error;
        if (!exec_params(conn.get(), sql, {}, PGRES_COMMAND_OK, error)) {
            spdlog::error("Postgres migration failed: {}", error);
            return false;
        }
    }
    return true;
}

bool PostgresStore::drop_tables() {
    auto conn = acquire();
    if (!conn) return false;

    std::string error;
    if (!exec_params(conn.get(), "DROP TABLE IF EXISTS pool_entries_pending", {}, PGRES_COMMAND_OK, error) ||
        !exec_params(conn.get(), "DROP TABLE IF EXISTS pool_entries", {}, PGRES_COMMAND_OK, error)) {
        spdlog::error("Postgres drop failed: {}", error);
        return false;
    }
    return true;
}

// ============================================================================
// Entries
// ============================================================================

PopResult PostgresStore::pop(const std::string& partition_key, int64_t max_age_ms) {
    PopResult result;
    auto conn = acquire();
    if (!conn) {
        result.status = PopStatus::ERROR;
        result.error = "store stopped";
        return result;
    }

    std::string min_created_at = std::to_string(clock_() - max_age_ms);
    std::string error;

    auto stale = exec_params(conn.get(), kDeleteStale, {partition_key, min_created_at},
                             PGRES_COMMAND_OK, error);
    if (!stale) {
        spdlog::warn("Stale sweep for {} failed: {}", partition_key, error);
    } else if (size_t n = affected_rows(stale.get()); n > 0) {
        spdlog::debug("Discarded {} stale entries from {}", n, partition_key);
    }

    auto res = exec_params(conn.get(), kPopOldest, {partition_key, min_created_at},
                           PGRES_TUPLES_OK, error);
    if (!res) {
        spdlog::error("Pop from {} failed: {}", partition_key, error);
        result.status = PopStatus::ERROR;
        result.error = error;
        return result;
    }
    if (PQntuples(res.get()) == 0) {
        return result;
    }

    result.entry.id = PQgetvalue(res.get(), 0, 0);
    result.entry.partition_key = PQgetvalue(res.get(), 0, 1);
    try {
        result.entry.data = json::parse(PQgetvalue(res.get(), 0, 2));
    } catch (const json::parse_error& e) {
        spdlog::warn("Entry {} has unparseable data: {}", result.entry.id, e.what());
        result.entry.data = json::object();
    }
    result.entry.created_at = std::stoll(PQgetvalue(res.get(), 0, 3));
    result.status = PopStatus::OK;
    return result;
}

bool PostgresStore::push(const PoolEntry& entry) {
    auto conn = acquire();
    if (!conn) return false;

    std::string error;
    auto res = exec_params(conn.get(),
        "INSERT INTO pool_entries (id, partition_key, data, created_at)"
        " VALUES ($1, $2, $3::jsonb, $4)",
        {entry.id, entry.partition_key, entry.data.dump(), std::to_string(entry.created_at)},
        PGRES_COMMAND_OK, error);
    if (!res) {
        spdlog::error("Push of {} failed: {}", entry.id, error);
        return false;
    }
    return true;
}

bool PostgresStore::remove(const std::string& id) {
    auto conn = acquire();
    if (!conn) return false;

    std::string error;
    if (!exec_params(conn.get(), "DELETE FROM pool_entries WHERE id = $1", {id},
                     PGRES_COMMAND_OK, error)) {
        spdlog::error("Remove of {} failed: {}", id, error);
        return false;
    }
    return true;
}

size_t PostgresStore::count(const std::string& partition_key) {
    auto conn = acquire();
    if (!conn) return 0;

    std::string error;
    auto res = exec_params(conn.get(), "SELECT count(*) FROM pool_entries WHERE partition_key = $1",
                           {partition_key}, PGRES_TUPLES_OK, error);
    if (!res) {
        spdlog::error("Count for {} failed: {}", partition_key, error);
        return 0;
    }
    return std::stoul(PQgetvalue(res.get(), 0, 0));
}

std::map<std::string, size_t> PostgresStore::counts_by_partition() {
    std::map<std::string, size_t> counts;
    for (const auto& p : partitions_) {
        counts[p] = 0;
    }

    auto conn = acquire();
    if (!conn) return counts;

    std::string error;
    auto res = exec_params(conn.get(),
        "SELECT partition_key, count(id) FROM pool_entries GROUP BY partition_key",
        {}, PGRES_TUPLES_OK, error);
    if (!res) {
        spdlog::error("Partition counts failed: {}", error);
        return counts;
    }
    for (int row = 0; row < PQntuples(res.get()); row++) {
        counts[PQgetvalue(res.get(), row, 0)] = std::stoul(PQgetvalue(res.get(), row, 1));
    }
    return counts;
}

// ============================================================================
// Pending flags
// ============================================================================

bool PostgresStore::pending(const std::string& partition_key) {
    auto conn = acquire();
    if (!conn) return false;

    std::string error;
    std::string threshold = std::to_string(clock_() - kPendingStaleMs);
    if (!exec_params(conn.get(), kExpirePending, {threshold}, PGRES_COMMAND_OK, error)) {
        spdlog::warn("Pending expiry failed: {}", error);
    }

    auto res = exec_params(conn.get(),
        "SELECT EXISTS (SELECT 1 FROM pool_entries_pending WHERE partition_key = $1)",
        {partition_key}, PGRES_TUPLES_OK, error);
    if (!res) {
        spdlog::error("Pending check for {} failed: {}", partition_key, error);
        return false;
    }
    return std::string(PQgetvalue(res.get(), 0, 0)) == "t";
}

bool PostgresStore::set_pending(const std::string& partition_key, bool pending) {
    auto conn = acquire();
    if (!conn) return false;

    std::string error;
    PgResult res(nullptr, &PQclear);
    if (pending) {
        // Claim: inserts, or takes over an expired flag; touches no row when held
        int64_t now = clock_();
        res = exec_params(conn.get(),
            "INSERT INTO pool_entries_pending (partition_key, created_at) VALUES ($1, $2)"
            " ON CONFLICT (partition_key) DO UPDATE SET created_at = EXCLUDED.created_at"
            " WHERE pool_entries_pending.created_at < $3",
            {partition_key, std::to_string(now), std::to_string(now - kPendingStaleMs)},
            PGRES_COMMAND_OK, error);
    } else {
        res = exec_params(conn.get(), "DELETE FROM pool_entries_pending WHERE partition_key = $1",
                          {partition_key}, PGRES_COMMAND_OK, error);
    }
    if (!res) {
        spdlog::error("set_pending({}, {}) failed: {}", partition_key, pending, error);
        return false;
    }
    return pending ? affected_rows(res.get()) == 1 : true;
}

size_t PostgresStore::pending_count() {
    auto conn = acquire();
    if (!conn) return 0;

    std::string error;
    std::string threshold = std::to_string(clock_() - kPendingStaleMs);
    if (!exec_params(conn.get(), kExpirePending, {threshold}, PGRES_COMMAND_OK, error)) {
        spdlog::warn("Pending expiry failed: {}", error);
    }

    auto res = exec_params(conn.get(), "SELECT count(*) FROM pool_entries_pending", {},
                           PGRES_TUPLES_OK, error);
    if (!res) {
        spdlog::error("Pending count failed: {}", error);
        return 0;
    }
    return std::stoul(PQgetvalue(res.get(), 0, 0));
}

} // namespace sandpool::pool
