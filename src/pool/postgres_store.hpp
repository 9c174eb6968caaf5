/**
 * PostgreSQL pool store
 *
 * Durable, multi-node-safe backend. pop deletes-and-returns the oldest
 * fresh row with FOR UPDATE SKIP LOCKED, so concurrent poppers on any
 * number of nodes get distinct rows without blocking each other.
 * Pending flags live in their own table and expire lazily.
 */
#pragma once
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "pool/store.hpp"

struct pg_conn;

namespace sandpool::pool {

class PostgresStore : public Store {
public:
    PostgresStore(std::string conninfo, int pool_size = 4,
                  std::vector<std::string> partitions = {}, Clock clock = {});
    ~PostgresStore() override;

    // Non-copyable
    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    const char* name() const override { return "postgres"; }

    // Opens the connection pool and runs migrate()
    bool init() override;

    PopResult pop(const std::string& partition_key, int64_t max_age_ms) override;
    bool push(const PoolEntry& entry) override;
    bool remove(const std::string& id) override;

    size_t count(const std::string& partition_key) override;
    std::map<std::string, size_t> counts_by_partition() override;

    bool pending(const std::string& partition_key) override;
    bool set_pending(const std::string& partition_key, bool pending) override;
    size_t pending_count() override;

    void stop() override;

    // Create tables and indexes if absent
    bool migrate();
    bool drop_tables();

private:
    // Borrowed connection, returned to the pool on destruction
    class Lease {
    public:
        Lease(PostgresStore& store, pg_conn* conn) : store_(store), conn_(conn) {}
        ~Lease() { if (conn_) store_.release(conn_); }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        pg_conn* get() const { return conn_; }
        explicit operator bool() const { return conn_ != nullptr; }

    private:
        PostgresStore& store_;
        pg_conn* conn_;
    };

    Lease acquire();
    void release(pg_conn* conn);

    std::string conninfo_;
    int pool_size_;
    std::vector<std::string> partitions_;
    Clock clock_;

    std::mutex mutex_;
    std::condition_variable available_cv_;
    std::vector<pg_conn*> idle_;
    std::vector<pg_conn*> all_;
    bool stopped_ = true;
};

} // namespace sandpool::pool
