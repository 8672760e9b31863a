#pragma once

#include "config/config_types.hpp"
#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

namespace sqlrunner {

using PooledLease = std::unique_ptr<PooledConnection>;

/**
 * @brief One long-lived connection bound to (ConnectionKey, session id)
 *
 * The mutex is held by the SessionLease for as long as it lives; closed is
 * set once the slot has left the registry and must not be reused.
 */
struct SessionSlot {
    explicit SessionSlot(std::string k) : key(std::move(k)) {}

    std::string key;
    std::mutex mutex;
    std::unique_ptr<IDbConnection> conn;
    bool closed = false;
};

/**
 * @brief Exclusive RAII lease over a session connection
 *
 * Holds the session's mutex, so a second request for the same session
 * blocks until this lease is released. If the connection is found dead on
 * release, the session is evicted and the next request reconnects.
 * A lease must not outlive the multiplexer that issued it.
 */
class SessionLease {
public:
    using EvictFunc = std::function<void(const std::shared_ptr<SessionSlot>&)>;

    SessionLease() = default;
    SessionLease(std::shared_ptr<SessionSlot> slot, std::unique_lock<std::mutex> lock, EvictFunc evict);
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept = default;
    SessionLease& operator=(SessionLease&& other) noexcept;

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    /**
     * @brief Give the session back; later calls are no-ops
     */
    void release();

    IDbConnection* get() const { return slot_ ? slot_->conn.get() : nullptr; }
    IDbConnection* operator->() const { return get(); }
    IDbConnection& operator*() const { return *get(); }

    [[nodiscard]] bool is_valid() const { return get() != nullptr && get()->is_connected(); }

    /// "<profile id>:<database>:session:<session id>"
    [[nodiscard]] const std::string& session_key() const;

private:
    std::shared_ptr<SessionSlot> slot_;
    std::unique_lock<std::mutex> lock_;
    EvictFunc evict_;
};

/**
 * @brief Dual-mode connection registry
 *
 * Pooled mode: one bounded GenericConnectionPool per ConnectionKey
 * ("<profile id>:<database>"), created lazily on the first request.
 * Session mode: exactly one connection per (ConnectionKey, session id),
 * opened eagerly on first request and reused until closed or found dead.
 *
 * Both registries share one connection factory per key, built by the
 * ConnectorBuilder (password lookup, TLS files, SSH tunnel).
 *
 * Thread-safety: registry lookups use a shared lock, creation a unique lock
 * with a double check. The registry lock is never held while waiting on a
 * session's mutex, while a connector is being built or while a connection
 * is being opened. Concurrent first requests for one key wait on the same
 * in-flight build.
 */
class ConnectionMultiplexer {
public:
    /**
     * @brief Builds the connection factory for a profile and database
     * @throws ConnectionError (e.g. "SSH connection failed: ...")
     */
    using ConnectorBuilder = std::function<std::shared_ptr<IConnectionFactory>(
        const ConnectionProfile& profile, const std::string& database)>;

    using PoolFactory = std::function<std::shared_ptr<IConnectionPool>(
        const std::string& key, const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory)>;

    struct Options {
        PoolConfig pool;
        std::chrono::milliseconds reap_interval{5000};
    };

    struct Stats {
        size_t total_pools = 0;
        size_t total_sessions = 0;
        size_t total_connectors = 0;
    };

    ConnectionMultiplexer(Options options, ConnectorBuilder connector_builder,
                          PoolFactory pool_factory = default_pool_factory());

    ~ConnectionMultiplexer();

    ConnectionMultiplexer(const ConnectionMultiplexer&) = delete;
    ConnectionMultiplexer& operator=(const ConnectionMultiplexer&) = delete;

    /**
     * @brief Start the idle reaper thread (idempotent)
     */
    void start();

    /**
     * @brief Stop the reaper and close every pool and session (idempotent)
     */
    void shutdown();

    /**
     * @brief Borrow an ephemeral connection from the key's pool
     * @param database Target database (empty = profile default)
     * @throws ConnectionError
     */
    [[nodiscard]] PooledLease acquire_pooled(const ConnectionProfile& profile,
                                             const std::string& database = "");

    /**
     * @brief Return a pooled lease now (the destructor does the same)
     */
    void release(PooledLease lease);

    /**
     * @brief Get the exclusive lease for a session, connecting on first use
     * @throws ConnectionError
     */
    [[nodiscard]] SessionLease acquire_session(const ConnectionProfile& profile,
                                               const std::string& session_id,
                                               const std::string& database = "");

    /**
     * @brief Close one session (waits for an outstanding lease to be released)
     */
    void close_session(const ConnectionProfile& profile, const std::string& session_id,
                       const std::string& database = "");

    /**
     * @brief Close the pool, sessions and connector for one ConnectionKey
     */
    void close_all_for_key(const std::string& key);

    /**
     * @brief Close everything for a profile id, across all databases
     */
    void close_all_for_profile_id(const std::string& profile_id);

    /**
     * @brief Close every pool and session
     */
    void close_all();

    [[nodiscard]] Stats get_stats() const;

    /// "<profile id>:<database>", database defaulting to the profile's, then "postgres"
    [[nodiscard]] static std::string connection_key(const ConnectionProfile& profile,
                                                    const std::string& database = "");

    [[nodiscard]] static std::string session_key(const std::string& key, const std::string& session_id);

    [[nodiscard]] static PoolFactory default_pool_factory();

private:
    using KeyPredicate = std::function<bool(const std::string&)>;

    [[nodiscard]] static std::string effective_database(const ConnectionProfile& profile,
                                                        const std::string& database);

    std::shared_ptr<IConnectionFactory> get_connector(const ConnectionProfile& profile,
                                                      const std::string& database,
                                                      const std::string& key);
    std::shared_ptr<IConnectionPool> get_pool(const ConnectionProfile& profile,
                                              const std::string& database,
                                              const std::string& key);
    std::shared_ptr<SessionSlot> get_slot(const std::string& session_key);

    void evict_session(const std::shared_ptr<SessionSlot>& slot);

    /**
     * @brief Remove matching entries from all registries, then close them
     */
    void close_matching(const KeyPredicate& pool_pred, const KeyPredicate& session_pred);

    static void close_slot(const std::shared_ptr<SessionSlot>& slot);

    void reaper_loop(std::stop_token stop);

    void ensure_running() const;

    Options options_;
    ConnectorBuilder connector_builder_;
    PoolFactory pool_factory_;

    std::unordered_map<std::string, std::shared_ptr<IConnectionFactory>> connectors_;
    std::unordered_map<std::string, std::shared_future<std::shared_ptr<IConnectionFactory>>> pending_connectors_;
    std::unordered_map<std::string, std::shared_ptr<IConnectionPool>> pools_;
    std::unordered_map<std::string, std::shared_ptr<SessionSlot>> sessions_;
    mutable std::shared_mutex mutex_;

    std::jthread reaper_;
    std::mutex reaper_mutex_;
    std::condition_variable_any reaper_cv_;

    std::atomic<bool> started_{false};
    std::atomic<bool> shutdown_{false};
};

} // namespace sqlrunner
