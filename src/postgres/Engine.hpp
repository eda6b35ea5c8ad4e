#pragma once

#include "postgres/ConnectionSettings.hpp"
#include "postgres/DbConnection.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace agegraph {
namespace postgres {

class Engine;

/**
 * Counters describing the pool at one instant
 */
struct PoolStatus {
    int poolSize = 0;
    int idle = 0;
    int checkedOut = 0;
    int overflow = 0;
    bool disposed = false;
};

/**
 * A connection borrowed from an Engine. Returned to the pool when destroyed.
 * Move-only.
 */
class PooledConnection {
public:
    PooledConnection() = default;
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    DbConnection& operator*() const { return *m_connection; }
    DbConnection* operator->() const { return m_connection.get(); }
    explicit operator bool() const { return m_connection != nullptr; }

    /**
     * Mark the connection as unusable: it is closed instead of being pooled
     */
    void invalidate() { m_invalid = true; }

    /**
     * Give the connection back now
     */
    void release();

private:
    friend class Engine;

    PooledConnection(std::shared_ptr<Engine> engine,
                     std::unique_ptr<DbConnection> connection,
                     std::chrono::steady_clock::time_point createdAt);

    std::shared_ptr<Engine> m_engine;
    std::unique_ptr<DbConnection> m_connection;
    std::chrono::steady_clock::time_point m_createdAt{};
    bool m_invalid = false;
};

/**
 * Connection pool for one database target.
 *
 * Up to poolSize connections are kept idle; up to maxOverflow more may be
 * opened under load and are closed when returned. Idle connections are
 * handed out oldest first (FIFO). A caller finding the pool exhausted waits
 * up to poolTimeout seconds. Creating an Engine opens no connection.
 *
 * Usage:
 *   auto engine = Engine::create(settings.libpqConnectionString(),
 *                                settings.deriveEngineOptions(),
 *                                PqxxConnection::open);
 *   auto conn = engine->connect();
 *   conn->begin(std::nullopt, false);
 */
class Engine : public std::enable_shared_from_this<Engine> {
    // Restricts construction to create()
    struct Passkey {};

public:
    static constexpr int DEFAULT_POOL_SIZE = 5;
    static constexpr int DEFAULT_MAX_OVERFLOW = 10;
    static constexpr int DEFAULT_POOL_TIMEOUT = 30;

    static std::shared_ptr<Engine> create(std::string connectionString,
                                          const EngineOptions& options,
                                          ConnectionFactory factory);
    Engine(Passkey, std::string connectionString, const EngineOptions& options, ConnectionFactory factory);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * Borrow a connection.
     * @throws errors::ResourceError if the engine is disposed, the pool stays
     *         exhausted for poolTimeout seconds, or a connection cannot be
     *         opened
     */
    PooledConnection connect();

    /**
     * Close every idle connection. Borrowed connections are closed when they
     * come back. Later connect() calls fail. Safe to call more than once.
     */
    void dispose();

    bool isDisposed() const;
    PoolStatus status() const;

    bool echo() const { return m_echo; }
    int poolSize() const { return m_poolSize; }
    int maxOverflow() const { return m_maxOverflow; }

    /**
     * Connection string with the password masked
     */
    std::string displayName() const;

private:
    friend class PooledConnection;

    struct IdleConnection {
        std::unique_ptr<DbConnection> connection;
        std::chrono::steady_clock::time_point createdAt;
    };

    std::unique_ptr<DbConnection> open();

    // Caller has already counted the connection in m_checkedOut
    PooledConnection openReserved();
    bool isStale(const IdleConnection& idle) const;
    void checkin(std::unique_ptr<DbConnection> connection,
                 std::chrono::steady_clock::time_point createdAt,
                 bool invalid);

    const std::string m_connectionString;
    const ConnectionFactory m_factory;
    const bool m_echo;
    const int m_poolSize;
    const int m_maxOverflow;
    const std::chrono::seconds m_poolTimeout;
    const std::optional<std::chrono::seconds> m_poolRecycle;
    const bool m_prePing;

    mutable std::mutex m_mutex;
    std::condition_variable m_available;
    std::deque<IdleConnection> m_idle;
    int m_checkedOut = 0;
    bool m_disposed = false;
};

} // namespace postgres
} // namespace agegraph
