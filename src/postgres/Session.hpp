#pragma once

#include "postgres/Engine.hpp"
#include "graph/GraphRecord.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agegraph {
namespace postgres {

struct SessionOptions {
    /**
     * When false, values read in a transaction stay valid after it ends.
     * Rows are returned by value, so this is always honoured; kept so the
     * factory configuration is explicit.
     */
    bool expireOnCommit = false;
    bool readOnly = false;
};

/**
 * A unit of work over one pooled connection.
 *
 * The connection goes back to the pool when the session is closed or
 * destroyed; an open transaction is rolled back first.
 */
class Session {
public:
    Session(PooledConnection connection, SessionOptions options, bool echo);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * Start a transaction, optionally at a given isolation level
     */
    void begin(std::optional<IsolationLevel> isolation = std::nullopt);

    /**
     * Run SQL inside the open transaction and return its rows
     * @throws errors::ResourceError
     */
    std::vector<agtype::Row> execute(const std::string& sql);

    /**
     * Run SQL and decode the agtype results into vertices and edges
     * @throws errors::ResourceError, errors::DecodeError, errors::SchemaMismatchError
     */
    std::vector<graph::GraphRecord> fetchRecords(const std::string& sql);

    void commit();
    void rollback();

    /**
     * Roll back without throwing. A connection whose rollback fails is
     * discarded instead of going back to the pool.
     */
    void rollbackNoThrow() noexcept;

    bool inTransaction() const;
    bool isClosed() const { return !m_connection; }

    /**
     * Roll back if needed and return the connection to the pool
     */
    void close();

    const SessionOptions& options() const { return m_options; }

private:
    DbConnection& connection();

    PooledConnection m_connection;
    SessionOptions m_options;
    bool m_echo;
};

/**
 * Builds sessions bound to one Engine.
 */
class SessionFactory {
public:
    SessionFactory(std::shared_ptr<Engine> engine, SessionOptions options = {});

    /**
     * Borrow a connection and wrap it in a session
     * @throws errors::ResourceError
     */
    std::unique_ptr<Session> open() const;

    const std::shared_ptr<Engine>& engine() const { return m_engine; }
    bool expireOnCommit() const { return m_options.expireOnCommit; }
    const SessionOptions& options() const { return m_options; }

private:
    std::shared_ptr<Engine> m_engine;
    SessionOptions m_options;
};

/**
 * Commits on commit(), rolls the session back if destroyed before that.
 * Used by EngineRegistry::scopedTransaction.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Session& session) : m_session(session) {}
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    void commit();

private:
    Session& m_session;
    bool m_done = false;
};

} // namespace postgres
} // namespace agegraph
