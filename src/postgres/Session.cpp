#include "postgres/Session.hpp"
#include "errors/Errors.hpp"
#include "util/Logger.hpp"

namespace agegraph {
namespace postgres {

// =============================================================================
// Session
// =============================================================================

Session::Session(PooledConnection connection, SessionOptions options, bool echo)
    : m_connection(std::move(connection))
    , m_options(options)
    , m_echo(echo)
{}

Session::~Session() {
    if (m_connection && m_connection->inTransaction()) {
        rollbackNoThrow();
    }
    m_connection.release();
}

DbConnection& Session::connection() {
    if (!m_connection) {
        throw errors::ResourceError("Session is closed");
    }
    return *m_connection;
}

void Session::begin(std::optional<IsolationLevel> isolation) {
    if (m_echo) {
        AGEGRAPH_LOG_INFO(isolation ? "BEGIN ISOLATION LEVEL " + toString(*isolation) : std::string("BEGIN"));
    }
    connection().begin(isolation, m_options.readOnly);
}

std::vector<agtype::Row> Session::execute(const std::string& sql) {
    if (m_echo) {
        AGEGRAPH_LOG_INFO(util::Logger::truncate(sql));
    }
    auto rows = connection().execute(sql);
    AGEGRAPH_LOG_DEBUG("Session: statement returned " + std::to_string(rows.size()) + " rows");
    return rows;
}

std::vector<graph::GraphRecord> Session::fetchRecords(const std::string& sql) {
    return graph::GraphRecord::fromRawRows(execute(sql));
}

void Session::commit() {
    if (m_echo) {
        AGEGRAPH_LOG_INFO("COMMIT");
    }
    connection().commit();
}

void Session::rollback() {
    if (m_echo) {
        AGEGRAPH_LOG_INFO("ROLLBACK");
    }
    connection().rollback();
}

void Session::rollbackNoThrow() noexcept {
    if (!m_connection) {
        return;
    }
    try {
        rollback();
    }
    catch (const std::exception& e) {
        AGEGRAPH_LOG_ERROR("Session: rollback failed, discarding connection: " + std::string(e.what()));
        m_connection.invalidate();
    }
}

bool Session::inTransaction() const {
    return m_connection && m_connection->inTransaction();
}

void Session::close() {
    if (!m_connection) {
        return;
    }
    if (m_connection->inTransaction()) {
        rollbackNoThrow();
    }
    m_connection.release();
}

// =============================================================================
// SessionFactory
// =============================================================================

SessionFactory::SessionFactory(std::shared_ptr<Engine> engine, SessionOptions options)
    : m_engine(std::move(engine))
    , m_options(options)
{
    if (!m_engine) {
        throw errors::ValidationError("SessionFactory requires an engine");
    }
}

std::unique_ptr<Session> SessionFactory::open() const {
    return std::make_unique<Session>(m_engine->connect(), m_options, m_engine->echo());
}

// =============================================================================
// TransactionGuard
// =============================================================================

TransactionGuard::~TransactionGuard() {
    if (!m_done) {
        AGEGRAPH_LOG_DEBUG("Transaction did not complete, rolling back");
        m_session.rollbackNoThrow();
    }
}

void TransactionGuard::commit() {
    m_session.commit();
    m_done = true;
}

} // namespace postgres
} // namespace agegraph
