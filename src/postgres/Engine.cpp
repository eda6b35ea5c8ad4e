#include "postgres/Engine.hpp"
#include "errors/Errors.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace agegraph {
namespace postgres {

namespace {

std::string maskPassword(const std::string& connectionString) {
    try {
        return DataSourceName::parse(connectionString).toString(true);
    }
    catch (const errors::ValidationError&) {
        // keyword/value strings ("host=... password=...") are not URIs
        return "<connection string>";
    }
}

} // namespace

// =============================================================================
// PooledConnection
// =============================================================================

PooledConnection::PooledConnection(std::shared_ptr<Engine> engine,
                                   std::unique_ptr<DbConnection> connection,
                                   std::chrono::steady_clock::time_point createdAt)
    : m_engine(std::move(engine))
    , m_connection(std::move(connection))
    , m_createdAt(createdAt)
{}

PooledConnection::~PooledConnection() {
    release();
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : m_engine(std::move(other.m_engine))
    , m_connection(std::move(other.m_connection))
    , m_createdAt(other.m_createdAt)
    , m_invalid(other.m_invalid)
{}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        release();
        m_engine = std::move(other.m_engine);
        m_connection = std::move(other.m_connection);
        m_createdAt = other.m_createdAt;
        m_invalid = other.m_invalid;
    }
    return *this;
}

void PooledConnection::release() {
    if (m_engine && m_connection) {
        m_engine->checkin(std::move(m_connection), m_createdAt, m_invalid);
    }
    m_connection.reset();
    m_engine.reset();
}

// =============================================================================
// Engine
// =============================================================================

std::shared_ptr<Engine> Engine::create(std::string connectionString,
                                       const EngineOptions& options,
                                       ConnectionFactory factory) {
    return std::make_shared<Engine>(Passkey{}, std::move(connectionString), options, std::move(factory));
}

Engine::Engine(Passkey, std::string connectionString, const EngineOptions& options, ConnectionFactory factory)
    : m_connectionString(std::move(connectionString))
    , m_factory(std::move(factory))
    , m_echo(options.echo.value_or(false))
    , m_poolSize(options.poolSize.value_or(DEFAULT_POOL_SIZE))
    , m_maxOverflow(options.maxOverflow.value_or(DEFAULT_MAX_OVERFLOW))
    , m_poolTimeout(options.poolTimeout.value_or(DEFAULT_POOL_TIMEOUT))
    , m_poolRecycle(options.poolRecycle && *options.poolRecycle > 0
                        ? std::optional<std::chrono::seconds>(*options.poolRecycle)
                        : std::nullopt)
    , m_prePing(options.poolPrePing.value_or(false))
{
    if (!m_factory) {
        throw errors::ValidationError("Engine requires a connection factory");
    }
    if (m_poolSize + m_maxOverflow <= 0) {
        throw errors::ValidationError("Engine pool must allow at least one connection");
    }

    AGEGRAPH_LOG_INFO("Engine created for " + displayName()
                      + " (pool_size=" + std::to_string(m_poolSize)
                      + ", max_overflow=" + std::to_string(m_maxOverflow) + ")");
}

Engine::~Engine() {
    std::deque<IdleConnection> idle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        idle.swap(m_idle);
        m_disposed = true;
    }
    for (auto& entry : idle) {
        entry.connection->close();
    }
}

std::string Engine::displayName() const {
    return maskPassword(m_connectionString);
}

std::unique_ptr<DbConnection> Engine::open() {
    AGEGRAPH_LOG_DEBUG("Engine: opening new connection to " + displayName());
    auto connection = m_factory(m_connectionString);
    if (!connection) {
        throw errors::ResourceError("Connection factory returned no connection");
    }
    return connection;
}

PooledConnection Engine::openReserved() {
    try {
        auto fresh = open();
        return PooledConnection(shared_from_this(), std::move(fresh), std::chrono::steady_clock::now());
    }
    catch (const std::exception&) {
        // Give back the slot reserved by the caller
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_checkedOut;
        }
        m_available.notify_one();
        throw;
    }
}

bool Engine::isStale(const IdleConnection& idle) const {
    if (!m_poolRecycle) {
        return false;
    }
    return std::chrono::steady_clock::now() - idle.createdAt > *m_poolRecycle;
}

PooledConnection Engine::connect() {
    const auto deadline = std::chrono::steady_clock::now() + m_poolTimeout;
    std::unique_lock<std::mutex> lock(m_mutex);

    while (true) {
        if (m_disposed) {
            throw errors::ResourceError("Engine has been disposed");
        }

        if (!m_idle.empty()) {
            IdleConnection idle = std::move(m_idle.front());
            m_idle.pop_front();
            ++m_checkedOut;
            lock.unlock();

            bool replace = false;
            if (isStale(idle)) {
                AGEGRAPH_LOG_DEBUG("Engine: recycling connection past pool_recycle");
                replace = true;
            } else if (m_prePing && !idle.connection->ping()) {
                AGEGRAPH_LOG_WARN("Engine: pre-ping failed, replacing connection");
                replace = true;
            } else if (!idle.connection->isOpen()) {
                replace = true;
            }

            if (!replace) {
                return PooledConnection(shared_from_this(), std::move(idle.connection), idle.createdAt);
            }

            idle.connection->close();
            return openReserved();
        }

        const int total = m_checkedOut + static_cast<int>(m_idle.size());
        if (total < m_poolSize + m_maxOverflow) {
            ++m_checkedOut;
            lock.unlock();
            return openReserved();
        }

        if (m_available.wait_until(lock, deadline) == std::cv_status::timeout) {
            if (!m_disposed && m_idle.empty()
                && m_checkedOut + static_cast<int>(m_idle.size()) >= m_poolSize + m_maxOverflow) {
                throw errors::ResourceError(
                    "Pool limit of size " + std::to_string(m_poolSize) + " overflow "
                    + std::to_string(m_maxOverflow) + " reached, connection timed out after "
                    + std::to_string(m_poolTimeout.count()) + "s");
            }
        }
    }
}

void Engine::checkin(std::unique_ptr<DbConnection> connection,
                     std::chrono::steady_clock::time_point createdAt,
                     bool invalid) {
    // Reset-on-return: never pool a connection with an open transaction
    if (!invalid && connection->inTransaction()) {
        try {
            connection->rollback();
        }
        catch (const errors::ResourceError& e) {
            AGEGRAPH_LOG_WARN("Engine: rollback on return failed, discarding connection: "
                              + std::string(e.what()));
            invalid = true;
        }
    }

    bool keep = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_checkedOut;
        keep = !m_disposed && !invalid && connection->isOpen()
            && static_cast<int>(m_idle.size()) < m_poolSize;
        if (keep) {
            m_idle.push_back(IdleConnection{std::move(connection), createdAt});
        }
    }
    m_available.notify_one();

    if (!keep && connection) {
        connection->close();
    }
}

void Engine::dispose() {
    std::deque<IdleConnection> idle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_disposed) {
            return;
        }
        m_disposed = true;
        idle.swap(m_idle);
    }
    m_available.notify_all();

    for (auto& entry : idle) {
        entry.connection->close();
    }

    AGEGRAPH_LOG_INFO("Engine disposed for " + displayName()
                      + " (" + std::to_string(idle.size()) + " idle connections closed)");
}

bool Engine::isDisposed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disposed;
}

PoolStatus Engine::status() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    PoolStatus s;
    s.poolSize = m_poolSize;
    s.idle = static_cast<int>(m_idle.size());
    s.checkedOut = m_checkedOut;
    s.overflow = std::max(0, m_checkedOut + s.idle - m_poolSize);
    s.disposed = m_disposed;
    return s;
}

} // namespace postgres
} // namespace agegraph
