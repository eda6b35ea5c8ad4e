#pragma once

#include "cache/LruCache.hpp"
#include "postgres/ConnectionSettings.hpp"
#include "postgres/Engine.hpp"
#include "postgres/ExecutionContext.hpp"
#include "postgres/PqxxConnection.hpp"
#include "postgres/Session.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace agegraph {
namespace postgres {

enum class ContextState {
    Uninitialized,
    EngineReady,
    SessionFactoryReady
};

std::string toString(ContextState state);

/**
 * Engine and session factory owned by one execution context
 */
struct CachedEngineHandle {
    std::shared_ptr<Engine> engine;
    std::shared_ptr<SessionFactory> sessionFactory;
};

/**
 * Lazily builds, caches and disposes one Engine per execution context for a
 * single ConnectionSettings target.
 *
 * Every call names its ExecutionContext explicitly. Lookup and creation run
 * under one mutex, so a context never ends up with two engines. At most
 * maxContexts handles are kept; the least recently used one is disposed when
 * a new context arrives at capacity.
 *
 * Usage:
 *   EngineRegistry registry(ConnectionSettings::fromNameAndDsn("primary", dsn));
 *   boost::asio::io_context ioc;
 *   ExecutionContext ctx(ioc);
 *
 *   auto cities = registry.scopedTransaction(ctx, [](Session& s) {
 *       return s.fetchRecords("SELECT * FROM cypher('geo', $$ MATCH (c:City) RETURN c $$) AS (c agtype)");
 *   });
 *
 *   registry.dispose(ctx);
 */
class EngineRegistry {
public:
    static constexpr size_t DEFAULT_MAX_CONTEXTS = 100;
    static constexpr size_t DEFAULT_WORKER_THREADS = 4;

    using TransactionBody = std::function<void(Session&)>;
    using CompletionHandler = std::function<void(std::exception_ptr)>;

    explicit EngineRegistry(ConnectionSettings settings,
                            ConnectionFactory factory = &PqxxConnection::open,
                            size_t maxContexts = DEFAULT_MAX_CONTEXTS,
                            size_t workerThreads = DEFAULT_WORKER_THREADS);
    ~EngineRegistry();

    EngineRegistry(const EngineRegistry&) = delete;
    EngineRegistry& operator=(const EngineRegistry&) = delete;

    /**
     * Engine for the context, built on first use. Idempotent per context.
     */
    std::shared_ptr<Engine> acquireEngine(const ExecutionContext& ctx);

    /**
     * Session factory for the context (expire-on-commit disabled), building
     * the engine first if needed.
     */
    std::shared_ptr<SessionFactory> acquireSessionFactory(const ExecutionContext& ctx);

    /**
     * Run body(Session&) in a transaction: commit on normal return, roll back
     * if body throws, always return the connection to the pool. The
     * isolation level, if given, is applied before body runs. Returns what
     * body returns; exceptions propagate unchanged after the rollback.
     */
    template <typename Body>
    auto scopedTransaction(const ExecutionContext& ctx,
                           Body&& body,
                           std::optional<IsolationLevel> isolation = std::nullopt)
        -> std::invoke_result_t<Body&, Session&>;

    /**
     * Run a transaction on the registry's worker threads and post
     * handler(error) to ctx's executor once it has committed (error is null)
     * or rolled back (error holds the exception). If cancelled is set before
     * body starts or before commit, the transaction is rolled back with
     * errors::TransactionCancelled.
     */
    void asyncScopedTransaction(const ExecutionContext& ctx,
                                TransactionBody body,
                                CompletionHandler handler,
                                std::optional<IsolationLevel> isolation = std::nullopt,
                                std::shared_ptr<std::atomic<bool>> cancelled = nullptr);

    /**
     * Dispose and forget the context's engine. No-op if none is cached.
     */
    void dispose(const ExecutionContext& ctx);

    /**
     * Dispose every cached engine
     */
    void disposeAll();

    ContextState state(const ExecutionContext& ctx) const;
    size_t contextCount() const;

    const ConnectionSettings& settings() const { return m_settings; }

private:
    std::shared_ptr<Engine> buildEngine() const;
    void onEvicted(const ExecutionContext::Key& key, CachedEngineHandle& handle);
    static void disposeEvicted(std::vector<std::shared_ptr<Engine>>& evicted);

    const ConnectionSettings m_settings;
    const ConnectionFactory m_factory;

    mutable std::mutex m_mutex;
    cache::LruCache<ExecutionContext::Key, CachedEngineHandle> m_handles;
    // Pushed out by capacity pressure, disposed once m_mutex is released
    std::vector<std::shared_ptr<Engine>> m_evicted;

    boost::asio::thread_pool m_workers;
};

template <typename Body>
auto EngineRegistry::scopedTransaction(const ExecutionContext& ctx,
                                       Body&& body,
                                       std::optional<IsolationLevel> isolation)
    -> std::invoke_result_t<Body&, Session&>
{
    using Result = std::invoke_result_t<Body&, Session&>;

    auto session = acquireSessionFactory(ctx)->open();
    session->begin(isolation);

    TransactionGuard guard(*session);
    if constexpr (std::is_void_v<Result>) {
        body(*session);
        guard.commit();
    } else {
        Result result = body(*session);
        guard.commit();
        return result;
    }
}

} // namespace postgres
} // namespace agegraph
