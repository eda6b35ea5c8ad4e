#include "postgres/EngineRegistry.hpp"
#include "errors/Errors.hpp"
#include "util/Logger.hpp"
#include <boost/asio/post.hpp>
#include <vector>

namespace agegraph {
namespace postgres {

namespace {

std::string describe(ExecutionContext::Key key) {
    return "context #" + std::to_string(key);
}

void throwIfCancelled(const std::shared_ptr<std::atomic<bool>>& cancelled) {
    if (cancelled && cancelled->load()) {
        throw errors::TransactionCancelled();
    }
}

} // namespace

std::string toString(ContextState state) {
    switch (state) {
        case ContextState::Uninitialized:       return "UNINITIALIZED";
        case ContextState::EngineReady:         return "ENGINE_READY";
        case ContextState::SessionFactoryReady: return "SESSION_FACTORY_READY";
    }
    return "UNINITIALIZED";
}

EngineRegistry::EngineRegistry(ConnectionSettings settings,
                               ConnectionFactory factory,
                               size_t maxContexts,
                               size_t workerThreads)
    : m_settings(std::move(settings))
    , m_factory(std::move(factory))
    , m_handles(maxContexts, [this](const ExecutionContext::Key& key, CachedEngineHandle& handle) {
          onEvicted(key, handle);
      })
    , m_workers(workerThreads > 0 ? workerThreads : 1)
{
    if (!m_factory) {
        throw errors::ValidationError("EngineRegistry requires a connection factory");
    }
    m_settings.validate();
}

EngineRegistry::~EngineRegistry() {
    // Let pending asynchronous transactions finish before engines go away
    m_workers.join();
    disposeAll();
}

void EngineRegistry::onEvicted(const ExecutionContext::Key& key, CachedEngineHandle& handle) {
    // Runs under m_mutex: closing connections is left to disposeEvicted()
    AGEGRAPH_LOG_WARN("EngineRegistry: evicting engine of " + describe(key) + " (capacity reached)");
    if (handle.engine) {
        m_evicted.push_back(handle.engine);
    }
}

void EngineRegistry::disposeEvicted(std::vector<std::shared_ptr<Engine>>& evicted) {
    for (auto& engine : evicted) {
        engine->dispose();
    }
    evicted.clear();
}

std::shared_ptr<Engine> EngineRegistry::buildEngine() const {
    return Engine::create(m_settings.libpqConnectionString(),
                          m_settings.deriveEngineOptions(),
                          m_factory);
}

std::shared_ptr<Engine> EngineRegistry::acquireEngine(const ExecutionContext& ctx) {
    std::shared_ptr<Engine> engine;
    std::vector<std::shared_ptr<Engine>> evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (auto handle = m_handles.get(ctx.key())) {
            if (handle->engine) {
                return handle->engine;
            }
        }

        // Engine construction performs no I/O: building under the lock keeps a
        // single engine per context
        CachedEngineHandle handle;
        handle.engine = buildEngine();
        m_handles.put(ctx.key(), handle);
        evicted.swap(m_evicted);
        engine = handle.engine;
    }

    disposeEvicted(evicted);

    AGEGRAPH_LOG_DEBUG("EngineRegistry: engine ready for " + describe(ctx.key())
                       + " (" + m_settings.name() + ")");
    return engine;
}

std::shared_ptr<SessionFactory> EngineRegistry::acquireSessionFactory(const ExecutionContext& ctx) {
    CachedEngineHandle handle;
    std::vector<std::shared_ptr<Engine>> evicted;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (auto cached = m_handles.get(ctx.key())) {
            handle = *cached;
        }

        if (handle.sessionFactory) {
            return handle.sessionFactory;
        }

        if (!handle.engine) {
            handle.engine = buildEngine();
        }

        SessionOptions options;
        options.expireOnCommit = false;
        options.readOnly = m_settings.readonly;
        handle.sessionFactory = std::make_shared<SessionFactory>(handle.engine, options);

        m_handles.put(ctx.key(), handle);
        evicted.swap(m_evicted);
    }

    disposeEvicted(evicted);

    AGEGRAPH_LOG_DEBUG("EngineRegistry: session factory ready for " + describe(ctx.key()));
    return handle.sessionFactory;
}

void EngineRegistry::asyncScopedTransaction(const ExecutionContext& ctx,
                                            TransactionBody body,
                                            CompletionHandler handler,
                                            std::optional<IsolationLevel> isolation,
                                            std::shared_ptr<std::atomic<bool>> cancelled) {
    boost::asio::post(m_workers,
        [this, ctx, body = std::move(body), handler = std::move(handler), isolation, cancelled]() {
            std::exception_ptr error;
            try {
                throwIfCancelled(cancelled);
                scopedTransaction(ctx, [&body, &cancelled](Session& session) {
                    body(session);
                    throwIfCancelled(cancelled);
                }, isolation);
            }
            catch (...) {
                // Handed to the caller's completion handler
                error = std::current_exception();
            }

            boost::asio::post(ctx.executor(), [handler, error]() {
                handler(error);
            });
        });
}

void EngineRegistry::dispose(const ExecutionContext& ctx) {
    std::shared_ptr<Engine> engine;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (const auto* handle = m_handles.peek(ctx.key())) {
            engine = handle->engine;
        }
        m_handles.erase(ctx.key());
    }

    if (!engine) {
        AGEGRAPH_LOG_DEBUG("EngineRegistry: nothing to dispose for " + describe(ctx.key()));
        return;
    }

    engine->dispose();
}

void EngineRegistry::disposeAll() {
    std::vector<std::shared_ptr<Engine>> engines;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& key : m_handles.keys()) {
            if (const auto* handle = m_handles.peek(key)) {
                if (handle->engine) {
                    engines.push_back(handle->engine);
                }
            }
        }
        m_handles.clear();
    }

    for (auto& engine : engines) {
        engine->dispose();
    }
}

ContextState EngineRegistry::state(const ExecutionContext& ctx) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto* handle = m_handles.peek(ctx.key());
    if (!handle || !handle->engine) {
        return ContextState::Uninitialized;
    }
    return handle->sessionFactory ? ContextState::SessionFactoryReady : ContextState::EngineReady;
}

size_t EngineRegistry::contextCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_handles.size();
}

} // namespace postgres
} // namespace agegraph
