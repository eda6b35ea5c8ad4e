#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/execution_context.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>

namespace agegraph {
namespace postgres {

/**
 * Asio service attached to each io_context, carrying an identifier that is
 * never reused. It lives and dies with its io_context, so a new io_context
 * allocated at a dead one's address still gets a fresh identifier.
 */
class ContextIdentity : public boost::asio::execution_context::service {
public:
    static boost::asio::execution_context::id id;

    explicit ContextIdentity(boost::asio::execution_context& owner);

    uint64_t value() const { return m_value; }

private:
    void shutdown() override {}

    const uint64_t m_value;
};

/**
 * Explicit handle on the scheduler a caller runs on.
 *
 * Engines are cached per io_context: connections opened for one scheduler
 * are never handed to another. The handle is cheap to copy and must not
 * outlive the io_context it refers to.
 *
 * Usage:
 *   boost::asio::io_context ioc;
 *   ExecutionContext ctx(ioc);
 *   registry.scopedTransaction(ctx, [](Session& s) { ... });
 */
class ExecutionContext {
public:
    using Key = uint64_t;

    explicit ExecutionContext(boost::asio::io_context& ioc);

    Key key() const { return m_key; }

    /**
     * Executor on which completion handlers for this context run
     */
    const boost::asio::any_io_executor& executor() const { return m_executor; }

    bool operator==(const ExecutionContext& other) const { return m_key == other.m_key; }
    bool operator!=(const ExecutionContext& other) const { return !(*this == other); }

private:
    Key m_key;
    boost::asio::any_io_executor m_executor;
};

} // namespace postgres
} // namespace agegraph
