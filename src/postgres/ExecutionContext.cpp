#include "postgres/ExecutionContext.hpp"
#include <atomic>

namespace agegraph {
namespace postgres {

namespace {

std::atomic<uint64_t> g_nextContextId{1};

} // namespace

boost::asio::execution_context::id ContextIdentity::id;

ContextIdentity::ContextIdentity(boost::asio::execution_context& owner)
    : boost::asio::execution_context::service(owner)
    , m_value(g_nextContextId.fetch_add(1))
{}

ExecutionContext::ExecutionContext(boost::asio::io_context& ioc)
    : m_key(boost::asio::use_service<ContextIdentity>(
          static_cast<boost::asio::execution_context&>(ioc)).value())
    , m_executor(ioc.get_executor())
{}

} // namespace postgres
} // namespace agegraph
