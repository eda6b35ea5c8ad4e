#include "postgres/DbConnection.hpp"
#include "errors/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace agegraph {
namespace postgres {

std::string toString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::ReadUncommitted: return "READ UNCOMMITTED";
        case IsolationLevel::ReadCommitted:   return "READ COMMITTED";
        case IsolationLevel::RepeatableRead:  return "REPEATABLE READ";
        case IsolationLevel::Serializable:    return "SERIALIZABLE";
    }
    return "READ COMMITTED";
}

IsolationLevel isolationLevelFromString(const std::string& name) {
    std::string normalized = name;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
        return c == '_' ? ' ' : static_cast<char>(std::toupper(c));
    });

    if (normalized == "READ UNCOMMITTED") return IsolationLevel::ReadUncommitted;
    if (normalized == "READ COMMITTED") return IsolationLevel::ReadCommitted;
    if (normalized == "REPEATABLE READ") return IsolationLevel::RepeatableRead;
    if (normalized == "SERIALIZABLE") return IsolationLevel::Serializable;

    throw errors::ValidationError("Unknown isolation level: " + name);
}

} // namespace postgres
} // namespace agegraph
