#pragma once

#include "agtype/Row.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agegraph {
namespace postgres {

enum class IsolationLevel {
    ReadUncommitted,
    ReadCommitted,
    RepeatableRead,
    Serializable
};

/**
 * "READ UNCOMMITTED", "READ COMMITTED", "REPEATABLE READ", "SERIALIZABLE"
 */
std::string toString(IsolationLevel level);

/**
 * Inverse of toString(). Case-insensitive, '_' accepted in place of ' '.
 * @throws errors::ValidationError on any other value
 */
IsolationLevel isolationLevelFromString(const std::string& name);

/**
 * One live database connection.
 *
 * At most one transaction is open at a time: begin() starts it, commit() or
 * rollback() ends it. execute() runs inside the open transaction.
 * Driver failures are reported as errors::ResourceError.
 */
class DbConnection {
public:
    virtual ~DbConnection() = default;

    virtual bool isOpen() const = 0;

    /**
     * Cheap liveness check (SELECT 1). Returns false instead of throwing.
     */
    virtual bool ping() = 0;

    virtual void begin(std::optional<IsolationLevel> isolation, bool readOnly) = 0;
    virtual std::vector<agtype::Row> execute(const std::string& sql) = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;
    virtual bool inTransaction() const = 0;

    virtual void close() = 0;
};

/**
 * Opens a new connection from a libpq connection string.
 */
using ConnectionFactory = std::function<std::unique_ptr<DbConnection>(const std::string& connectionString)>;

} // namespace postgres
} // namespace agegraph
