#pragma once

#include "postgres/DbConnection.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <string>

namespace agegraph {
namespace postgres {

/**
 * DbConnection backed by a pqxx::connection.
 *
 * Transactions are pqxx::transaction<isolation, write_policy> objects, so
 * isolation level and read-only mode are applied by libpqxx when the
 * transaction begins. Column values are converted to JSON from their type OID
 * (integers, floats, booleans; everything else, agtype included, as text).
 */
class PqxxConnection : public DbConnection {
public:
    /**
     * @throws errors::ResourceError if the connection cannot be opened
     */
    explicit PqxxConnection(const std::string& connectionString);
    ~PqxxConnection() override;

    PqxxConnection(const PqxxConnection&) = delete;
    PqxxConnection& operator=(const PqxxConnection&) = delete;

    bool isOpen() const override;
    bool ping() override;

    void begin(std::optional<IsolationLevel> isolation, bool readOnly) override;
    std::vector<agtype::Row> execute(const std::string& sql) override;
    void commit() override;
    void rollback() override;
    bool inTransaction() const override { return m_transaction != nullptr; }

    void close() override;

    /**
     * Factory suitable for Engine / EngineRegistry
     */
    static std::unique_ptr<DbConnection> open(const std::string& connectionString);

private:
    static std::vector<agtype::Row> resultToRows(const pqxx::result& result);
    static agtype::json fieldToJson(const pqxx::field& field, pqxx::oid type);

    std::unique_ptr<pqxx::connection> m_connection;
    std::unique_ptr<pqxx::transaction_base> m_transaction;
};

} // namespace postgres
} // namespace agegraph
