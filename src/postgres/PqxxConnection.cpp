#include "postgres/PqxxConnection.hpp"
#include "errors/Errors.hpp"
#include "util/Logger.hpp"

namespace agegraph {
namespace postgres {

namespace {

template <pqxx::isolation_level ISOLATION>
std::unique_ptr<pqxx::transaction_base> makeTransaction(pqxx::connection& conn, bool readOnly) {
    if (readOnly) {
        return std::make_unique<pqxx::transaction<ISOLATION, pqxx::write_policy::read_only>>(conn);
    }
    return std::make_unique<pqxx::transaction<ISOLATION, pqxx::write_policy::read_write>>(conn);
}

} // namespace

PqxxConnection::PqxxConnection(const std::string& connectionString) {
    try {
        m_connection = std::make_unique<pqxx::connection>(connectionString);
    }
    catch (const pqxx::broken_connection& e) {
        throw errors::ResourceError("Failed to open PostgreSQL connection: " + std::string(e.what()));
    }

    if (!m_connection->is_open()) {
        throw errors::ResourceError("Failed to open PostgreSQL connection");
    }
}

PqxxConnection::~PqxxConnection() {
    close();
}

std::unique_ptr<DbConnection> PqxxConnection::open(const std::string& connectionString) {
    return std::make_unique<PqxxConnection>(connectionString);
}

bool PqxxConnection::isOpen() const {
    return m_connection && m_connection->is_open();
}

bool PqxxConnection::ping() {
    if (!isOpen() || m_transaction) {
        return false;
    }
    try {
        pqxx::nontransaction check(*m_connection);
        check.exec("SELECT 1");
        return true;
    }
    catch (const pqxx::failure& e) {
        AGEGRAPH_LOG_WARN("PqxxConnection: ping failed: " + std::string(e.what()));
        return false;
    }
}

void PqxxConnection::begin(std::optional<IsolationLevel> isolation, bool readOnly) {
    if (!isOpen()) {
        throw errors::ResourceError("Cannot begin a transaction on a closed connection");
    }
    if (m_transaction) {
        throw errors::ResourceError("A transaction is already open on this connection");
    }

    try {
        switch (isolation.value_or(IsolationLevel::ReadCommitted)) {
            case IsolationLevel::ReadUncommitted:
                m_transaction = makeTransaction<pqxx::isolation_level::read_uncommitted>(*m_connection, readOnly);
                break;
            case IsolationLevel::ReadCommitted:
                m_transaction = makeTransaction<pqxx::isolation_level::read_committed>(*m_connection, readOnly);
                break;
            case IsolationLevel::RepeatableRead:
                m_transaction = makeTransaction<pqxx::isolation_level::repeatable_read>(*m_connection, readOnly);
                break;
            case IsolationLevel::Serializable:
                m_transaction = makeTransaction<pqxx::isolation_level::serializable>(*m_connection, readOnly);
                break;
        }
    }
    catch (const pqxx::failure& e) {
        throw errors::ResourceError("Failed to begin transaction: " + std::string(e.what()));
    }
}

std::vector<agtype::Row> PqxxConnection::execute(const std::string& sql) {
    if (!m_transaction) {
        throw errors::ResourceError("execute() requires an open transaction");
    }

    try {
        pqxx::result result = m_transaction->exec(sql);
        return resultToRows(result);
    }
    catch (const pqxx::sql_error& e) {
        throw errors::ResourceError("SQL error: " + std::string(e.what()));
    }
    catch (const pqxx::failure& e) {
        throw errors::ResourceError("Database error: " + std::string(e.what()));
    }
}

void PqxxConnection::commit() {
    if (!m_transaction) {
        throw errors::ResourceError("commit() without an open transaction");
    }

    auto transaction = std::move(m_transaction);
    try {
        transaction->commit();
    }
    catch (const pqxx::failure& e) {
        throw errors::ResourceError("Commit failed: " + std::string(e.what()));
    }
}

void PqxxConnection::rollback() {
    if (!m_transaction) {
        return;
    }

    auto transaction = std::move(m_transaction);
    try {
        transaction->abort();
    }
    catch (const pqxx::failure& e) {
        throw errors::ResourceError("Rollback failed: " + std::string(e.what()));
    }
}

void PqxxConnection::close() {
    // Destroying an open pqxx transaction aborts it
    m_transaction.reset();
    m_connection.reset();
}

agtype::json PqxxConnection::fieldToJson(const pqxx::field& field, pqxx::oid type) {
    if (field.is_null()) {
        return nullptr;
    }

    // https://www.postgresql.org/docs/current/datatype-oid.html
    switch (type) {
        case 16:   // bool
            return field.as<bool>();
        case 20:   // int8
        case 21:   // int2
        case 23:   // int4
        case 26:   // oid
            return field.as<int64_t>();
        case 700:  // float4
        case 701:  // float8
            return field.as<double>();
        case 1700: // numeric (kept as text to avoid precision loss)
        case 25:   // text
        case 1043: // varchar
        default:   // agtype and every other type arrive as text
            return std::string(field.c_str());
    }
}

std::vector<agtype::Row> PqxxConnection::resultToRows(const pqxx::result& result) {
    std::vector<agtype::Row> rows;
    rows.reserve(static_cast<size_t>(result.size()));

    const auto numCols = result.columns();
    std::vector<std::string> names;
    std::vector<pqxx::oid> types;
    for (pqxx::row::size_type i = 0; i < numCols; ++i) {
        names.emplace_back(result.column_name(i));
        types.push_back(result.column_type(i));
    }

    for (const auto& row : result) {
        agtype::Row converted;
        for (pqxx::row::size_type i = 0; i < numCols; ++i) {
            converted.set(names[static_cast<size_t>(i)],
                          fieldToJson(row[i], types[static_cast<size_t>(i)]));
        }
        rows.push_back(std::move(converted));
    }

    return rows;
}

} // namespace postgres
} // namespace agegraph
