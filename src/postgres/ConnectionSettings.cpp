#include "postgres/ConnectionSettings.hpp"
#include <cstdint>
#include "errors/Errors.hpp"

namespace agegraph {
namespace postgres {

namespace {

void requireNonNegative(const std::optional<int>& value, const char* field) {
    if (value && *value < 0) {
        throw errors::ValidationError(std::string(field) + " must be >= 0, got " + std::to_string(*value));
    }
}

json optionalToJson(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

void setIfAbsent(DataSourceName& dsn, const std::string& key, const std::string& value) {
    if (!dsn.queryValue(key)) {
        dsn.setQueryValue(key, value);
    }
}

} // namespace

json EngineOptions::toJson() const {
    json j = json::object();
    if (echo) j["echo"] = *echo;
    if (poolSize) j["pool_size"] = *poolSize;
    if (maxOverflow) j["max_overflow"] = *maxOverflow;
    if (poolTimeout) j["pool_timeout"] = *poolTimeout;
    if (poolRecycle) j["pool_recycle"] = *poolRecycle;
    if (poolPrePing) j["pool_pre_ping"] = *poolPrePing;
    j["pool_use_lifo"] = poolUseLifo;
    return j;
}

ConnectionSettings::ConnectionSettings(std::string name, std::variant<std::string, DataSourceName> dsn)
    : m_name(std::move(name))
    , m_dsn(toDsn(dsn))
{
    if (m_name.empty()) {
        throw errors::ValidationError("Connection settings require a non-empty name");
    }
    validate();
}

ConnectionSettings ConnectionSettings::fromNameAndDsn(const std::string& name,
                                                      const std::variant<std::string, DataSourceName>& dsn) {
    return ConnectionSettings(name, dsn);
}

DataSourceName ConnectionSettings::toDsn(const std::variant<std::string, DataSourceName>& dsn) {
    if (const auto* text = std::get_if<std::string>(&dsn)) {
        return DataSourceName::parse(*text);
    }
    return std::get<DataSourceName>(dsn);
}

void ConnectionSettings::setPassword(const std::optional<std::string>& value) {
    // An empty password is the same as none
    if (value && !value->empty()) {
        m_dsn.password = value;
    } else {
        m_dsn.password.reset();
    }
}

void ConnectionSettings::validate() const {
    requireNonNegative(connectionTimeout, "connection_timeout");
    requireNonNegative(commandTimeout, "command_timeout");
    requireNonNegative(poolMinConnections, "pool_min_connections");
    requireNonNegative(poolMaxConnections, "pool_max_connections");
    requireNonNegative(poolMaxIdleTime, "pool_max_idle_time");
    requireNonNegative(poolMaxLifetime, "pool_max_lifetime");
    requireNonNegative(poolRecycleTime, "pool_recycle_time");
    requireNonNegative(poolMaxOverflow, "pool_max_overflow");
    requireNonNegative(keepalivesIdle, "keepalives_idle");
    requireNonNegative(keepalivesInterval, "keepalives_interval");
    requireNonNegative(keepalivesCount, "keepalives_count");

    if (poolMinConnections && poolMaxConnections && *poolMinConnections > *poolMaxConnections) {
        throw errors::ValidationError("pool_min_connections (" + std::to_string(*poolMinConnections)
                                      + ") exceeds pool_max_connections ("
                                      + std::to_string(*poolMaxConnections) + ")");
    }
}

EngineOptions ConnectionSettings::deriveEngineOptions() const {
    EngineOptions options;
    options.echo = echo;
    options.poolSize = poolMinConnections;
    options.maxOverflow = poolMaxOverflow;
    options.poolTimeout = connectionTimeout;
    options.poolRecycle = poolRecycleTime;
    options.poolPrePing = poolPrePing;
    options.poolUseLifo = false;
    return options;
}

std::string ConnectionSettings::libpqConnectionString() const {
    DataSourceName target = m_dsn;

    if (connectionTimeout) {
        setIfAbsent(target, "connect_timeout", std::to_string(*connectionTimeout));
    }

    setIfAbsent(target, "keepalives", keepalives ? "1" : "0");
    if (keepalives) {
        if (keepalivesIdle) setIfAbsent(target, "keepalives_idle", std::to_string(*keepalivesIdle));
        if (keepalivesInterval) setIfAbsent(target, "keepalives_interval", std::to_string(*keepalivesInterval));
        if (keepalivesCount) setIfAbsent(target, "keepalives_count", std::to_string(*keepalivesCount));
    }

    if (!encoding.empty()) {
        setIfAbsent(target, "client_encoding", encoding);
    }

    std::string options;
    if (!timezone.empty()) {
        options += "-c timezone=" + timezone;
    }
    if (commandTimeout) {
        if (!options.empty()) options += ' ';
        options += "-c statement_timeout=" + std::to_string(static_cast<int64_t>(*commandTimeout) * 1000);
    }
    if (readonly) {
        if (!options.empty()) options += ' ';
        options += "-c default_transaction_read_only=on";
    }
    if (!options.empty()) {
        setIfAbsent(target, "options", options);
    }

    return target.libpqUri();
}

json ConnectionSettings::toJson() const {
    return json{
        {"name", m_name},
        {"dsn", m_dsn.toString(true)},
        {"echo", echo},
        {"encoding", encoding},
        {"timezone", timezone},
        {"readonly", readonly},
        {"connection_timeout", optionalToJson(connectionTimeout)},
        {"command_timeout", optionalToJson(commandTimeout)},
        {"pool_min_connections", optionalToJson(poolMinConnections)},
        {"pool_max_connections", optionalToJson(poolMaxConnections)},
        {"pool_max_idle_time", optionalToJson(poolMaxIdleTime)},
        {"pool_max_lifetime", optionalToJson(poolMaxLifetime)},
        {"pool_recycle_time", optionalToJson(poolRecycleTime)},
        {"pool_pre_ping", poolPrePing},
        {"pool_max_overflow", optionalToJson(poolMaxOverflow)},
        {"keepalives", keepalives},
        {"keepalives_idle", optionalToJson(keepalivesIdle)},
        {"keepalives_interval", optionalToJson(keepalivesInterval)},
        {"keepalives_count", optionalToJson(keepalivesCount)}
    };
}

} // namespace postgres
} // namespace agegraph
