#pragma once

#include "postgres/ConnectionSettings.hpp"
#include "util/Logger.hpp"
#include <nlohmann/json.hpp>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace agegraph {
namespace config {

using json = nlohmann::json;

enum class Environment {
    Development,
    Testing,
    Staging,
    Production
};

std::string toString(Environment env);

/**
 * "development", "testing", "staging", "production" (case-insensitive)
 * @throws errors::ValidationError
 */
Environment environmentFromString(const std::string& name);

/**
 * AGEGRAPH_ENV if set, development otherwise
 */
Environment currentEnvironment();

struct AppSettings {
    std::string logLevelName = "INFO";
    util::LogLevel logLevel = util::LogLevel::INFO;
};

struct DbSettings {
    std::string dsn;
    std::optional<bool> echo;
    int poolMinConnections = 5;
    int poolMaxConnections = 10;
    int poolMaxOverflow = 20;
};

/**
 * Property names used to identify vertices and the endpoints of edges
 */
struct AgeSettings {
    std::optional<std::string> identProperty;
    std::optional<std::string> startIdentProperty;
    std::optional<std::string> endIdentProperty;
};

/**
 * Application settings read from a dotenv file, overridden by the process
 * environment. Keys use "__" as the section delimiter (DB__DSN, APP__LOG_LEVEL).
 *
 * Usage:
 *   auto settings = config::Settings::load();          // .env, AGEGRAPH_ENV
 *   auto db = settings.primaryDatabase();
 *   util::Logger::instance().setLevel(settings.app().logLevel);
 */
class Settings {
public:
    using Values = std::map<std::string, std::string>;

    static constexpr const char* ENV_VARIABLE = "AGEGRAPH_ENV";
    static constexpr const char* DEFAULT_DOTENV = ".env";
    static constexpr const char* TESTING_DOTENV = ".env.testing";

    /**
     * Load the settings of an environment. Development reads dotenvPath,
     * testing reads .env.testing from the same directory. A missing file is
     * not an error; a missing DB__DSN is.
     * @throws errors::ValidationError for staging/production, missing or
     *         malformed values
     */
    static Settings load(std::optional<Environment> env = std::nullopt,
                         const std::string& dotenvPath = DEFAULT_DOTENV);

    /**
     * Build from already merged key/value pairs
     * @throws errors::ValidationError
     */
    static Settings fromValues(Environment env, const Values& values);

    // KEY=VALUE lines; '#' comments and blank lines skipped, quotes stripped
    static Values parseDotenv(std::istream& in);

    Environment environment() const { return m_environment; }
    const AppSettings& app() const { return m_app; }
    const DbSettings& db() const { return m_db; }
    const AgeSettings& age() const { return m_age; }

    /**
     * Connection settings named "primary" built from the DB__ values
     */
    postgres::ConnectionSettings primaryDatabase() const;

    /**
     * Everything, with the database password masked
     */
    json toJson() const;

private:
    Settings() = default;

    Environment m_environment = Environment::Development;
    AppSettings m_app;
    DbSettings m_db;
    AgeSettings m_age;
};

} // namespace config
} // namespace agegraph
