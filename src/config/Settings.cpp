#include "config/Settings.hpp"
#include "errors/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace agegraph {
namespace config {

namespace {

const char* const KEY_LOG_LEVEL = "APP__LOG_LEVEL";
const char* const KEY_DSN = "DB__DSN";
const char* const KEY_ECHO = "DB__ECHO";
const char* const KEY_POOL_MIN = "DB__POOL_MIN_CONNECTIONS";
const char* const KEY_POOL_MAX = "DB__POOL_MAX_CONNECTIONS";
const char* const KEY_POOL_OVERFLOW = "DB__POOL_MAX_OVERFLOW";
const char* const KEY_IDENT = "AGE__IDENT_PROPERTY";
const char* const KEY_START_IDENT = "AGE__START_IDENT_PROPERTY";
const char* const KEY_END_IDENT = "AGE__END_IDENT_PROPERTY";

const char* const KNOWN_KEYS[] = {
    KEY_LOG_LEVEL, KEY_DSN, KEY_ECHO, KEY_POOL_MIN, KEY_POOL_MAX,
    KEY_POOL_OVERFLOW, KEY_IDENT, KEY_START_IDENT, KEY_END_IDENT
};

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::string> lookup(const Settings::Values& values, const char* key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

int parseInt(const Settings::Values& values, const char* key, int fallback) {
    auto raw = lookup(values, key);
    if (!raw) {
        return fallback;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(*raw, &consumed);
        if (consumed != raw->size()) {
            throw std::invalid_argument(*raw);
        }
        return value;
    }
    catch (const std::logic_error&) {
        throw errors::ValidationError(std::string(key) + " must be an integer, got '" + *raw + "'");
    }
}

std::optional<bool> parseBool(const Settings::Values& values, const char* key) {
    auto raw = lookup(values, key);
    if (!raw) {
        return std::nullopt;
    }
    std::string lower = toLower(*raw);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw errors::ValidationError(std::string(key) + " must be a boolean, got '" + *raw + "'");
}

Settings::Values readDotenvFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        AGEGRAPH_LOG_DEBUG("Settings: no dotenv file at " + path.string());
        return {};
    }
    auto values = Settings::parseDotenv(file);
    AGEGRAPH_LOG_DEBUG("Settings: loaded " + std::to_string(values.size()) + " values from " + path.string());
    return values;
}

void applyEnvironmentOverrides(Settings::Values& values) {
    for (const char* key : KNOWN_KEYS) {
        if (const char* value = std::getenv(key)) {
            values[key] = value;
        }
    }
}

json optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

// ===== Environment =====

std::string toString(Environment env) {
    switch (env) {
        case Environment::Development: return "development";
        case Environment::Testing:     return "testing";
        case Environment::Staging:     return "staging";
        case Environment::Production:  return "production";
    }
    return "development";
}

Environment environmentFromString(const std::string& name) {
    std::string lower = toLower(trim(name));
    if (lower == "development") return Environment::Development;
    if (lower == "testing") return Environment::Testing;
    if (lower == "staging") return Environment::Staging;
    if (lower == "production") return Environment::Production;
    throw errors::ValidationError("Unknown environment: " + name);
}

Environment currentEnvironment() {
    const char* value = std::getenv(Settings::ENV_VARIABLE);
    if (!value || std::string(value).empty()) {
        return Environment::Development;
    }
    return environmentFromString(value);
}

// ===== Settings =====

Settings::Values Settings::parseDotenv(std::istream& in) {
    Values values;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        if (!key.empty()) {
            values[key] = val;
        }
    }
    return values;
}

Settings Settings::load(std::optional<Environment> env, const std::string& dotenvPath) {
    Environment environment = env ? *env : currentEnvironment();

    std::filesystem::path path(dotenvPath);
    switch (environment) {
        case Environment::Production:
            throw errors::ValidationError("Production environment is not supported yet");
        case Environment::Staging:
            throw errors::ValidationError("Staging environment is not supported yet");
        case Environment::Testing:
            path = path.parent_path() / TESTING_DOTENV;
            break;
        case Environment::Development:
            break;
    }

    Values values = readDotenvFile(path);
    applyEnvironmentOverrides(values);

    Settings settings = fromValues(environment, values);
    AGEGRAPH_LOG_INFO("Settings loaded for " + toString(environment) + " environment");
    return settings;
}

Settings Settings::fromValues(Environment env, const Values& values) {
    Settings settings;
    settings.m_environment = env;

    if (auto level = lookup(values, KEY_LOG_LEVEL)) {
        settings.m_app.logLevel = util::Logger::levelFromString(*level);
        std::string upper = *level;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (upper == "WARN") upper = "WARNING";
        settings.m_app.logLevelName = upper;
    }

    auto dsn = lookup(values, KEY_DSN);
    if (!dsn) {
        throw errors::ValidationError(std::string(KEY_DSN) + " is required");
    }
    settings.m_db.dsn = *dsn;
    settings.m_db.echo = parseBool(values, KEY_ECHO);
    settings.m_db.poolMinConnections = parseInt(values, KEY_POOL_MIN, settings.m_db.poolMinConnections);
    settings.m_db.poolMaxConnections = parseInt(values, KEY_POOL_MAX, settings.m_db.poolMaxConnections);
    settings.m_db.poolMaxOverflow = parseInt(values, KEY_POOL_OVERFLOW, settings.m_db.poolMaxOverflow);

    settings.m_age.identProperty = lookup(values, KEY_IDENT);
    settings.m_age.startIdentProperty = lookup(values, KEY_START_IDENT);
    settings.m_age.endIdentProperty = lookup(values, KEY_END_IDENT);

    // Surface DSN and range errors at load time
    settings.primaryDatabase().validate();
    return settings;
}

postgres::ConnectionSettings Settings::primaryDatabase() const {
    auto primary = postgres::ConnectionSettings::fromNameAndDsn("primary", m_db.dsn);
    primary.poolMinConnections = m_db.poolMinConnections;
    primary.poolMaxConnections = m_db.poolMaxConnections;
    primary.poolMaxOverflow = m_db.poolMaxOverflow;
    if (m_db.echo) {
        primary.echo = *m_db.echo;
    }
    return primary;
}

json Settings::toJson() const {
    return json{
        {"env", toString(m_environment)},
        {"app", {{"log_level", m_app.logLevelName}}},
        {"db", {
            {"primary", primaryDatabase().toJson()}
        }},
        {"age", {
            {"ident_property", optionalToJson(m_age.identProperty)},
            {"start_ident_property", optionalToJson(m_age.startIdentProperty)},
            {"end_ident_property", optionalToJson(m_age.endIdentProperty)}
        }}
    };
}

} // namespace config
} // namespace agegraph
