#include "postgres/DataSourceName.hpp"
#include "errors/Errors.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace agegraph {
namespace postgres {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool validScheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    for (char c : scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

uint16_t parsePort(const std::string& text, const std::string& dsn) {
    if (text.empty() || text.size() > 5) {
        throw errors::ValidationError("Invalid port in DSN: " + dsn);
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw errors::ValidationError("Invalid port in DSN: " + dsn);
        }
    }
    unsigned long value = std::stoul(text);
    if (value == 0 || value > 65535) {
        throw errors::ValidationError("Port out of range in DSN: " + dsn);
    }
    return static_cast<uint16_t>(value);
}

DataSourceName::QueryParams parseQuery(const std::string& text) {
    DataSourceName::QueryParams params;
    std::istringstream stream(text);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            params.emplace_back(percentDecode(pair), "");
        } else {
            params.emplace_back(percentDecode(pair.substr(0, eq)), percentDecode(pair.substr(eq + 1)));
        }
    }
    return params;
}

} // namespace

std::string percentEncode(const std::string& text) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : text) {
        if (isUnreserved(c)) {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::string percentDecode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '%') {
            result += text[i];
            continue;
        }
        if (i + 2 >= text.size()) {
            throw errors::ValidationError("Truncated percent escape in: " + text);
        }
        int hi = hexValue(text[i + 1]);
        int lo = hexValue(text[i + 2]);
        if (hi < 0 || lo < 0) {
            throw errors::ValidationError("Invalid percent escape in: " + text);
        }
        result += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return result;
}

DataSourceName DataSourceName::parse(const std::string& text) {
    auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        throw errors::ValidationError("DSN must look like driver://user@host/database: " + text);
    }

    DataSourceName dsn;
    dsn.driver = text.substr(0, schemeEnd);
    if (!validScheme(dsn.driver)) {
        throw errors::ValidationError("Invalid driver in DSN: " + text);
    }

    std::string rest = text.substr(schemeEnd + 3);

    auto queryStart = rest.find('?');
    if (queryStart != std::string::npos) {
        dsn.query = parseQuery(rest.substr(queryStart + 1));
        rest = rest.substr(0, queryStart);
    }

    auto pathStart = rest.find('/');
    std::string authority = rest.substr(0, pathStart);
    if (pathStart != std::string::npos) {
        std::string path = percentDecode(rest.substr(pathStart + 1));
        if (!path.empty()) {
            dsn.database = path;
        }
    }

    auto at = authority.rfind('@');
    std::string hostPort = authority;
    if (at != std::string::npos) {
        std::string userInfo = authority.substr(0, at);
        hostPort = authority.substr(at + 1);

        auto colon = userInfo.find(':');
        if (colon == std::string::npos) {
            dsn.username = percentDecode(userInfo);
        } else {
            dsn.username = percentDecode(userInfo.substr(0, colon));
            dsn.password = percentDecode(userInfo.substr(colon + 1));
        }
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        // IPv6 literal
        auto close = hostPort.find(']');
        if (close == std::string::npos) {
            throw errors::ValidationError("Unterminated IPv6 host in DSN: " + text);
        }
        dsn.hostname = hostPort.substr(1, close - 1);
        std::string after = hostPort.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                throw errors::ValidationError("Invalid host in DSN: " + text);
            }
            dsn.port = parsePort(after.substr(1), text);
        }
    } else {
        auto colon = hostPort.rfind(':');
        if (colon != std::string::npos) {
            dsn.hostname = percentDecode(hostPort.substr(0, colon));
            dsn.port = parsePort(hostPort.substr(colon + 1), text);
        } else {
            dsn.hostname = percentDecode(hostPort);
        }
    }

    // libpq accepts an empty host when the socket directory is given as ?host=
    if (dsn.hostname.empty() && !dsn.queryValue("host")) {
        throw errors::ValidationError("DSN has no host: " + text);
    }

    return dsn;
}

std::string DataSourceName::toString(bool hidePassword) const {
    std::ostringstream oss;
    oss << driver << "://";

    if (!username.empty() || password) {
        oss << percentEncode(username);
        if (password) {
            oss << ':' << (hidePassword ? std::string("***") : percentEncode(*password));
        }
        oss << '@';
    }

    if (hostname.find(':') != std::string::npos) {
        oss << '[' << hostname << ']';
    } else {
        oss << percentEncode(hostname);
    }

    if (port) {
        oss << ':' << *port;
    }

    if (database) {
        oss << '/' << percentEncode(*database);
    }

    if (!query.empty()) {
        oss << '?';
        bool first = true;
        for (const auto& [key, value] : query) {
            if (!first) oss << '&';
            oss << percentEncode(key) << '=' << percentEncode(value);
            first = false;
        }
    }

    return oss.str();
}

std::string DataSourceName::libpqUri() const {
    DataSourceName copy = *this;
    copy.driver = "postgresql";
    return copy.toString();
}

std::optional<std::string> DataSourceName::queryValue(const std::string& key) const {
    for (const auto& [k, v] : query) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

void DataSourceName::setQueryValue(const std::string& key, const std::string& value) {
    for (auto& [k, v] : query) {
        if (k == key) {
            v = value;
            return;
        }
    }
    query.emplace_back(key, value);
}

bool DataSourceName::operator==(const DataSourceName& other) const {
    return driver == other.driver
        && username == other.username
        && password == other.password
        && hostname == other.hostname
        && port == other.port
        && database == other.database
        && query == other.query;
}

} // namespace postgres
} // namespace agegraph
