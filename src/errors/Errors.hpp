#pragma once

#include <stdexcept>
#include <string>

namespace agegraph {
namespace errors {

/**
 * Base class of every error raised by agegraph.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * Malformed DSN or invalid configuration value. Raised at construction time.
 */
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(message) {}
};

/**
 * Malformed agtype / JSON text. Carries the text that failed to decode.
 */
class DecodeError : public Error {
public:
    DecodeError(const std::string& message, std::string text)
        : Error(message)
        , m_text(std::move(text))
    {}

    const std::string& text() const { return m_text; }

private:
    std::string m_text;
};

/**
 * Decoded data does not match the record shape. Carries the offending key.
 */
class SchemaMismatchError : public Error {
public:
    SchemaMismatchError(const std::string& message, std::string key)
        : Error(message)
        , m_key(std::move(key))
    {}

    const std::string& key() const { return m_key; }

private:
    std::string m_key;
};

/**
 * Engine, pool or session failure (connection refused, pool exhausted,
 * engine already disposed, driver error).
 */
class ResourceError : public Error {
public:
    explicit ResourceError(const std::string& message) : Error(message) {}
};

/**
 * A transaction was cancelled before it could commit.
 */
class TransactionCancelled : public ResourceError {
public:
    TransactionCancelled() : ResourceError("Transaction cancelled") {}
};

} // namespace errors
} // namespace agegraph
