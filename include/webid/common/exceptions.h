/**
 * @file exceptions.h
 * @brief Exception hierarchy
 *
 * Exceptions are used inside parsers and configuration code. Public
 * verification entry points convert them into typed results.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace webid::common {

/**
 * @brief Base exception for all webid-tls exceptions
 */
class WebIdException : public std::runtime_error {
public:
    explicit WebIdException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parsing error (Turtle, JSON-LD, SPARQL, certificate data)
 */
class ParsingException : public WebIdException {
public:
    explicit ParsingException(const std::string& message)
        : WebIdException("Parsing error: " + message) {}

    ParsingException(const std::string& message, size_t line)
        : WebIdException("Parsing error at line " + std::to_string(line) + ": " + message),
          line_(line) {}

    /// 1-based line number, 0 when unknown
    size_t line() const { return line_; }

private:
    size_t line_ = 0;
};

/**
 * @brief OpenSSL operation failed
 */
class CryptoException : public WebIdException {
public:
    explicit CryptoException(const std::string& message)
        : WebIdException("Crypto error: " + message) {}
};

} // namespace webid::common
