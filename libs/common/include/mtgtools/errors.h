#pragma once

#include <stdexcept>
#include <string>

namespace mtgtools {

// Error is the base of every exception thrown by mtgtools libraries.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// NetworkError reports a timeout, connect failure or non-success status.
class NetworkError : public Error {
public:
    explicit NetworkError(const std::string& msg, long status = 0)
        : Error(msg), status_(status) {}

    // HTTP status of the failed response, 0 when no response was received.
    long status() const { return status_; }

private:
    long status_ = 0;
};

// ParseError reports a malformed document or record.
class ParseError : public Error {
public:
    explicit ParseError(const std::string& msg) : Error(msg) {}
};

// SchemaError reports a constraint violation or a failed SQLite statement.
class SchemaError : public Error {
public:
    explicit SchemaError(const std::string& msg) : Error(msg) {}
};

// VersionCheckError reports remote metadata lacking an expected field.
class VersionCheckError : public Error {
public:
    explicit VersionCheckError(const std::string& msg) : Error(msg) {}
};

} // namespace mtgtools
