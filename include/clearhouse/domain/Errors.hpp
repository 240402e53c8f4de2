#pragma once

#include <stdexcept>
#include <string>

namespace clearhouse {

// ---------------------------------------------------------------------------
// Construction-time errors. Raised synchronously while the auction is being
// built, before any candidate starts. These are the only errors solve()'s
// caller ever sees.
// ---------------------------------------------------------------------------
class InvalidAuction : public std::runtime_error {
public:
    explicit InvalidAuction(const std::string& msg)
        : std::runtime_error("[AUCTION] " + msg) {}

protected:
    InvalidAuction(const char* tag, const std::string& msg)
        : std::runtime_error(std::string(tag) + " " + msg) {}
};

class InvalidOrder : public InvalidAuction {
public:
    explicit InvalidOrder(const std::string& msg)
        : InvalidAuction("[ORDER]", msg) {}
};

class UnknownToken : public InvalidAuction {
public:
    explicit UnknownToken(const std::string& msg)
        : InvalidAuction("[TOKEN]", msg) {}
};

// Settlement could not balance a candidate. Fatal to that candidate only.
class Infeasible : public std::runtime_error {
public:
    explicit Infeasible(const std::string& msg)
        : std::runtime_error("[SETTLE] infeasible: " + msg) {}
};

// Thrown out of a search when its CancelToken fires. Partial work is dropped.
class Cancelled : public std::runtime_error {
public:
    explicit Cancelled(const std::string& where)
        : std::runtime_error("[CANCEL] " + where) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg)
        : std::runtime_error("[CONFIG] " + msg) {}
};

class NoRoute : public std::runtime_error {
public:
    explicit NoRoute(const std::string& msg)
        : std::runtime_error("[QUOTE] no route: " + msg) {}
};

class QuoteTimeout : public std::runtime_error {
public:
    explicit QuoteTimeout(const std::string& msg)
        : std::runtime_error("[QUOTE] timeout: " + msg) {}
};

} // namespace clearhouse
