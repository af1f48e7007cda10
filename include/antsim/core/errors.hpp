// errors.hpp: exception taxonomy surfaced to the CLI boundary
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace antsim {

// Base for every error the library raises on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed map input. line() is 1-based, 0 when not tied to a line
// (e.g. the file could not be opened).
class MapParseError : public Error {
public:
    MapParseError(std::size_t line, const std::string& what)
        : Error(line ? "line " + std::to_string(line) + ": " + what : what), line_(line) {}

    std::size_t line() const noexcept { return line_; }

private:
    std::size_t line_;
};

// Agent count / placement / option values that cannot be honored.
class InvalidConfiguration : public Error {
public:
    using Error::Error;
};

// An edge was added against a colony that does not exist. Only a broken
// loader can trigger this; the CLI reports it as an internal error.
class UnknownColony : public Error {
public:
    explicit UnknownColony(const std::string& name)
        : Error("unknown colony '" + name + "'"), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

} // namespace antsim
