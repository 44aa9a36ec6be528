#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every failure that prevents a confident verdict.
 *
 * A policy rejection is not an error; it is reported through
 * @ref policy::Verdict. Anything derived from this class ends the current ref
 * evaluation as an internal error.
 */
class GateError : public std::runtime_error {
  public:
    explicit GateError(const std::string& what) : std::runtime_error(what) {}
    virtual const char* kind() const noexcept { return "internal"; }
};

/// The version-control backend could not be queried.
class BackendError : public GateError {
  public:
    explicit BackendError(const std::string& what) : GateError(what) {}
    const char* kind() const noexcept override { return "backend"; }
};

/// The backend answered, but with data that violates its contract.
class CorruptDataError : public GateError {
  public:
    explicit CorruptDataError(const std::string& what) : GateError(what) {}
    const char* kind() const noexcept override { return "corrupt-data"; }
};

/// The configuration store could not be read or parsed.
class ConfigError : public GateError {
  public:
    explicit ConfigError(const std::string& what) : GateError(what) {}
    const char* kind() const noexcept override { return "config"; }
};

/// Internal contract breach inside the gate itself.
class InternalError : public GateError {
  public:
    explicit InternalError(const std::string& what) : GateError(what) {}
};

#endif // ERRORS_HPP
