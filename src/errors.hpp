#pragma once
#include <stdexcept>
#include <string>

// Raised inside a timed operation. Never leaves measure().
struct MeasurementFault : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct BinaryNotFoundError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct SubprocessTimeoutError : std::runtime_error {
    SubprocessTimeoutError(const std::string& what, int timeout_ms)
        : std::runtime_error(what), timeout_ms(timeout_ms) {}
    int timeout_ms;
};

struct SubprocessExitError : std::runtime_error {
    SubprocessExitError(const std::string& what, int exit_code, std::string stderr_text)
        : std::runtime_error(what), exit_code(exit_code), stderr_text(std::move(stderr_text)) {}
    int exit_code;          // -1 when killed by a signal
    std::string stderr_text;
};

struct WorkloadLoadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Execution faults of a schema engine: bad schema text, unknown class, cyclic is_a.
struct SchemaError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
