#pragma once

#include <stdexcept>
#include <string>

namespace quantum_surface {

class QuantumSurfaceError : public std::runtime_error {
public:
    explicit QuantumSurfaceError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public QuantumSurfaceError {
public:
    explicit ConfigError(const std::string& message)
        : QuantumSurfaceError("Config error: " + message) {}
};

class ValidationError : public QuantumSurfaceError {
public:
    explicit ValidationError(const std::string& message)
        : QuantumSurfaceError("Validation error: " + message) {}
};

class IOError : public QuantumSurfaceError {
public:
    explicit IOError(const std::string& message)
        : QuantumSurfaceError("I/O error: " + message) {}
};

// Empty counts, zero shots, mixed pattern lengths or non-binary patterns.
// Always an upstream contract violation.
class MalformedDistribution : public QuantumSurfaceError {
public:
    explicit MalformedDistribution(const std::string& message)
        : QuantumSurfaceError("Malformed distribution: " + message) {}
};

class ExecutionFailed : public QuantumSurfaceError {
public:
    explicit ExecutionFailed(const std::string& message)
        : QuantumSurfaceError("Execution failed: " + message) {}
};

// Ledger misuse (unknown or double-committed reservation)
class BudgetError : public QuantumSurfaceError {
public:
    explicit BudgetError(const std::string& message)
        : QuantumSurfaceError("Budget error: " + message) {}
};

} // namespace quantum_surface
