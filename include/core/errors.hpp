// Simulation error taxonomy
#pragma once

#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace stablesim {

enum class ErrorKind {
    InvalidAmount,
    PoolDepleted,
    InsufficientShares,
    InvalidConfiguration,
    NumericDivergence,
};

inline const char* to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::InvalidAmount:        return "InvalidAmount";
        case ErrorKind::PoolDepleted:         return "PoolDepleted";
        case ErrorKind::InsufficientShares:   return "InsufficientShares";
        case ErrorKind::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorKind::NumericDivergence:    return "NumericDivergence";
    }
    return "Unknown";
}

// Base for every error raised by the engine
class SimulationError : public std::runtime_error {
public:
    SimulationError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(std::string(to_string(kind)) + ": " + msg), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

    // PoolDepleted and NumericDivergence end a run as an outcome, not a crash
    bool is_terminal_state() const noexcept {
        return kind_ == ErrorKind::PoolDepleted || kind_ == ErrorKind::NumericDivergence;
    }

private:
    ErrorKind kind_;
};

class InvalidAmount : public SimulationError {
public:
    explicit InvalidAmount(const std::string& msg) : SimulationError(ErrorKind::InvalidAmount, msg) {}
};

class PoolDepleted : public SimulationError {
public:
    explicit PoolDepleted(const std::string& msg) : SimulationError(ErrorKind::PoolDepleted, msg) {}
};

class InsufficientShares : public SimulationError {
public:
    explicit InsufficientShares(const std::string& msg) : SimulationError(ErrorKind::InsufficientShares, msg) {}
};

class InvalidConfiguration : public SimulationError {
public:
    explicit InvalidConfiguration(const std::string& msg) : SimulationError(ErrorKind::InvalidConfiguration, msg) {}
};

class NumericDivergence : public SimulationError {
public:
    explicit NumericDivergence(const std::string& msg) : SimulationError(ErrorKind::NumericDivergence, msg) {}
};

// Throws NumericDivergence when v is NaN or infinite
template <typename T>
inline T require_finite(T v, const char* what) {
    if (!std::isfinite(static_cast<long double>(v))) {
        throw NumericDivergence(std::string(what) + " is not finite");
    }
    return v;
}

} // namespace stablesim
