#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>



enum class ErrorKind
{
    InvalidConfiguration,
    InvalidRelaxationParameter,
    InletVelocityOutOfRange,
    NonPhysicalDensity,
    NumericalDivergence,
};

std::string ErrorKindToString(const ErrorKind kind);

// setup errors are thrown without a step, per-iteration errors carry the
// step they were detected in
class SimulationError : public std::runtime_error
{
public:
    SimulationError(const ErrorKind kind, const std::string& message)
        : std::runtime_error(ErrorKindToString(kind) + ": " + message),
          kind_(kind)
    {
    }

    SimulationError(const ErrorKind kind, const std::string& message,
                    const uint32_t step)
        : std::runtime_error(ErrorKindToString(kind) + " at step "
                             + std::to_string(step) + ": " + message),
          kind_(kind),
          step_(step)
    {
    }

    ErrorKind Kind() const { return kind_; }
    std::optional<uint32_t> Step() const { return step_; }

private:
    ErrorKind kind_;
    std::optional<uint32_t> step_;
};
