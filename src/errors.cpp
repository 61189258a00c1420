#include "errors.h"



std::string ErrorKindToString(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::InvalidConfiguration:       return "InvalidConfiguration";
    case ErrorKind::InvalidRelaxationParameter: return "InvalidRelaxationParameter";
    case ErrorKind::InletVelocityOutOfRange:    return "InletVelocityOutOfRange";
    case ErrorKind::NonPhysicalDensity:         return "NonPhysicalDensity";
    case ErrorKind::NumericalDivergence:        return "NumericalDivergence";
    default:                                    return "Unknown";
    }
}
