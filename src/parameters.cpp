#include "parameters.h"
#include "collision.h"
#include "errors.h"
#include <cmath>
#include <memory>
#include <string>



FP ResolveRelaxationFactor(const SimulationParameters& parameters)
{
    if (parameters.omega.has_value()) { return *parameters.omega; }

    if (!(parameters.Re > 0.0) || !std::isfinite(parameters.Re))
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "Reynolds number must be positive, got "
            + std::to_string(parameters.Re));
    }

    return ComputeRelaxationFactor(
        parameters.u_lb, parameters.obstacle_r, parameters.Re);
}

std::unique_ptr<ObstacleShape> MakeObstacleShape(
    const SimulationParameters& parameters)
{
    if (parameters.obstacle_shape == "ellipse")
    {
        return std::make_unique<EllipseShape>(
            parameters.obstacle_x, parameters.obstacle_y, parameters.obstacle_r,
            parameters.ellipse_scale_x, parameters.ellipse_scale_y);
    }
    if (parameters.obstacle_shape == "cylinder")
    {
        return std::make_unique<CylinderShape>(
            parameters.obstacle_x, parameters.obstacle_y, parameters.obstacle_r);
    }

    throw SimulationError(ErrorKind::InvalidConfiguration,
        "unknown obstacle shape: " + parameters.obstacle_shape);
}
