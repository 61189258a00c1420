#include "obstacle.h"
#include "errors.h"
#include <cmath>
#include <utility>



EllipseShape::EllipseShape(
    const FP cx, const FP cy, const FP r,
    const FP scale_x, const FP scale_y)
    : cx_(cx), cy_(cy), bound_(r * 11.0 / 2.0),
      scale_x_(scale_x), scale_y_(scale_y)
{
    if (!(r > 0.0) || !(scale_x > 0.0) || !(scale_y > 0.0))
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "ellipse radius and scales must be positive");
    }
}

bool EllipseShape::Contains(const FP x, const FP y) const
{
    const FP dx = x - cx_;
    const FP dy = cy_ - y;

    return dx * dx / scale_x_ + dy * dy / scale_y_ < bound_;
}

CylinderShape::CylinderShape(const FP cx, const FP cy, const FP r)
    : cx_(cx), cy_(cy), r_sq_(r * r)
{
    if (!(r > 0.0))
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "cylinder radius must be positive");
    }
}

bool CylinderShape::Contains(const FP x, const FP y) const
{
    const FP dx = x - cx_;
    const FP dy = cy_ - y;

    return dx * dx + dy * dy < r_sq_;
}

CustomShape::CustomShape(
    std::function<bool(FP, FP)> predicate,
    std::string name)
    : predicate_(std::move(predicate)), name_(std::move(name))
{
    if (!predicate_)
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "custom obstacle shape needs a predicate");
    }
}

bool CustomShape::Contains(const FP x, const FP y) const
{
    return predicate_(x, y);
}

std::vector<uint8_t> BuildObstacleMask(
    const ObstacleShape& shape,
    const LatticeConfig& lattice)
{
    std::vector<uint8_t> mask(lattice.N_CELLS, 0);

    for (int y = 0; y < lattice.N_Y; y++)
    {
        for (int x = 0; x < lattice.N_X; x++)
        {
            if (shape.Contains(static_cast<FP>(x), static_cast<FP>(y)))
            {
                mask[CellIndex(x, y, lattice.N_X)] = 1;
            }
        }
    }

    return mask;
}

std::vector<int> CollectObstacleCells(
    const std::vector<uint8_t>& mask)
{
    std::vector<int> cells;

    for (int i = 0; i < static_cast<int>(mask.size()); i++)
    {
        if (mask[i] != 0) { cells.push_back(i); }
    }

    return cells;
}
