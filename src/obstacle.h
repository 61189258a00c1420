#pragma once
#include "lattice.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>



// shape test given a grid coordinate, used to mark solid cells
class ObstacleShape
{
public:
    virtual ~ObstacleShape() = default;
    virtual bool Contains(const FP x, const FP y) const = 0;
    virtual std::string Name() const = 0;
};

// (x - cx)^2 / scale_x + (cy - y)^2 / scale_y < r * 11/2
class EllipseShape : public ObstacleShape
{
public:
    EllipseShape(const FP cx, const FP cy, const FP r,
                 const FP scale_x = 8.0, const FP scale_y = 3.0);

    bool Contains(const FP x, const FP y) const override;
    std::string Name() const override { return "ellipse"; }

private:
    FP cx_;
    FP cy_;
    FP bound_;
    FP scale_x_;
    FP scale_y_;
};

// (x - cx)^2 + (cy - y)^2 < r^2
class CylinderShape : public ObstacleShape
{
public:
    CylinderShape(const FP cx, const FP cy, const FP r);

    bool Contains(const FP x, const FP y) const override;
    std::string Name() const override { return "cylinder"; }

private:
    FP cx_;
    FP cy_;
    FP r_sq_;
};

class CustomShape : public ObstacleShape
{
public:
    explicit CustomShape(std::function<bool(FP, FP)> predicate,
                         std::string name = "custom");

    bool Contains(const FP x, const FP y) const override;
    std::string Name() const override { return name_; }

private:
    std::function<bool(FP, FP)> predicate_;
    std::string name_;
};

// evaluates the shape once at every cell, 1 marks a solid cell
std::vector<uint8_t> BuildObstacleMask(
    const ObstacleShape& shape,
    const LatticeConfig& lattice);

// indices of all solid cells, in ascending order
std::vector<int> CollectObstacleCells(
    const std::vector<uint8_t>& mask);
