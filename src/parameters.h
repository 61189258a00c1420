#pragma once
#include "lattice.h"
#include "obstacle.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>



// defaults reproduce the flow around an ellipse at Re = 220
struct SimulationParameters
{
    // scale
    int N_X =                   420;
    int N_Y =                   180;
    uint32_t N_STEPS =          30'000;

    // flow
    FP Re =                     220.0;
    FP u_lb =                   0.04;
    FP perturbation =           1e-4;
    std::optional<FP> omega;    // derived from Re when not set

    // obstacle
    std::string obstacle_shape = "ellipse";
    FP obstacle_x =             105.0;
    FP obstacle_y =             90.0;
    FP obstacle_r =             20.0;
    FP ellipse_scale_x =        8.0;
    FP ellipse_scale_y =        3.0;

    // export
    uint32_t report_interval =  100;
    std::string export_dir =    "exported";
    bool export_rho =           false;
    bool export_u_x =           false;
    bool export_u_y =           false;
    bool export_u_mag =         true;
    bool export_csv =           false;
};

// explicit omega if given, otherwise 1 / (3 nu + 0.5) with nu = u_lb r / Re
FP ResolveRelaxationFactor(const SimulationParameters& parameters);

// ellipse or cylinder from the obstacle parameters
std::unique_ptr<ObstacleShape> MakeObstacleShape(
    const SimulationParameters& parameters);
