#pragma once
#include "lattice.h"
#include <vector>



// x-velocity of the inlet for each row y (the inlet has no y-velocity):
// u_lb * (1 + perturbation * sin(2 pi y / (N_Y - 1)))
std::vector<FP> ComputeInletProfile(
    const FP u_lb,
    const FP perturbation,
    const int N_Y);

// throws a SimulationError (InletVelocityOutOfRange) if any inlet velocity
// is not finite or has a magnitude of 1 or more
void ValidateInletProfile(
    const std::vector<FP>& inlet_u_x);

// unit density and the inlet velocity profile in every column, with the
// distribution functions set to the matching equilibrium
void ApplyInletFlowCondition(
    std::vector<FP>& f,
    std::vector<FP>& rho,
    std::vector<FP>& u_x,
    std::vector<FP>& u_y,
    const std::vector<FP>& inlet_u_x,
    const LatticeConfig& lattice);

// right wall: leftward df values of the last column are copied from the
// second to last column
void ApplyOutflowCondition(
    std::vector<FP>& f,
    const LatticeConfig& lattice);

// left wall: prescribed velocity, and density reconstructed from the
// already known vertical and leftward df values of the first column
void ApplyInflowCondition(
    const std::vector<FP>& f,
    std::vector<FP>& rho,
    std::vector<FP>& u_x,
    std::vector<FP>& u_y,
    const std::vector<FP>& inlet_u_x,
    const LatticeConfig& lattice);

// left wall: rightward df values of the first column get the equilibrium
// plus the non-equilibrium part of their opposite direction
void ApplyInflowCorrection(
    std::vector<FP>& f,
    const std::vector<FP>& f_eq,
    const LatticeConfig& lattice);

// solid cells: post-collision df values are replaced with the pre-collision
// values of the opposite direction
void ApplyBounceBack(
    const std::vector<FP>& f,
    std::vector<FP>& f_post,
    const std::vector<int>& obstacle_cells);
