#pragma once
#include "lattice.h"
#include <vector>



// second order equilibrium for a single cell, valid for |u| well below the
// lattice speed of sound (1/sqrt(3)), velocities are not clamped
void ComputeEquilibriumCell(
    FP* f_eq,
    const FP rho,
    const FP u_x,
    const FP u_y,
    const LatticeConfig& lattice);

void ComputeEquilibrium(
    const std::vector<FP>& rho,
    const std::vector<FP>& u_x,
    const std::vector<FP>& u_y,
    std::vector<FP>& f_eq,
    const LatticeConfig& lattice);
