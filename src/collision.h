#pragma once
#include "lattice.h"
#include <vector>



// BGK relaxation towards the equilibrium, omega in (0, 2)
void ComputeCollision(
    const std::vector<FP>& f,
    const std::vector<FP>& f_eq,
    std::vector<FP>& f_post,
    const FP omega,
    const int N_CELLS);

// relaxation factor for a given lattice viscosity
FP ComputeRelaxationFactor(
    const FP u_lb,
    const FP r,
    const FP Re);

bool IsValidRelaxationFactor(const FP omega);
