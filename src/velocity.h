#pragma once
#include "lattice.h"
#include <vector>



void ComputeVelocityField(
    const std::vector<FP>& f,
    const std::vector<FP>& rho,
    std::vector<FP>& u_x,
    std::vector<FP>& u_y,
    const LatticeConfig& lattice);
