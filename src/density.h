#pragma once
#include "lattice.h"
#include <optional>
#include <vector>



void ComputeDensityField(
    const std::vector<FP>& f,
    std::vector<FP>& rho,
    const int N_CELLS);

// first cell with a density that is not finite and positive, if any
std::optional<int> FindNonPhysicalDensity(
    const std::vector<FP>& rho);
