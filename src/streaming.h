#pragma once
#include "lattice.h"
#include <vector>



// periodic in x and y, f and f_next must not alias
void ComputeStreaming(
    const std::vector<FP>& f,
    std::vector<FP>& f_next,
    const LatticeConfig& lattice);
