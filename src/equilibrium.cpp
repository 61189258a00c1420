#include "equilibrium.h"
#include <cassert>
#include <cstddef>
#include <vector>



void ComputeEquilibriumCell(
    FP* f_eq,
    const FP rho,
    const FP u_x,
    const FP u_y,
    const LatticeConfig& lattice)
{
    // squared velocity term
    const FP u_sq = 1.5 * (u_x * u_x + u_y * u_y);

    #pragma unroll
    for (int dir = 0; dir < 9; dir++)
    {
        // dot product of discrete direction c_i and velocity u
        const FP cu = 3.0 * (lattice.c_x[dir] * u_x + lattice.c_y[dir] * u_y);

        // equilibrium distribution function in direction i
        f_eq[dir] = rho * lattice.w[dir] * (1.0 + cu + 0.5 * cu * cu - u_sq);
    }
}

void ComputeEquilibrium(
    const std::vector<FP>& rho,
    const std::vector<FP>& u_x,
    const std::vector<FP>& u_y,
    std::vector<FP>& f_eq,
    const LatticeConfig& lattice)
{
    assert(f_eq.size() == static_cast<std::size_t>(lattice.N_CELLS) * 9);

    for (int i = 0; i < lattice.N_CELLS; i++)
    {
        ComputeEquilibriumCell(&f_eq[i * 9], rho[i], u_x[i], u_y[i], lattice);
    }
}
