#include "velocity.h"
#include <cmath>
#include <vector>



void ComputeVelocityField(
    const std::vector<FP>& f,
    const std::vector<FP>& rho,
    std::vector<FP>& u_x,
    std::vector<FP>& u_y,
    const LatticeConfig& lattice)
{
    for (int i = 0; i < lattice.N_CELLS; i++)
    {
        // erroneous densities are reported by the caller, the velocity of
        // such a cell is left at zero instead of dividing by it
        if (!(rho[i] > 0.0) || !std::isfinite(rho[i])) [[unlikely]]
        {
            u_x[i] = 0.0;
            u_y[i] = 0.0;
            continue;
        }

        FP sum_x = 0.0;
        FP sum_y = 0.0;

        // sum up distribution functions, weighted for each direction
        #pragma unroll
        for (int dir = 0; dir < 9; dir++)
        {
            const FP f_i = f[i * 9 + dir];
            sum_x += f_i * lattice.c_x[dir];
            sum_y += f_i * lattice.c_y[dir];
        }

        // divide by density for final velocity values
        u_x[i] = sum_x / rho[i];
        u_y[i] = sum_y / rho[i];
    }
}
