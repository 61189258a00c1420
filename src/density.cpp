#include "density.h"
#include <cassert>
#include <cmath>
#include <cstddef>
#include <vector>



void ComputeDensityField(
    const std::vector<FP>& f,
    std::vector<FP>& rho,
    const int N_CELLS)
{
    assert(f.size() == static_cast<std::size_t>(N_CELLS) * 9);
    assert(rho.size() == static_cast<std::size_t>(N_CELLS));

    for (int i = 0; i < N_CELLS; i++)
    {
        FP sum = 0.0;

        // sum up distribution functions from each direction
        #pragma unroll
        for (int dir = 0; dir < 9; dir++)
        {
            sum += f[i * 9 + dir];
        }

        rho[i] = sum;
    }
}

std::optional<int> FindNonPhysicalDensity(
    const std::vector<FP>& rho)
{
    for (int i = 0; i < static_cast<int>(rho.size()); i++)
    {
        // also catches NaN, which fails every comparison
        if (!(rho[i] > 0.0) || !std::isfinite(rho[i])) [[unlikely]]
        {
            return i;
        }
    }

    return std::nullopt;
}
