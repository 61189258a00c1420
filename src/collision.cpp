#include "collision.h"
#include <cassert>
#include <cmath>
#include <cstddef>
#include <vector>



void ComputeCollision(
    const std::vector<FP>& f,
    const std::vector<FP>& f_eq,
    std::vector<FP>& f_post,
    const FP omega,
    const int N_CELLS)
{
    assert(&f != &f_post);
    assert(f_post.size() == static_cast<std::size_t>(N_CELLS) * 9);

    for (int i = 0; i < N_CELLS * 9; i++)
    {
        // relax distribution function towards the equilibrium
        f_post[i] = f[i] - omega * (f[i] - f_eq[i]);
    }
}

FP ComputeRelaxationFactor(
    const FP u_lb,
    const FP r,
    const FP Re)
{
    // kinematic viscosity in lattice units
    const FP nu = u_lb * r / Re;

    return 1.0 / (3.0 * nu + 0.5);
}

bool IsValidRelaxationFactor(const FP omega)
{
    return std::isfinite(omega) && omega > 0.0 && omega < 2.0;
}
