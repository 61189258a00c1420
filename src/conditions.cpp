#include "conditions.h"
#include "equilibrium.h"
#include "errors.h"
#include <cassert>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <string>
#include <vector>



std::vector<FP> ComputeInletProfile(
    const FP u_lb,
    const FP perturbation,
    const int N_Y)
{
    std::vector<FP> inlet_u_x(N_Y);

    // height of the domain in lattice units (avoid a zero height for N_Y = 1)
    const FP l_y = (N_Y > 1) ? static_cast<FP>(N_Y - 1) : 1.0;

    for (int y = 0; y < N_Y; y++)
    {
        // slight perturbation to trigger the instability
        inlet_u_x[y] = u_lb * (1.0 + perturbation
            * std::sin(static_cast<FP>(y) / l_y * 2.0 * std::numbers::pi));
    }

    return inlet_u_x;
}

void ValidateInletProfile(
    const std::vector<FP>& inlet_u_x)
{
    for (std::size_t y = 0; y < inlet_u_x.size(); y++)
    {
        // the inflow density reconstruction divides by (1 - u_x)
        if (!std::isfinite(inlet_u_x[y]) || std::abs(inlet_u_x[y]) >= 1.0)
        {
            throw SimulationError(ErrorKind::InletVelocityOutOfRange,
                "inlet velocity " + std::to_string(inlet_u_x[y])
                + " at y = " + std::to_string(y)
                + " must have a magnitude below 1");
        }
    }
}

void ApplyInletFlowCondition(
    std::vector<FP>& f,
    std::vector<FP>& rho,
    std::vector<FP>& u_x,
    std::vector<FP>& u_y,
    const std::vector<FP>& inlet_u_x,
    const LatticeConfig& lattice)
{
    for (int y = 0; y < lattice.N_Y; y++)
    {
        for (int x = 0; x < lattice.N_X; x++)
        {
            const int idx = CellIndex(x, y, lattice.N_X);

            // initialize values of the different fields
            u_x[idx] = inlet_u_x[y];
            u_y[idx] = 0.0;
            rho[idx] = 1.0;

            // initialize distribution functions as an equilibrium
            ComputeEquilibriumCell(&f[idx * 9], 1.0, inlet_u_x[y], 0.0, lattice);
        }
    }
}

void ApplyOutflowCondition(
    std::vector<FP>& f,
    const LatticeConfig& lattice)
{
    const int x_last = lattice.N_X - 1;

    for (int y = 0; y < lattice.N_Y; y++)
    {
        for (const int dir : lattice.dirs_left)
        {
            f[DfIndex(x_last, y, dir, lattice.N_X)] =
                f[DfIndex(x_last - 1, y, dir, lattice.N_X)];
        }
    }
}

void ApplyInflowCondition(
    const std::vector<FP>& f,
    std::vector<FP>& rho,
    std::vector<FP>& u_x,
    std::vector<FP>& u_y,
    const std::vector<FP>& inlet_u_x,
    const LatticeConfig& lattice)
{
    for (int y = 0; y < lattice.N_Y; y++)
    {
        const int idx = CellIndex(0, y, lattice.N_X);

        u_x[idx] = inlet_u_x[y];
        u_y[idx] = 0.0;

        FP sum_vertical = 0.0;
        FP sum_left = 0.0;

        for (const int dir : lattice.dirs_vertical)
        {
            sum_vertical += f[idx * 9 + dir];
        }
        for (const int dir : lattice.dirs_left)
        {
            sum_left += f[idx * 9 + dir];
        }

        // closed form density for the prescribed x-velocity, the unknown
        // rightward df values are eliminated via mass and x-momentum
        rho[idx] = (sum_vertical + 2.0 * sum_left) / (1.0 - u_x[idx]);
    }
}

void ApplyInflowCorrection(
    std::vector<FP>& f,
    const std::vector<FP>& f_eq,
    const LatticeConfig& lattice)
{
    for (int y = 0; y < lattice.N_Y; y++)
    {
        const int idx = CellIndex(0, y, lattice.N_X);

        for (const int dir : lattice.dirs_right)
        {
            const int opp = Opposite(dir);

            f[idx * 9 + dir] = f_eq[idx * 9 + dir]
                + f[idx * 9 + opp] - f_eq[idx * 9 + opp];
        }
    }
}

void ApplyBounceBack(
    const std::vector<FP>& f,
    std::vector<FP>& f_post,
    const std::vector<int>& obstacle_cells)
{
    assert(&f != &f_post);

    for (const int cell : obstacle_cells)
    {
        #pragma unroll
        for (int dir = 0; dir < 9; dir++)
        {
            f_post[cell * 9 + dir] = f[cell * 9 + Opposite(dir)];
        }
    }
}
