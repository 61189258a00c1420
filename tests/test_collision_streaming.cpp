#include "collision.h"
#include "density.h"
#include "equilibrium.h"
#include "lattice.h"
#include "streaming.h"
#include "velocity.h"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <gtest/gtest.h>
#include <limits>
#include <numeric>
#include <random>
#include <vector>



static std::vector<FP> MakeRandomPopulations(const LatticeConfig& lattice,
                                             const unsigned seed)
{
    std::mt19937 gen(seed);
    std::uniform_real_distribution<FP> dist(0.01, 0.3);

    std::vector<FP> f(lattice.N_CELLS * 9);
    for (FP& value : f) { value = dist(gen); }

    return f;
}

TEST(CollisionTest, RelaxesTowardsEquilibrium) {
    const LatticeConfig lattice = MakeLatticeConfig(4, 3);
    const std::vector<FP> f = MakeRandomPopulations(lattice, 1);
    const std::vector<FP> f_eq = MakeRandomPopulations(lattice, 2);
    std::vector<FP> f_post(f.size());

    ComputeCollision(f, f_eq, f_post, 1.3, lattice.N_CELLS);

    for (std::size_t i = 0; i < f.size(); i++)
    {
        EXPECT_DOUBLE_EQ(f_post[i], f[i] - 1.3 * (f[i] - f_eq[i]));
    }

    // omega = 1 relaxes exactly to the equilibrium
    ComputeCollision(f, f_eq, f_post, 1.0, lattice.N_CELLS);

    for (std::size_t i = 0; i < f.size(); i++)
    {
        EXPECT_DOUBLE_EQ(f_post[i], f_eq[i]);
    }
}

TEST(CollisionTest, ConservesMassAndMomentumPerCell) {
    const LatticeConfig lattice = MakeLatticeConfig(5, 4);
    const std::vector<FP> f = MakeRandomPopulations(lattice, 3);

    std::vector<FP> rho(lattice.N_CELLS), u_x(lattice.N_CELLS), u_y(lattice.N_CELLS);
    ComputeDensityField(f, rho, lattice.N_CELLS);
    ComputeVelocityField(f, rho, u_x, u_y, lattice);

    std::vector<FP> f_eq(f.size());
    ComputeEquilibrium(rho, u_x, u_y, f_eq, lattice);

    std::vector<FP> f_post(f.size());
    ComputeCollision(f, f_eq, f_post, 1.7, lattice.N_CELLS);

    std::vector<FP> rho_post(lattice.N_CELLS), u_x_post(lattice.N_CELLS), u_y_post(lattice.N_CELLS);
    ComputeDensityField(f_post, rho_post, lattice.N_CELLS);
    ComputeVelocityField(f_post, rho_post, u_x_post, u_y_post, lattice);

    for (int i = 0; i < lattice.N_CELLS; i++)
    {
        EXPECT_NEAR(rho_post[i], rho[i], 1e-13);
        EXPECT_NEAR(u_x_post[i], u_x[i], 1e-13);
        EXPECT_NEAR(u_y_post[i], u_y[i], 1e-13);
    }
}

TEST(CollisionTest, RelaxationFactorFromReynoldsNumber) {
    // nu = 0.04 * 20 / 220
    const FP nu = 0.04 * 20.0 / 220.0;
    EXPECT_DOUBLE_EQ(ComputeRelaxationFactor(0.04, 20.0, 220.0), 1.0 / (3.0 * nu + 0.5));

    // vanishing viscosity approaches the stability limit from below
    EXPECT_LT(ComputeRelaxationFactor(0.04, 20.0, 1e9), 2.0);
    EXPECT_TRUE(IsValidRelaxationFactor(ComputeRelaxationFactor(0.04, 20.0, 220.0)));
}

TEST(CollisionTest, RelaxationFactorRange) {
    EXPECT_TRUE(IsValidRelaxationFactor(1.0));
    EXPECT_TRUE(IsValidRelaxationFactor(1.99));
    EXPECT_TRUE(IsValidRelaxationFactor(0.01));

    EXPECT_FALSE(IsValidRelaxationFactor(0.0));
    EXPECT_FALSE(IsValidRelaxationFactor(2.0));
    EXPECT_FALSE(IsValidRelaxationFactor(-1.0));
    EXPECT_FALSE(IsValidRelaxationFactor(std::numeric_limits<FP>::quiet_NaN()));
    EXPECT_FALSE(IsValidRelaxationFactor(std::numeric_limits<FP>::infinity()));
}

TEST(StreamingTest, MovesValuesAlongTheirDirection) {
    const LatticeConfig lattice = MakeLatticeConfig(6, 5);

    std::vector<FP> f(lattice.N_CELLS * 9, 0.0);
    std::vector<FP> f_next(f.size(), -1.0);

    // one marked value per direction at (2, 2)
    for (int dir = 0; dir < 9; dir++)
    {
        f[DfIndex(2, 2, dir, lattice.N_X)] = 1.0 + dir;
    }

    ComputeStreaming(f, f_next, lattice);

    for (int dir = 0; dir < 9; dir++)
    {
        const int x = 2 + lattice.c_x[dir];
        const int y = 2 + lattice.c_y[dir];
        EXPECT_EQ(f_next[DfIndex(x, y, dir, lattice.N_X)], 1.0 + dir);
    }

    // every other value was overwritten with the (zero) source value
    EXPECT_EQ(std::count(f_next.begin(), f_next.end(), 0.0),
              static_cast<long>(f_next.size()) - 9);
}

TEST(StreamingTest, WrapsAroundAllEdges) {
    const LatticeConfig lattice = MakeLatticeConfig(6, 5);

    std::vector<FP> f(lattice.N_CELLS * 9, 0.0);
    std::vector<FP> f_next(f.size(), 0.0);

    // direction 8 is (-1, -1), direction 0 is (1, 1)
    f[DfIndex(0, 0, 8, lattice.N_X)] = 3.0;
    f[DfIndex(5, 4, 0, lattice.N_X)] = 4.0;
    // direction 7 is (-1, 0)
    f[DfIndex(0, 3, 7, lattice.N_X)] = 5.0;

    ComputeStreaming(f, f_next, lattice);

    EXPECT_EQ(f_next[DfIndex(5, 4, 8, lattice.N_X)], 3.0);
    EXPECT_EQ(f_next[DfIndex(0, 0, 0, lattice.N_X)], 4.0);
    EXPECT_EQ(f_next[DfIndex(5, 3, 7, lattice.N_X)], 5.0);
}

TEST(StreamingTest, ConservesTotalMass) {
    const LatticeConfig lattice = MakeLatticeConfig(13, 7);
    const std::vector<FP> f = MakeRandomPopulations(lattice, 11);
    std::vector<FP> f_next(f.size());

    ComputeStreaming(f, f_next, lattice);

    const FP mass = std::accumulate(f.begin(), f.end(), 0.0);
    const FP mass_next = std::accumulate(f_next.begin(), f_next.end(), 0.0);
    EXPECT_NEAR(mass_next, mass, 1e-12 * mass);

    // per direction, streaming only permutes the values
    for (int dir = 0; dir < 9; dir++)
    {
        std::vector<FP> before, after;
        for (int i = 0; i < lattice.N_CELLS; i++)
        {
            before.push_back(f[i * 9 + dir]);
            after.push_back(f_next[i * 9 + dir]);
        }
        std::sort(before.begin(), before.end());
        std::sort(after.begin(), after.end());
        EXPECT_EQ(before, after);
    }
}
