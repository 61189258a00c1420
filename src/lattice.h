#pragma once
#include <array>
#include <cstdint>



// floating point type used for all fields
using FP = double;

// D2Q9 lattice and the extent of the grid it is laid out on
// ---------
// | 6 3 0 |
// | 7 4 1 |
// | 8 5 2 |
// ---------
// (direction i and direction 8 - i point in opposite directions)
struct LatticeConfig
{
    // weight vector, holding lattice weights for each velocity direction
    std::array<FP, 9> w;

    // velocity directions (x and y components separately)
    std::array<int, 9> c_x;
    std::array<int, 9> c_y;

    // directions grouped by the sign of their x component
    std::array<int, 3> dirs_right;      // c_x = +1
    std::array<int, 3> dirs_vertical;   // c_x =  0
    std::array<int, 3> dirs_left;       // c_x = -1

    // grid width, height, number of grid cells
    int N_X;
    int N_Y;
    int N_CELLS;
};

// builds the lattice constants for a N_X * N_Y grid, throws a
// SimulationError (InvalidConfiguration) for N_X < 2 or N_Y < 1 and for grids
// whose 9 * N_X * N_Y df values can not be indexed with an int
LatticeConfig MakeLatticeConfig(const int N_X, const int N_Y);

inline constexpr int Opposite(const int dir) { return 8 - dir; }

// index of the distribution function value in direction dir at cell (x, y)
inline int DfIndex(const int x, const int y, const int dir, const int N_X)
{
    return (y * N_X + x) * 9 + dir;
}

inline int CellIndex(const int x, const int y, const int N_X)
{
    return y * N_X + x;
}
