#include "lattice.h"
#include "errors.h"
#include <cstdint>
#include <limits>
#include <string>



LatticeConfig MakeLatticeConfig(const int N_X, const int N_Y)
{
    // the outflow condition copies from the second to last column
    if (N_X < 2 || N_Y < 1)
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "grid extent must be at least 2 x 1, got "
            + std::to_string(N_X) + " x " + std::to_string(N_Y));
    }

    // every df index (y * N_X + x) * 9 + dir has to fit into an int
    if (static_cast<int64_t>(N_X) * N_Y * 9 > std::numeric_limits<int>::max())
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "grid extent " + std::to_string(N_X) + " x " + std::to_string(N_Y)
            + " is too large");
    }

    LatticeConfig lattice
    {
        .w = {
            1.0/36.0, 1.0/9.0, 1.0/36.0,
            1.0/9.0,  4.0/9.0, 1.0/9.0,
            1.0/36.0, 1.0/9.0, 1.0/36.0 },

        .c_x = { 1,  1,  1,  0,  0,  0, -1, -1, -1 },
        .c_y = { 1,  0, -1,  1,  0, -1,  1,  0, -1 },

        .dirs_right =       { 0, 1, 2 },
        .dirs_vertical =    { 3, 4, 5 },
        .dirs_left =        { 6, 7, 8 },

        .N_X = N_X,
        .N_Y = N_Y,
        .N_CELLS = N_X * N_Y
    };

    return lattice;
}
