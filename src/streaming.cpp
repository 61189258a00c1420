#include "streaming.h"
#include <cassert>
#include <cstddef>
#include <vector>



void ComputeStreaming(
    const std::vector<FP>& f,
    std::vector<FP>& f_next,
    const LatticeConfig& lattice)
{
    assert(&f != &f_next);
    assert(f_next.size() == f.size());

    const int N_X = lattice.N_X;
    const int N_Y = lattice.N_Y;

    // every value moves one cell along its direction, leaving the grid on
    // one edge means entering it on the opposite edge
    for (int dir = 0; dir < 9; dir++)
    {
        const int c_x = lattice.c_x[dir];
        const int c_y = lattice.c_y[dir];

        for (int y = 0; y < N_Y; y++)
        {
            const int y_dst = (y + c_y + N_Y) % N_Y;

            for (int x = 0; x < N_X; x++)
            {
                const int x_dst = (x + c_x + N_X) % N_X;

                f_next[DfIndex(x_dst, y_dst, dir, N_X)] = f[DfIndex(x, y, dir, N_X)];
            }
        }
    }
}
