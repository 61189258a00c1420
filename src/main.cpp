// single-threaded CPU implementation of the Lattice-Boltzmann method for the
// flow around an obstacle:
// - velocity inlet with a slightly perturbed profile on the left
// - open outflow on the right, periodic top and bottom walls
// - bounce-back on an elliptic or cylindric obstacle
// - optional input file for simulation parameters passed via command line
// - export interval for density and velocity fields

#include "../tools/export.h"
#include "../tools/utilities.h"
#include "errors.h"
#include "parameters.h"
#include "simulation.h"
#include <chrono>
#include <exception>
#include <spdlog/spdlog.h>
#include <string>



int main(int argc, char* argv[])
{
    // configure spdlog to display error messages like this:
    // [hour:min:sec.ms] [file.cpp:line] [type] [message]
    spdlog::set_pattern("[%T.%e] [%s:%#] [%^%l%$] %v");

    // =========================================================================
    // parameters and input file handling
    // =========================================================================
    // defaults describe the flow around an ellipse at Re = 220
    SimulationParameters parameters;

    try
    {
        // default input path and optional overwrite via first command line arg
        std::string inputPath = (argc > 1) ? argv[1] : "<unspecified>";

        if (LoadSimulationParameters(parameters, inputPath))
        {
            SPDLOG_INFO("Loaded parameters from {}", inputPath);
        }
        else
        {
            SPDLOG_WARN("Did not find input file {}, using default parameters",
                inputPath);
        }
    }
    catch (const SimulationError& e)
    {
        SPDLOG_ERROR("{}", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        SPDLOG_ERROR("Could not read simulation parameters: {}", e.what());
        return 1;
    }

    DisplaySimulationParameters(parameters);

    // =========================================================================
    // setup and main simulation loop
    // =========================================================================
    try
    {
        Simulation simulation(parameters);

        simulation.Initialize();

        ProgressDisplay progress_display;
        auto start_time = std::chrono::steady_clock::now();

        simulation.Run(
            [&parameters](const MacroscopicSnapshot& snapshot)
            {
                ExportSelectedData(snapshot, parameters);
            },
            [&progress_display](uint32_t step, uint32_t N_STEPS)
            {
                progress_display.Update(step, N_STEPS);
            });

        auto end_time = std::chrono::steady_clock::now();

        DisplayPerformanceStats(start_time, end_time,
            parameters.N_X, parameters.N_Y, parameters.N_STEPS + 1);
    }
    catch (const SimulationError& e)
    {
        SPDLOG_ERROR("Simulation aborted: {}", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        // allocation of the buffers or file system errors
        SPDLOG_ERROR("Simulation aborted: {}", e.what());
        return 1;
    }

    return 0;
}
