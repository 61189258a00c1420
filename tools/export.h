#pragma once
#include "../src/simulation.h"
#include <string>
#include <vector>



enum SimulationData
{
    VelocityMagnitude,
    Velocity_X,
    Velocity_Y,
    Density,
};

std::string SimulationDataToString(const SimulationData type);

// writes <outputDirName>/<type>_<step>.bin (and .csv), errors are logged
// and the export is skipped
void ExportSimulationData(
    const MacroscopicSnapshot& snapshot,
    const SimulationData type,
    const std::string& outputDirName,
    const bool bin,
    const bool csv = false);

void ExportScalarField(
    const std::vector<FP>& buffer,
    const std::string& fileName,
    const bool bin, const bool csv,
    const int N_X, const int N_Y);

// exports the fields selected in the parameters
void ExportSelectedData(
    const MacroscopicSnapshot& snapshot,
    const SimulationParameters& parameters);
