#include "export.h"
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <sstream>



std::string SimulationDataToString(const SimulationData type)
{
    switch (type)
    {
    case VelocityMagnitude:     return "velocity_magnitude";
    case Velocity_X:            return "velocity_x";
    case Velocity_Y:            return "velocity_y";
    case Density:               return "density";
    default:                    return "unknown";
    }
}

void ExportSimulationData(
    const MacroscopicSnapshot& snapshot,
    const SimulationData type,
    const std::string& outputDirName,
    const bool bin,
    const bool csv)
{
    namespace fs = std::filesystem;

    try
    {
        fs::create_directories(outputDirName);
    }
    catch (const fs::filesystem_error& e)
    {
        SPDLOG_ERROR("Failed to create directory {}: {}", outputDirName, e.what());
        return;
    }

    std::ostringstream oss;
    oss << SimulationDataToString(type) << "_"
        << std::setw(9) << std::setfill('0') << snapshot.step;
    const std::string fileName = (fs::path(outputDirName) / oss.str()).string();

    if (type == VelocityMagnitude)
    {
        // convert velocities into velocity magnitudes
        std::vector<FP> u_mag(snapshot.N_X * snapshot.N_Y);

        for (std::size_t i = 0; i < u_mag.size(); i++)
        {
            u_mag[i] = std::sqrt(snapshot.u_x->at(i) * snapshot.u_x->at(i)
                                 + snapshot.u_y->at(i) * snapshot.u_y->at(i));
        }

        ExportScalarField(u_mag, fileName, bin, csv, snapshot.N_X, snapshot.N_Y);
    }
    else if (type == Velocity_X)
    {
        ExportScalarField(*snapshot.u_x, fileName, bin, csv, snapshot.N_X, snapshot.N_Y);
    }
    else if (type == Velocity_Y)
    {
        ExportScalarField(*snapshot.u_y, fileName, bin, csv, snapshot.N_X, snapshot.N_Y);
    }
    else if (type == Density)
    {
        ExportScalarField(*snapshot.rho, fileName, bin, csv, snapshot.N_X, snapshot.N_Y);
    }
    else
    {
        SPDLOG_ERROR("Unknown simulation data type: {}", static_cast<int>(type));
    }
}

void ExportScalarField(
    const std::vector<FP>& buffer,
    const std::string& fileName,
    const bool bin, const bool csv,
    const int N_X, const int N_Y)
{
    std::streamsize size = buffer.size() * sizeof(FP);

    // export data in .bin format
    if (bin)
    {
        std::ofstream file_bin(fileName + ".bin", std::ios::binary);
        if (!file_bin)
        {
            SPDLOG_ERROR("Could not open output file: {}.bin", fileName);
            return;
        }

        file_bin.write(reinterpret_cast<const char*>(buffer.data()), size);
        file_bin.close();

        SPDLOG_DEBUG("Exported data: {}.bin", fileName);
    }

    // export data in .csv format
    if (csv)
    {
        std::ofstream file_csv(fileName + ".csv");
        if (!file_csv)
        {
            SPDLOG_ERROR("Could not open output file: {}.csv", fileName);
            return;
        }

        file_csv << std::setprecision(17);

        for (int y = 0; y < N_Y; y++)
        {
            for (int x = 0; x < N_X; x++)
            {
                int idx = y * N_X + x;
                file_csv << buffer[idx];

                if (x < N_X - 1) { file_csv << ","; }
            }

            file_csv << "\n";
        }

        file_csv.close();

        SPDLOG_DEBUG("Exported data: {}.csv", fileName);
    }
}

void ExportSelectedData(
    const MacroscopicSnapshot& snapshot,
    const SimulationParameters& parameters)
{
    const bool csv = parameters.export_csv;

    if (parameters.export_rho)
    {
        ExportSimulationData(snapshot, Density, parameters.export_dir, true, csv);
    }
    if (parameters.export_u_x)
    {
        ExportSimulationData(snapshot, Velocity_X, parameters.export_dir, true, csv);
    }
    if (parameters.export_u_y)
    {
        ExportSimulationData(snapshot, Velocity_Y, parameters.export_dir, true, csv);
    }
    if (parameters.export_u_mag)
    {
        ExportSimulationData(snapshot, VelocityMagnitude, parameters.export_dir, true, csv);
    }

    SPDLOG_INFO("Exported data from step {}.", snapshot.step);
}
