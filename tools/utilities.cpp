#include "utilities.h"
#include "../src/errors.h"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>
#include <system_error>



// the whole value has to be consumed, "12abc" is not a number
static void CheckFullyParsed(const std::string& value, const std::size_t pos)
{
    if (pos != value.size())
    {
        throw std::invalid_argument("trailing characters");
    }
}

static int ParseInt(const std::string& value)
{
    std::size_t pos = 0;
    const int parsed = std::stoi(value, &pos);
    CheckFullyParsed(value, pos);

    return parsed;
}

static FP ParseReal(const std::string& value)
{
    std::size_t pos = 0;
    const FP parsed = std::stod(value, &pos);
    CheckFullyParsed(value, pos);

    return parsed;
}

static bool ParseFlag(const std::string& value)
{
    return ParseInt(value) != 0;
}

static uint32_t ParseCount(const std::string& value)
{
    std::size_t pos = 0;
    const long long parsed = std::stoll(value, &pos);
    CheckFullyParsed(value, pos);

    if (parsed < 0 || parsed > 0xFFFFFFFFLL)
    {
        throw std::out_of_range("negative or too large count");
    }

    return static_cast<uint32_t>(parsed);
}

void OverwriteSimulationParameters(
    SimulationParameters& parameters,
    const std::string& key,
    const std::string& value)
{
    try
    {
        if (key == "N_X") parameters.N_X = ParseInt(value);
        else if (key == "N_Y") parameters.N_Y = ParseInt(value);
        else if (key == "N_STEPS") parameters.N_STEPS = ParseCount(value);
        else if (key == "Re") parameters.Re = ParseReal(value);
        else if (key == "u_lb") parameters.u_lb = ParseReal(value);
        else if (key == "omega") parameters.omega = ParseReal(value);
        else if (key == "perturbation") parameters.perturbation = ParseReal(value);
        else if (key == "obstacle_shape") parameters.obstacle_shape = value;
        else if (key == "obstacle_x") parameters.obstacle_x = ParseReal(value);
        else if (key == "obstacle_y") parameters.obstacle_y = ParseReal(value);
        else if (key == "obstacle_r") parameters.obstacle_r = ParseReal(value);
        else if (key == "ellipse_scale_x") parameters.ellipse_scale_x = ParseReal(value);
        else if (key == "ellipse_scale_y") parameters.ellipse_scale_y = ParseReal(value);
        else if (key == "report_interval") parameters.report_interval = ParseCount(value);
        else if (key == "export_dir") parameters.export_dir = value;
        else if (key == "export_rho") parameters.export_rho = ParseFlag(value);
        else if (key == "export_u_x") parameters.export_u_x = ParseFlag(value);
        else if (key == "export_u_y") parameters.export_u_y = ParseFlag(value);
        else if (key == "export_u_mag") parameters.export_u_mag = ParseFlag(value);
        else if (key == "export_csv") parameters.export_csv = ParseFlag(value);
        else
        {
            SPDLOG_WARN("Unknown parameter in simulation input file: {}", key);
        }
    }
    catch (const std::logic_error& e)
    {
        // std::invalid_argument and std::out_of_range from the conversions
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "invalid value '" + value + "' for parameter " + key
            + " (" + e.what() + ")");
    }
}

bool LoadSimulationParameters(
    SimulationParameters& parameters,
    const std::string& inputPath)
{
    std::error_code ec;
    const bool found = std::filesystem::exists(inputPath, ec);
    if (ec)
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "could not access input file " + inputPath + " (" + ec.message() + ")");
    }
    if (!found)
    {
        return false;
    }

    std::ifstream infile(inputPath);
    if (!infile)
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "could not open input file " + inputPath);
    }

    std::string line;
    while (std::getline(infile, line))
    {
        // skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key, value;
        if (!(iss >> key >> value)) continue;

        OverwriteSimulationParameters(parameters, key, value);
    }

    return true;
}

void DisplaySimulationParameters(
    const SimulationParameters& parameters)
{
    printf("\nSimulation Parameters\n");
    printf("------------------------------\n");
    printf("%-20s = %d\n", "N_X", parameters.N_X);
    printf("%-20s = %d\n", "N_Y", parameters.N_Y);
    printf("%-20s = %u\n", "N_STEPS", parameters.N_STEPS);

    printf("%-20s = %.3f\n", "Re", parameters.Re);
    printf("%-20s = %.4f\n", "u_lb", parameters.u_lb);
    if (parameters.omega.has_value())
    {
        printf("%-20s = %.6f\n", "omega", *parameters.omega);
    }
    else
    {
        printf("%-20s = %s\n", "omega", "<from Re>");
    }
    printf("%-20s = %.2e\n", "perturbation", parameters.perturbation);

    printf("%-20s = %s\n", "obstacle_shape", parameters.obstacle_shape.c_str());
    printf("%-20s = %.3f\n", "obstacle_x", parameters.obstacle_x);
    printf("%-20s = %.3f\n", "obstacle_y", parameters.obstacle_y);
    printf("%-20s = %.3f\n", "obstacle_r", parameters.obstacle_r);
    printf("%-20s = %.3f\n", "ellipse_scale_x", parameters.ellipse_scale_x);
    printf("%-20s = %.3f\n", "ellipse_scale_y", parameters.ellipse_scale_y);

    printf("%-20s = %u\n", "report_interval", parameters.report_interval);
    printf("%-20s = %s\n", "export_dir", parameters.export_dir.c_str());
    printf("%-20s = %s\n", "export_rho", parameters.export_rho ? "true" : "false");
    printf("%-20s = %s\n", "export_u_x", parameters.export_u_x ? "true" : "false");
    printf("%-20s = %s\n", "export_u_y", parameters.export_u_y ? "true" : "false");
    printf("%-20s = %s\n", "export_u_mag", parameters.export_u_mag ? "true" : "false");
    printf("%-20s = %s\n", "export_csv", parameters.export_csv ? "true" : "false");
    printf("\n");
}

int EstimateRemainingSeconds(const double elapsed_seconds, const float progress)
{
    if (progress <= 0.0f || progress >= 1.0f) { return 0; }

    return static_cast<int>(elapsed_seconds * (1.0 - progress) / progress);
}

ProgressDisplay::ProgressDisplay()
    : start_time_(std::chrono::steady_clock::now())
{
}

void ProgressDisplay::Update(
    const uint32_t step,
    const uint32_t N_STEPS)
{
    const float progress = (N_STEPS > 0)
        ? static_cast<float>(step) / N_STEPS : 1.0f;
    const int percent = std::min(static_cast<int>(progress * 100.0f), 100);

    if (percent <= last_percent_) { return; }
    last_percent_ = percent;

    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_time_).count();
    const int eta_seconds = EstimateRemainingSeconds(elapsed, progress);

    const int eta_h = eta_seconds / 3600;
    const int eta_m = (eta_seconds % 3600) / 60;
    const int eta_s = eta_seconds % 60;

    // temp simplified message info config
    spdlog::set_pattern("[%T.%e] %v");

    if (percent == 0 || percent == 100)
    {
        SPDLOG_INFO("{:>3} %", percent);
    }
    else
    {
        SPDLOG_INFO("{:>3} %          (~ {:02}:{:02}:{:02} remaining, step {}/{})",
                    percent, eta_h, eta_m, eta_s, step, N_STEPS);
    }

    // restore detailed message info config
    spdlog::set_pattern("[%T.%e] [%s:%#] [%^%l%$] %v");

    if (percent == 100) { std::cout << std::endl; }
}

void DisplayPerformanceStats(
    std::chrono::time_point<std::chrono::steady_clock> start_time,
    std::chrono::time_point<std::chrono::steady_clock> end_time,
    uint32_t N_X, uint32_t N_Y,
    uint32_t N_STEPS)
{
    double execution_time = std::chrono::duration<double>(end_time - start_time).count();

    uint64_t total_updates = static_cast<uint64_t>(N_X) * N_Y
                           * static_cast<uint64_t>(N_STEPS);

    if (N_STEPS == 0 || execution_time <= 0.0) { return; }

    double blups = static_cast<double>(total_updates) / (execution_time * 1e9);

    SPDLOG_INFO("----------------------------------------");
    SPDLOG_INFO("Total execution time:      {:.3f} sec", execution_time);
    SPDLOG_INFO("Step execution time:       {:.3f} ms", (execution_time / N_STEPS) * 1000.0);
    SPDLOG_INFO("Simulation size [X/Y/N]:   [{}/{}/{}]", N_X, N_Y, N_STEPS);
    SPDLOG_INFO("BLUPS:                     {:.6f}", blups);
}
