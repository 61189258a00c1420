#pragma once
#include "../src/parameters.h"
#include <chrono>
#include <cstdint>
#include <string>



// overwrites a single parameter, warns about unknown keys and throws a
// SimulationError (InvalidConfiguration) for malformed values
void OverwriteSimulationParameters(
    SimulationParameters& parameters,
    const std::string& key,
    const std::string& value);

// reads "key value" lines (lines starting with # are comments) and returns
// false if the file does not exist, in which case parameters stay untouched,
// throws a SimulationError (InvalidConfiguration) if the path can not be
// checked or opened or a value is malformed
bool LoadSimulationParameters(
    SimulationParameters& parameters,
    const std::string& inputPath);

void DisplaySimulationParameters(
    const SimulationParameters& parameters);

// remaining seconds if the rest of the run keeps the pace of the part done,
// 0 before the first and after the last step
int EstimateRemainingSeconds(const double elapsed_seconds, const float progress);

// logs each new percent of a run once, with the estimated remaining time
class ProgressDisplay
{
public:
    ProgressDisplay();

    void Update(const uint32_t step, const uint32_t N_STEPS);

    // -1 before the first update
    int LastPercent() const { return last_percent_; }

private:
    int last_percent_ = -1;
    std::chrono::steady_clock::time_point start_time_;
};

// execution time in seconds, number of lattice updates, blups
void DisplayPerformanceStats(
    std::chrono::time_point<std::chrono::steady_clock> start_time,
    std::chrono::time_point<std::chrono::steady_clock> end_time,
    uint32_t N_X, uint32_t N_Y,
    uint32_t N_STEPS);
