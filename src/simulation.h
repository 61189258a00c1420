#pragma once
#include "errors.h"
#include "lattice.h"
#include "obstacle.h"
#include "parameters.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>



enum class SimulationStatus
{
    Uninitialized,
    Initialized,
    Running,
    Completed,
    Failed,
};

// read-only view of the macroscopic fields after a completed step, valid
// until the next step modifies the fields it points to
struct MacroscopicSnapshot
{
    uint32_t step = 0;
    const std::vector<FP>* rho = nullptr;
    const std::vector<FP>* u_x = nullptr;
    const std::vector<FP>* u_y = nullptr;

    int N_X = 0;
    int N_Y = 0;
};

using ReportCallback = std::function<void(const MacroscopicSnapshot&)>;
using ProgressCallback = std::function<void(uint32_t step, uint32_t N_STEPS)>;

// flow around an obstacle with velocity inlet on the left, open outflow on
// the right and periodic top and bottom walls, steps 0 to N_STEPS
class Simulation
{
public:
    // throws a SimulationError for an invalid configuration
    explicit Simulation(const SimulationParameters& parameters);
    Simulation(const SimulationParameters& parameters,
               std::unique_ptr<ObstacleShape> shape);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // obstacle mask, inlet profile and equilibrium initial populations
    void Initialize();

    // one full lattice update, throws a SimulationError carrying the step
    // (NonPhysicalDensity, NumericalDivergence) and moves to Failed
    void Step();

    // remaining steps up to N_STEPS, reporting every report_interval steps,
    // returns early (still Running) after RequestStop()
    void Run(const ReportCallback& report = nullptr,
             const ProgressCallback& progress = nullptr);

    // honored between two steps, safe to call from another thread
    void RequestStop();

    SimulationStatus Status() const { return status_; }
    uint32_t NextStep() const { return step_; }
    uint32_t TotalSteps() const { return N_STEPS_; }
    uint32_t ReportInterval() const { return report_interval_; }
    FP Omega() const { return omega_; }

    const LatticeConfig& Lattice() const { return lattice_; }
    const ObstacleShape& Shape() const { return *shape_; }
    const std::vector<uint8_t>& ObstacleMask() const { return obstacle_mask_; }
    const std::vector<FP>& InletProfile() const { return inlet_u_x_; }

    const std::vector<FP>& DistributionFunctions() const { return f_; }
    const std::vector<FP>& Density() const { return rho_; }
    const std::vector<FP>& Velocity_X() const { return u_x_; }
    const std::vector<FP>& Velocity_Y() const { return u_y_; }

    // fields of the most recently completed step
    MacroscopicSnapshot Snapshot() const;

    // copy of the fields taken at the last report, kept after a failure
    std::optional<MacroscopicSnapshot> LastGoodSnapshot() const;

private:
    [[noreturn]] void Fail(const ErrorKind kind, const std::string& message,
                           const uint32_t step);
    void SaveLastGood(const uint32_t step);

    LatticeConfig lattice_;
    std::unique_ptr<ObstacleShape> shape_;

    uint32_t N_STEPS_;
    uint32_t report_interval_;
    FP omega_;
    FP u_lb_;
    FP perturbation_;

    SimulationStatus status_ = SimulationStatus::Uninitialized;
    uint32_t step_ = 0;
    std::atomic<bool> stop_requested_ = false;

    std::vector<uint8_t> obstacle_mask_;
    std::vector<int> obstacle_cells_;
    std::vector<FP> inlet_u_x_;

    // distribution function, post-collision distribution function,
    // equilibrium distribution function
    std::vector<FP> f_;
    std::vector<FP> f_post_;
    std::vector<FP> f_eq_;

    // density and velocity fields
    std::vector<FP> rho_;
    std::vector<FP> u_x_;
    std::vector<FP> u_y_;

    std::optional<uint32_t> last_good_step_;
    std::vector<FP> last_good_rho_;
    std::vector<FP> last_good_u_x_;
    std::vector<FP> last_good_u_y_;
};
