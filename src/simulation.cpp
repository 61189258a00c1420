#include "simulation.h"
#include "collision.h"
#include "conditions.h"
#include "density.h"
#include "equilibrium.h"
#include "streaming.h"
#include "velocity.h"
#include <cmath>
#include <cstddef>
#include <limits>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>



static std::optional<int> FindNonFiniteValue(const std::vector<FP>& buffer)
{
    for (int i = 0; i < static_cast<int>(buffer.size()); i++)
    {
        if (!std::isfinite(buffer[i])) [[unlikely]] { return i; }
    }

    return std::nullopt;
}

Simulation::Simulation(const SimulationParameters& parameters)
    : Simulation(parameters, MakeObstacleShape(parameters))
{
}

Simulation::Simulation(
    const SimulationParameters& parameters,
    std::unique_ptr<ObstacleShape> shape)
    : lattice_(MakeLatticeConfig(parameters.N_X, parameters.N_Y)),
      shape_(std::move(shape)),
      N_STEPS_(parameters.N_STEPS),
      report_interval_(parameters.report_interval),
      omega_(ResolveRelaxationFactor(parameters)),
      u_lb_(parameters.u_lb),
      perturbation_(parameters.perturbation)
{
    if (shape_ == nullptr)
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "no obstacle shape given");
    }
    if (report_interval_ == 0)
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "report interval must be positive");
    }
    if (N_STEPS_ == std::numeric_limits<uint32_t>::max())
    {
        throw SimulationError(ErrorKind::InvalidConfiguration,
            "number of steps is too large");
    }
    if (!IsValidRelaxationFactor(omega_))
    {
        throw SimulationError(ErrorKind::InvalidRelaxationParameter,
            "omega = " + std::to_string(omega_) + " is outside of (0, 2)");
    }

    // reject the inlet before any division by (1 - u_x) can happen
    inlet_u_x_ = ComputeInletProfile(u_lb_, perturbation_, lattice_.N_Y);
    ValidateInletProfile(inlet_u_x_);

    SPDLOG_INFO("Solver set up: {} x {} cells, {} steps, omega = {:.6f}, {} obstacle",
        lattice_.N_X, lattice_.N_Y, N_STEPS_, omega_, shape_->Name());
}

void Simulation::Initialize()
{
    if (status_ != SimulationStatus::Uninitialized)
    {
        throw std::logic_error("Simulation::Initialize called twice");
    }

    const std::size_t N_CELLS = static_cast<std::size_t>(lattice_.N_CELLS);

    // initialize various buffers
    f_.assign(N_CELLS * 9, 0.0);
    f_post_.assign(N_CELLS * 9, 0.0);
    f_eq_.assign(N_CELLS * 9, 0.0);
    rho_.assign(N_CELLS, 1.0);
    u_x_.assign(N_CELLS, 0.0);
    u_y_.assign(N_CELLS, 0.0);

    obstacle_mask_ = BuildObstacleMask(*shape_, lattice_);
    obstacle_cells_ = CollectObstacleCells(obstacle_mask_);

    // populations at equilibrium with the inlet velocity and unit density
    ApplyInletFlowCondition(f_, rho_, u_x_, u_y_, inlet_u_x_, lattice_);

    status_ = SimulationStatus::Initialized;

    SPDLOG_INFO("Initialized {} obstacle cells ({:.2f} % of the domain)",
        obstacle_cells_.size(),
        100.0 * static_cast<double>(obstacle_cells_.size()) / N_CELLS);
}

void Simulation::Step()
{
    if (status_ == SimulationStatus::Uninitialized)
    {
        throw std::logic_error("Simulation::Step called before Initialize");
    }
    if (status_ == SimulationStatus::Completed
        || status_ == SimulationStatus::Failed)
    {
        throw std::logic_error("Simulation::Step called after the run ended");
    }

    status_ = SimulationStatus::Running;

    const uint32_t step = step_;
    const int N_CELLS = lattice_.N_CELLS;

    // right wall: outflow condition
    ApplyOutflowCondition(f_, lattice_);

    // compute macroscopic variables, density and velocity
    ComputeDensityField(f_, rho_, N_CELLS);
    ComputeVelocityField(f_, rho_, u_x_, u_y_, lattice_);

    // left wall: inflow condition
    ApplyInflowCondition(f_, rho_, u_x_, u_y_, inlet_u_x_, lattice_);

    if (const auto cell = FindNonPhysicalDensity(rho_))
    {
        const int x = *cell % lattice_.N_X;
        const int y = *cell / lattice_.N_X;
        Fail(ErrorKind::NonPhysicalDensity,
            "rho = " + std::to_string(rho_[*cell]) + " at cell ("
            + std::to_string(x) + ", " + std::to_string(y) + ")", step);
    }

    ComputeEquilibrium(rho_, u_x_, u_y_, f_eq_, lattice_);

    ApplyInflowCorrection(f_, f_eq_, lattice_);

    ComputeCollision(f_, f_eq_, f_post_, omega_, N_CELLS);

    // reads the pre-collision values, writes the post-collision values
    ApplyBounceBack(f_, f_post_, obstacle_cells_);

    ComputeStreaming(f_post_, f_, lattice_);

    // streaming only moves values, so this also covers the collision output
    if (const auto idx = FindNonFiniteValue(f_))
    {
        const int cell = *idx / 9;
        Fail(ErrorKind::NumericalDivergence,
            "non-finite df value in direction " + std::to_string(*idx % 9)
            + " at cell (" + std::to_string(cell % lattice_.N_X) + ", "
            + std::to_string(cell / lattice_.N_X) + ")", step);
    }

    step_++;

    if (step_ > N_STEPS_) { status_ = SimulationStatus::Completed; }
}

void Simulation::Run(
    const ReportCallback& report,
    const ProgressCallback& progress)
{
    if (status_ == SimulationStatus::Uninitialized) { Initialize(); }

    while (status_ != SimulationStatus::Completed)
    {
        if (stop_requested_.exchange(false))
        {
            SPDLOG_WARN("Stop requested, pausing before step {}", step_);
            return;
        }

        const uint32_t step = step_;

        Step();

        if (step % report_interval_ == 0)
        {
            SaveLastGood(step);

            if (report) { report(Snapshot()); }
        }

        if (progress) { progress(step, N_STEPS_); }
    }
}

void Simulation::RequestStop()
{
    stop_requested_ = true;
}

MacroscopicSnapshot Simulation::Snapshot() const
{
    MacroscopicSnapshot snapshot;
    snapshot.step = (step_ > 0) ? step_ - 1 : 0;
    snapshot.rho = &rho_;
    snapshot.u_x = &u_x_;
    snapshot.u_y = &u_y_;
    snapshot.N_X = lattice_.N_X;
    snapshot.N_Y = lattice_.N_Y;

    return snapshot;
}

std::optional<MacroscopicSnapshot> Simulation::LastGoodSnapshot() const
{
    if (!last_good_step_.has_value()) { return std::nullopt; }

    MacroscopicSnapshot snapshot;
    snapshot.step = *last_good_step_;
    snapshot.rho = &last_good_rho_;
    snapshot.u_x = &last_good_u_x_;
    snapshot.u_y = &last_good_u_y_;
    snapshot.N_X = lattice_.N_X;
    snapshot.N_Y = lattice_.N_Y;

    return snapshot;
}

void Simulation::Fail(
    const ErrorKind kind,
    const std::string& message,
    const uint32_t step)
{
    status_ = SimulationStatus::Failed;

    SPDLOG_ERROR("Step {} failed: {} ({})", step, message, ErrorKindToString(kind));

    if (last_good_step_.has_value())
    {
        SPDLOG_ERROR("Last good state is from step {}", *last_good_step_);
    }

    throw SimulationError(kind, message, step);
}

void Simulation::SaveLastGood(const uint32_t step)
{
    last_good_step_ = step;
    last_good_rho_ = rho_;
    last_good_u_x_ = u_x_;
    last_good_u_y_ = u_y_;
}
