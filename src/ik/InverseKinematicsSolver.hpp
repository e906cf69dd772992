/**
 * @file InverseKinematicsSolver.hpp
 * @brief Optimization-based inverse kinematics for arbitrary serial chains
 */

#pragma once

#include "IkObjective.hpp"
#include "BoundsAdapter.hpp"
#include "../optim/IBoundedOptimizer.hpp"
#include <memory>
#include <optional>
#include <string>

namespace chain_ik {
namespace ik {

// ============================================================================
// Solver options / result
// ============================================================================

/**
 * Per-solve configuration. Every optional field defaults to "disabled".
 */
struct IkOptions {
    // Weight of the ||x - x_start|| penalty; empty = no regularization
    std::optional<double> regularizationWeight;

    // Optimizer iteration cap; empty = optimizer default
    std::optional<int> maxIterations;

    OrientationMode orientationMode = OrientationMode::None;
};

/**
 * Result of one solve
 */
struct IkSolution {
    JointVector angles;         // full joint vector, fixed entries copied from the start
    int iterations = 0;
    double objectiveValue = 0.0;
    bool converged = false;     // informational - non-convergence is not an error
};

// ============================================================================
// Solver
// ============================================================================

/**
 * Inverse kinematics by bound-constrained minimization
 *
 * One local optimization per call: no retries, no multi-start. Poor
 * starting configurations can end in local minima; choosing the start is
 * the caller's job.
 */
class InverseKinematicsSolver {
public:
    /**
     * Uses the Ceres-backed bounded optimizer
     */
    InverseKinematicsSolver();

    explicit InverseKinematicsSolver(std::shared_ptr<optim::IBoundedOptimizer> optimizer);

    /**
     * Solve for the full joint vector reaching target
     * @param chain Kinematic chain (read-only during the solve)
     * @param target Desired 4x4 end-effector pose
     * @param startingFull Starting configuration, one entry per link
     * @param options Regularization / iteration cap / orientation mode
     * @throws InvalidArgumentError before any optimizer work on bad input
     * @throws OptimizationFailure when the optimizer itself fails
     */
    IkSolution solve(const kinematics::IKinematicChain& chain,
                     const Matrix4d& target,
                     const std::optional<JointVector>& startingFull,
                     const IkOptions& options = IkOptions()) const;

    /**
     * Check options against a chain without solving
     * @throws InvalidArgumentError
     */
    static void validate(const kinematics::IKinematicChain& chain,
                         const Matrix4d& target,
                         const std::optional<JointVector>& startingFull,
                         const IkOptions& options);

private:
    std::shared_ptr<optim::IBoundedOptimizer> optimizer_;
};

/**
 * Convenience entry point: solve with the default optimizer and return
 * only the full joint vector.
 */
JointVector solveInverseKinematics(const kinematics::IKinematicChain& chain,
                                   const Matrix4d& target,
                                   const std::optional<JointVector>& startingFull,
                                   std::optional<double> regularizationWeight = std::nullopt,
                                   std::optional<int> maxIterations = std::nullopt,
                                   OrientationMode orientationMode = OrientationMode::None);

/**
 * Same, with the orientation mode given by name ("X", "Y", "Z", "all", "none")
 */
JointVector solveInverseKinematics(const kinematics::IKinematicChain& chain,
                                   const Matrix4d& target,
                                   const std::optional<JointVector>& startingFull,
                                   std::optional<double> regularizationWeight,
                                   std::optional<int> maxIterations,
                                   const std::string& orientationMode);

} // namespace ik
} // namespace chain_ik
