/**
 * @file InverseKinematicsSolver.cpp
 * @brief Optimization-based inverse kinematics implementation
 */

#include "InverseKinematicsSolver.hpp"
#include "../optim/CeresBoundedOptimizer.hpp"
#include "../logging/Logger.hpp"
#include <cmath>
#include <utility>

namespace chain_ik {
namespace ik {

InverseKinematicsSolver::InverseKinematicsSolver()
    : optimizer_(std::make_shared<optim::CeresBoundedOptimizer>()) {
}

InverseKinematicsSolver::InverseKinematicsSolver(std::shared_ptr<optim::IBoundedOptimizer> optimizer)
    : optimizer_(std::move(optimizer))
{
    if (!optimizer_) {
        throw InvalidArgumentError("InverseKinematicsSolver requires an optimizer");
    }
}

// ============================================================================
// Validation
// ============================================================================

void InverseKinematicsSolver::validate(const kinematics::IKinematicChain& chain,
                                       const Matrix4d& target,
                                       const std::optional<JointVector>& startingFull,
                                       const IkOptions& options) {
    if (!startingFull) {
        throw InvalidArgumentError("Starting joint configuration must be specified");
    }

    if (static_cast<size_t>(startingFull->size()) != chain.size()) {
        throw InvalidArgumentError(
            "Starting joint configuration has " + std::to_string(startingFull->size()) +
            " entries, chain has " + std::to_string(chain.size()) + " links");
    }

    if (!startingFull->allFinite()) {
        throw InvalidArgumentError("Starting joint configuration contains non-finite values");
    }

    if (!isValidOrientationMode(options.orientationMode)) {
        throw InvalidArgumentError("Unknown orientation mode: " +
            std::to_string(static_cast<int>(options.orientationMode)));
    }

    if (!target.allFinite()) {
        throw InvalidArgumentError("Target frame contains non-finite values");
    }

    if (options.maxIterations && *options.maxIterations < 1) {
        throw InvalidArgumentError("maxIterations must be positive, got " +
            std::to_string(*options.maxIterations));
    }

    if (options.regularizationWeight &&
        (!std::isfinite(*options.regularizationWeight) || *options.regularizationWeight < 0.0)) {
        throw InvalidArgumentError("regularizationWeight must be a finite non-negative value");
    }
}

// ============================================================================
// Solve
// ============================================================================

IkSolution InverseKinematicsSolver::solve(const kinematics::IKinematicChain& chain,
                                          const Matrix4d& target,
                                          const std::optional<JointVector>& startingFull,
                                          const IkOptions& options) const {
    validate(chain, target, startingFull, options);

    const JointVector& start = *startingFull;

    const IkObjective objective(chain, target, start,
                                options.orientationMode, options.regularizationWeight);
    const auto bounds = reduceBounds(chain);
    const JointVector initialGuess = objective.mapper().reduce(start);

    optim::OptimizerOptions optimizerOptions;
    optimizerOptions.maxIterations = options.maxIterations;

    LOG_DEBUG("IK solve: {} active joints, orientation mode {}, regularization {}, max iterations {}",
        initialGuess.size(), toString(options.orientationMode),
        options.regularizationWeight ? std::to_string(*options.regularizationWeight) : "off",
        options.maxIterations ? std::to_string(*options.maxIterations) : "default");

    const optim::OptimizerResult res = optimizer_->minimize(
        [&objective](const optim::Vector& x) { return objective(x); },
        initialGuess, bounds, optimizerOptions);

    LOG_INFO("Inverse kinematic optimisation OK, done in {} iterations", res.iterations);

    IkSolution solution;
    solution.angles = objective.toFull(res.solution);
    solution.iterations = res.iterations;
    solution.objectiveValue = res.objectiveValue;
    solution.converged = res.converged;
    return solution;
}

// ============================================================================
// Free functions
// ============================================================================

JointVector solveInverseKinematics(const kinematics::IKinematicChain& chain,
                                   const Matrix4d& target,
                                   const std::optional<JointVector>& startingFull,
                                   std::optional<double> regularizationWeight,
                                   std::optional<int> maxIterations,
                                   OrientationMode orientationMode) {
    IkOptions options;
    options.regularizationWeight = regularizationWeight;
    options.maxIterations = maxIterations;
    options.orientationMode = orientationMode;

    InverseKinematicsSolver solver;
    return solver.solve(chain, target, startingFull, options).angles;
}

JointVector solveInverseKinematics(const kinematics::IKinematicChain& chain,
                                   const Matrix4d& target,
                                   const std::optional<JointVector>& startingFull,
                                   std::optional<double> regularizationWeight,
                                   std::optional<int> maxIterations,
                                   const std::string& orientationMode) {
    return solveInverseKinematics(chain, target, startingFull, regularizationWeight,
                                  maxIterations, parseOrientationMode(orientationMode));
}

} // namespace ik
} // namespace chain_ik
