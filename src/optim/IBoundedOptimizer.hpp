/**
 * @file IBoundedOptimizer.hpp
 * @brief Box-constrained minimizer interface
 */

#pragma once

#include "../kinematics/JointBounds.hpp"
#include <Eigen/Core>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace chain_ik {
namespace optim {

using Vector = Eigen::VectorXd;
using Bounds = std::vector<kinematics::JointBounds>;
using ObjectiveFunction = std::function<double(const Vector&)>;

struct OptimizerOptions {
    // Iteration cap; empty = implementation default
    std::optional<int> maxIterations;
};

struct OptimizerResult {
    Vector solution;            // always inside the bounds
    int iterations = 0;
    int evaluations = 0;        // objective calls, numeric differentiation included
    double objectiveValue = 0.0;
    bool converged = false;     // false when the cap or a solver failure stopped the run
    std::string message;
};

/**
 * Bound-constrained minimizer
 *
 * Contract: returns the best iterate found even without convergence.
 * Throws OptimizationFailure only when the problem itself is malformed
 * (bounds/dimension mismatch, inverted bounds, non-finite objective at start).
 */
class IBoundedOptimizer {
public:
    virtual ~IBoundedOptimizer() = default;

    virtual OptimizerResult minimize(const ObjectiveFunction& objective,
                                     const Vector& initialGuess,
                                     const Bounds& bounds,
                                     const OptimizerOptions& options) = 0;
};

} // namespace optim
} // namespace chain_ik
