/**
 * @file CeresBoundedOptimizer.hpp
 * @brief Box-constrained minimizer backed by Ceres Solver
 */

#pragma once

#include "IBoundedOptimizer.hpp"

namespace chain_ik {
namespace optim {

struct CeresOptimizerConfig {
    int maxIterations = 15000;          // used when OptimizerOptions leaves it empty
    double functionTolerance = 1e-12;
    double gradientTolerance = 1e-12;
    double parameterTolerance = 1e-12;
    double residualOffset = 1e-12;      // keeps sqrt(f + offset) differentiable at f = 0
    bool verbose = false;               // Ceres per-iteration progress to stdout
};

/**
 * Minimizes a scalar f: R^n -> R subject to l <= x <= u
 *
 * The objective is handed to Ceres as one residual r = sqrt(f + offset),
 * so the trust-region solver minimizes 0.5 * (f + offset). Box limits map
 * onto Problem::SetParameterLowerBound / SetParameterUpperBound; a missing
 * side stays unbounded. Coordinates with lower == upper are held fixed
 * outside Ceres, which rejects empty boxes.
 *
 * Derivatives come from central numeric differentiation, so f only needs
 * values. Difference points may fall slightly outside the box.
 */
class CeresBoundedOptimizer : public IBoundedOptimizer {
public:
    CeresBoundedOptimizer() = default;
    explicit CeresBoundedOptimizer(const CeresOptimizerConfig& config) : config_(config) {}

    OptimizerResult minimize(const ObjectiveFunction& objective,
                             const Vector& initialGuess,
                             const Bounds& bounds,
                             const OptimizerOptions& options) override;

    const CeresOptimizerConfig& config() const { return config_; }
    void setConfig(const CeresOptimizerConfig& config) { config_ = config; }

private:
    CeresOptimizerConfig config_;
};

} // namespace optim
} // namespace chain_ik
