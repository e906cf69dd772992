/**
 * @file CeresBoundedOptimizer.cpp
 * @brief Ceres trust-region solve of a scalar objective under box limits
 */

#include "CeresBoundedOptimizer.hpp"
#include "../common/Errors.hpp"
#include "../logging/Logger.hpp"
#include <ceres/ceres.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace chain_ik {
namespace optim {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

/**
 * Free coordinates on the Ceres side, pinned ones held here
 */
struct ExpandedObjective {
    const ObjectiveFunction& objective;
    Vector full;                        // pinned values, free slots overwritten per call
    std::vector<Eigen::Index> freeIndices;
    int evaluations = 0;

    double operator()(const double* freeValues) {
        for (size_t k = 0; k < freeIndices.size(); ++k) {
            full[freeIndices[k]] = freeValues[k];
        }
        ++evaluations;
        return objective(full);
    }
};

// ============================================================================
// Cost functor: r = sqrt(f + offset)
// ============================================================================

class ScalarObjectiveResidual {
public:
    ScalarObjectiveResidual(ExpandedObjective* expanded, double offset)
        : expanded_(expanded), offset_(offset) {}

    bool operator()(double const* const* parameters, double* residuals) const {
        const double f = (*expanded_)(parameters[0]);
        if (!std::isfinite(f)) {
            return false;
        }
        residuals[0] = std::sqrt(std::max(f, 0.0) + offset_);
        return true;
    }

private:
    ExpandedObjective* expanded_;
    double offset_;
};

using ScalarCostFunction =
    ceres::DynamicNumericDiffCostFunction<ScalarObjectiveResidual, ceres::CENTRAL>;

} // namespace

OptimizerResult CeresBoundedOptimizer::minimize(const ObjectiveFunction& objective,
                                                const Vector& initialGuess,
                                                const Bounds& bounds,
                                                const OptimizerOptions& options) {
    const Eigen::Index n = initialGuess.size();

    // ------------------------------------------------------------------------
    // Problem validation
    // ------------------------------------------------------------------------

    if (static_cast<size_t>(n) != bounds.size()) {
        throw OptimizationFailure("Bounds count " + std::to_string(bounds.size()) +
                                  " does not match problem dimension " + std::to_string(n));
    }
    if (!initialGuess.allFinite()) {
        throw OptimizationFailure("Initial guess contains non-finite values");
    }

    Vector lower = Vector::Constant(n, -INF);
    Vector upper = Vector::Constant(n, INF);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& b = bounds[static_cast<size_t>(i)];
        if ((b.lower && std::isnan(*b.lower)) || (b.upper && std::isnan(*b.upper))) {
            throw OptimizationFailure("Bound " + std::to_string(i) + " is NaN");
        }
        lower[i] = b.lowerOr(-INF);
        upper[i] = b.upperOr(INF);
        if (lower[i] > upper[i]) {
            throw OptimizationFailure("Bound " + std::to_string(i) + " has lower > upper");
        }
    }

    const int maxIterations = options.maxIterations.value_or(config_.maxIterations);
    if (maxIterations < 0) {
        throw OptimizationFailure("Iteration cap must not be negative, got " +
                                  std::to_string(maxIterations));
    }

    // Ceres refuses infeasible starting points
    ExpandedObjective expanded{objective, initialGuess.cwiseMax(lower).cwiseMin(upper), {}};
    for (Eigen::Index i = 0; i < n; ++i) {
        if (lower[i] < upper[i]) {
            expanded.freeIndices.push_back(i);
        }
    }

    OptimizerResult result;

    const double f0 = objective(expanded.full);
    ++expanded.evaluations;
    if (!std::isfinite(f0)) {
        throw OptimizationFailure("Objective is not finite at the initial guess");
    }

    if (expanded.freeIndices.empty()) {
        result.solution = expanded.full;
        result.objectiveValue = f0;
        result.evaluations = expanded.evaluations;
        result.converged = true;
        result.message = n == 0 ? "Nothing to optimize" : "All variables pinned by their bounds";
        return result;
    }

    // ------------------------------------------------------------------------
    // Ceres problem over the free coordinates
    // ------------------------------------------------------------------------

    const int freeCount = static_cast<int>(expanded.freeIndices.size());
    Vector x(freeCount);
    for (int k = 0; k < freeCount; ++k) {
        x[k] = expanded.full[expanded.freeIndices[static_cast<size_t>(k)]];
    }

    auto* cost = new ScalarCostFunction(
        new ScalarObjectiveResidual(&expanded, config_.residualOffset));
    cost->AddParameterBlock(freeCount);
    cost->SetNumResiduals(1);

    ceres::Problem problem;
    problem.AddResidualBlock(cost, nullptr, x.data());

    for (int k = 0; k < freeCount; ++k) {
        const Eigen::Index i = expanded.freeIndices[static_cast<size_t>(k)];
        const auto& b = bounds[static_cast<size_t>(i)];
        if (b.lower) {
            problem.SetParameterLowerBound(x.data(), k, *b.lower);
        }
        if (b.upper) {
            problem.SetParameterUpperBound(x.data(), k, *b.upper);
        }
    }

    ceres::Solver::Options solverOptions;
    solverOptions.max_num_iterations = maxIterations;
    solverOptions.linear_solver_type = ceres::DENSE_QR;
    solverOptions.minimizer_progress_to_stdout = config_.verbose;
    solverOptions.logging_type = config_.verbose ? ceres::PER_MINIMIZER_ITERATION : ceres::SILENT;
    solverOptions.function_tolerance = config_.functionTolerance;
    solverOptions.gradient_tolerance = config_.gradientTolerance;
    solverOptions.parameter_tolerance = config_.parameterTolerance;

    ceres::Solver::Summary summary;
    ceres::Solve(solverOptions, &problem, &summary);

    LOG_DEBUG("Ceres: {}", summary.BriefReport());

    // ------------------------------------------------------------------------
    // Result
    // ------------------------------------------------------------------------

    for (int k = 0; k < freeCount; ++k) {
        expanded.full[expanded.freeIndices[static_cast<size_t>(k)]] = x[k];
    }

    result.solution = expanded.full;
    result.iterations = summary.num_successful_steps + summary.num_unsuccessful_steps;
    result.converged = summary.termination_type == ceres::CONVERGENCE;
    result.message = summary.message;

    const double fEnd = objective(result.solution);
    ++expanded.evaluations;
    result.objectiveValue = fEnd;
    result.evaluations = expanded.evaluations;

    if (summary.termination_type == ceres::FAILURE ||
        summary.termination_type == ceres::USER_FAILURE) {
        LOG_WARN("Ceres stopped without a usable step: {}", summary.message);
    }

    LOG_DEBUG("Bounded solve finished: {} iterations, {} evaluations, f={}, {}",
        result.iterations, result.evaluations, result.objectiveValue, result.message);

    return result;
}

} // namespace optim
} // namespace chain_ik
