/**
 * @file IkObjective.hpp
 * @brief Scalar objective minimized by the IK solver
 */

#pragma once

#include "OrientationMode.hpp"
#include "ParameterSpaceMapper.hpp"
#include <optional>

namespace chain_ik {
namespace ik {

/**
 * Weight of the squared orientation error relative to the squared position
 * error. Kept at 1.0 so the optimizer closes the position gap first instead
 * of settling on a pose that matches orientation far from the target.
 */
constexpr double ORIENTATION_WEIGHT = 1.0;

/**
 * Breakdown of one objective evaluation
 */
struct ObjectiveTerms {
    double positionError = 0.0;       // ||p - p_target||
    double orientationError = 0.0;    // mode metric, 0 when mode is None
    double regularization = 0.0;      // lambda * ||x - x_start||, 0 when disabled
    double total = 0.0;
};

/**
 * IK objective for one solve
 *
 *   f(x) = ||p(x) - p_t||^2 + ORIENTATION_WEIGHT * e_o(x)^2 + lambda * ||x - x_0||
 *
 * x is the active joint vector, x_0 the active part of the starting
 * configuration. Holds references: chain, target and starting vector must
 * outlive the objective.
 */
class IkObjective {
public:
    /**
     * @throws InvalidArgumentError for an unrecognized orientation mode or a
     *         starting vector that does not match the chain
     */
    IkObjective(const kinematics::IKinematicChain& chain,
                const Matrix4d& target,
                const JointVector& startingFull,
                OrientationMode mode,
                std::optional<double> regularizationWeight = std::nullopt);

    /**
     * Objective value at active vector x (one forward kinematics call)
     */
    double operator()(const JointVector& x) const { return evaluate(x).total; }

    ObjectiveTerms evaluate(const JointVector& x) const;

    /**
     * Full joint vector for active vector x
     */
    JointVector toFull(const JointVector& x) const { return mapper_.merge(x, startingFull_); }

    const ParameterSpaceMapper& mapper() const { return mapper_; }
    const JointVector& startingActive() const { return startingActive_; }

private:
    const kinematics::IKinematicChain& chain_;
    const JointVector& startingFull_;
    Vector3d targetPosition_;
    OrientationModeSelector orientation_;
    std::optional<double> regularizationWeight_;
    ParameterSpaceMapper mapper_;
    JointVector startingActive_;
};

} // namespace ik
} // namespace chain_ik
