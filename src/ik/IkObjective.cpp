/**
 * @file IkObjective.cpp
 * @brief IK objective implementation
 */

#include "IkObjective.hpp"

namespace chain_ik {
namespace ik {

IkObjective::IkObjective(const kinematics::IKinematicChain& chain,
                         const Matrix4d& target,
                         const JointVector& startingFull,
                         OrientationMode mode,
                         std::optional<double> regularizationWeight)
    : chain_(chain),
      startingFull_(startingFull),
      targetPosition_(kinematics::translationOf(target)),
      orientation_(mode, target),
      regularizationWeight_(regularizationWeight),
      mapper_(chain),
      startingActive_(mapper_.reduce(startingFull)) {
}

ObjectiveTerms IkObjective::evaluate(const JointVector& x) const {
    ObjectiveTerms terms;

    const JointVector full = mapper_.merge(x, startingFull_);
    const Matrix4d pose = chain_.forwardKinematics(full);

    terms.positionError = (kinematics::translationOf(pose) - targetPosition_).norm();
    terms.orientationError = orientation_.error(pose);

    terms.total = terms.positionError * terms.positionError
                + ORIENTATION_WEIGHT * terms.orientationError * terms.orientationError;

    if (regularizationWeight_) {
        terms.regularization = *regularizationWeight_ * (x - startingActive_).norm();
        terms.total += terms.regularization;
    }

    return terms;
}

} // namespace ik
} // namespace chain_ik
