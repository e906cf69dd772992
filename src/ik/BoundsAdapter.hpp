/**
 * @file BoundsAdapter.hpp
 * @brief Per-link bounds reduced to the active joint space
 */

#pragma once

#include "ParameterSpaceMapper.hpp"
#include <vector>

namespace chain_ik {
namespace ik {

using kinematics::JointBounds;

/**
 * Bounds of every link, in chain order
 */
std::vector<JointBounds> collectBounds(const kinematics::IKinematicChain& chain);

/**
 * One bound pair per active joint, in the order of ParameterSpaceMapper::reduce().
 * Unlimited directions stay empty (never zero).
 */
std::vector<JointBounds> reduceBounds(const kinematics::IKinematicChain& chain);

/**
 * True if every entry of active lies inside its bound (with tolerance)
 */
bool withinBounds(const JointVector& active, const std::vector<JointBounds>& bounds,
                  double tolerance = 0.0);

} // namespace ik
} // namespace chain_ik
