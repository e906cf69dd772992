/**
 * @file IKinematicChain.hpp
 * @brief Read-only chain interface consumed by the IK core
 */

#pragma once

#include "Link.hpp"
#include <cstddef>
#include <vector>

namespace chain_ik {
namespace kinematics {

/**
 * Kinematic chain as seen by the solver
 *
 * Implementations must keep forwardKinematics() free of side effects on
 * the chain: one solve evaluates it many times and concurrent solves may
 * share a chain.
 */
class IKinematicChain {
public:
    virtual ~IKinematicChain() = default;

    virtual const std::vector<Link>& links() const = 0;

    /**
     * One flag per link, true for links the optimizer may move
     */
    virtual const std::vector<bool>& activeMask() const = 0;

    /**
     * Index of the first active link (== size() if none is active)
     */
    virtual size_t firstActiveJoint() const = 0;

    /**
     * End-effector pose for a full joint vector (one value per link)
     */
    virtual Matrix4d forwardKinematics(const JointVector& full) const = 0;

    size_t size() const { return links().size(); }
};

} // namespace kinematics
} // namespace chain_ik
