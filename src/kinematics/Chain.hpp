/**
 * @file Chain.hpp
 * @brief Serial kinematic chain with forward kinematics
 */

#pragma once

#include "IKinematicChain.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chain_ik {
namespace kinematics {

/**
 * Serial chain of links
 *
 * FK = T_0(q_0) * T_1(q_1) * ... * T_{n-1}(q_{n-1})
 * with T_i the URDF-convention link transform. Fixed links contribute
 * their origin only; their entry in the joint vector is ignored.
 */
class Chain : public IKinematicChain {
public:
    /**
     * @param links Ordered links, base first
     * @param activeMask One flag per link; default marks every non-fixed link active
     * @param name Display name
     * @throws InvalidArgumentError on empty chain, mask size mismatch or zero motion axis
     */
    explicit Chain(std::vector<Link> links,
                   std::optional<std::vector<bool>> activeMask = std::nullopt,
                   std::string name = "chain");

    const std::vector<Link>& links() const override { return links_; }
    const std::vector<bool>& activeMask() const override { return activeMask_; }
    size_t firstActiveJoint() const override { return firstActive_; }

    Matrix4d forwardKinematics(const JointVector& full) const override;

    /**
     * Pose of every link frame, base to tip
     */
    std::vector<Matrix4d> forwardKinematicsAll(const JointVector& full) const;

    /**
     * Number of active links
     */
    size_t numActive() const { return numActive_; }

    const std::string& name() const { return name_; }

    /**
     * All-zero full joint vector
     */
    JointVector zeroConfiguration() const { return JointVector::Zero(static_cast<Eigen::Index>(links_.size())); }

private:
    void checkJointVector(const JointVector& full) const;

    std::vector<Link> links_;
    std::vector<bool> activeMask_;
    size_t firstActive_ = 0;
    size_t numActive_ = 0;
    std::string name_;
};

} // namespace kinematics
} // namespace chain_ik
