/**
 * @file Chain.cpp
 * @brief Serial kinematic chain implementation
 */

#include "Chain.hpp"
#include "../common/Errors.hpp"
#include "../logging/Logger.hpp"
#include <utility>

namespace chain_ik {
namespace kinematics {

// ============================================================================
// Constructor
// ============================================================================

Chain::Chain(std::vector<Link> links,
             std::optional<std::vector<bool>> activeMask,
             std::string name)
    : links_(std::move(links)), name_(std::move(name))
{
    if (links_.empty()) {
        throw InvalidArgumentError("Chain '" + name_ + "' has no links");
    }

    if (activeMask) {
        if (activeMask->size() != links_.size()) {
            throw InvalidArgumentError(
                "Active mask has " + std::to_string(activeMask->size()) +
                " entries, chain '" + name_ + "' has " + std::to_string(links_.size()) + " links");
        }
        activeMask_ = *activeMask;
    } else {
        activeMask_.reserve(links_.size());
        for (const auto& link : links_) {
            activeMask_.push_back(!link.isFixed());
        }
    }

    firstActive_ = links_.size();
    for (size_t i = 0; i < links_.size(); ++i) {
        const auto& link = links_[i];

        if (!link.isFixed() && link.axis.norm() < EPSILON) {
            throw InvalidArgumentError("Link '" + link.name + "' has a zero motion axis");
        }

        if (activeMask_[i]) {
            if (link.isFixed()) {
                LOG_WARN("Link '{}' is fixed but marked active; its value will not move the chain",
                    link.name);
            }
            if (firstActive_ == links_.size()) {
                firstActive_ = i;
            }
            ++numActive_;
        }
    }

    LOG_DEBUG("Chain '{}' created with {} links ({} active, first active {})",
        name_, links_.size(), numActive_, firstActive_);

    for (size_t i = 0; i < links_.size(); ++i) {
        const auto& l = links_[i];
        LOG_TRACE("  Link[{}] '{}' {}: xyz=({},{},{}), rpy=({},{},{}), axis=({},{},{}), active={}",
            i, l.name, toString(l.type),
            l.originXyz.x(), l.originXyz.y(), l.originXyz.z(),
            l.originRpy.x(), l.originRpy.y(), l.originRpy.z(),
            l.axis.x(), l.axis.y(), l.axis.z(),
            static_cast<bool>(activeMask_[i]));
    }
}

// ============================================================================
// Forward Kinematics
// ============================================================================

void Chain::checkJointVector(const JointVector& full) const {
    if (static_cast<size_t>(full.size()) != links_.size()) {
        throw InvalidArgumentError(
            "Joint vector has " + std::to_string(full.size()) +
            " entries, chain '" + name_ + "' has " + std::to_string(links_.size()) + " links");
    }
}

Matrix4d Chain::forwardKinematics(const JointVector& full) const {
    checkJointVector(full);

    Matrix4d T = Matrix4d::Identity();
    for (size_t i = 0; i < links_.size(); ++i) {
        T = T * links_[i].transform(full[static_cast<Eigen::Index>(i)]);
    }
    return T;
}

std::vector<Matrix4d> Chain::forwardKinematicsAll(const JointVector& full) const {
    checkJointVector(full);

    std::vector<Matrix4d> transforms;
    transforms.reserve(links_.size());

    Matrix4d T = Matrix4d::Identity();
    for (size_t i = 0; i < links_.size(); ++i) {
        T = T * links_[i].transform(full[static_cast<Eigen::Index>(i)]);
        transforms.push_back(T);
    }
    return transforms;
}

} // namespace kinematics
} // namespace chain_ik
