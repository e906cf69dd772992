/**
 * @file ParameterSpaceMapper.cpp
 * @brief Full/active joint space mapping
 */

#include "ParameterSpaceMapper.hpp"
#include <utility>

namespace chain_ik {
namespace ik {

ParameterSpaceMapper::ParameterSpaceMapper(const kinematics::IKinematicChain& chain)
    : ParameterSpaceMapper(chain.activeMask()) {
}

ParameterSpaceMapper::ParameterSpaceMapper(std::vector<bool> activeMask)
    : mask_(std::move(activeMask))
{
    for (size_t i = 0; i < mask_.size(); ++i) {
        if (mask_[i]) {
            activeIndices_.push_back(i);
        }
    }
}

void ParameterSpaceMapper::checkFullSize(size_t size, const char* what) const {
    if (size != mask_.size()) {
        throw InvalidArgumentError(
            std::string("Full ") + what + " has " + std::to_string(size) +
            " entries, expected " + std::to_string(mask_.size()));
    }
}

JointVector ParameterSpaceMapper::reduce(const JointVector& full) const {
    checkFullSize(static_cast<size_t>(full.size()), "joint vector");

    JointVector active(static_cast<Eigen::Index>(activeIndices_.size()));
    for (size_t k = 0; k < activeIndices_.size(); ++k) {
        active[static_cast<Eigen::Index>(k)] = full[static_cast<Eigen::Index>(activeIndices_[k])];
    }
    return active;
}

JointVector ParameterSpaceMapper::merge(const JointVector& active, const JointVector& full) const {
    checkFullSize(static_cast<size_t>(full.size()), "joint vector");
    if (static_cast<size_t>(active.size()) != activeIndices_.size()) {
        throw InvalidArgumentError(
            "Active joint vector has " + std::to_string(active.size()) +
            " entries, expected " + std::to_string(activeIndices_.size()));
    }

    JointVector merged = full;
    for (size_t k = 0; k < activeIndices_.size(); ++k) {
        merged[static_cast<Eigen::Index>(activeIndices_[k])] = active[static_cast<Eigen::Index>(k)];
    }
    return merged;
}

} // namespace ik
} // namespace chain_ik
