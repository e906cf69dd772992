/**
 * @file BoundsAdapter.cpp
 * @brief Bounds reduction implementation
 */

#include "BoundsAdapter.hpp"

namespace chain_ik {
namespace ik {

std::vector<JointBounds> collectBounds(const kinematics::IKinematicChain& chain) {
    std::vector<JointBounds> bounds;
    bounds.reserve(chain.size());
    for (const auto& link : chain.links()) {
        bounds.push_back(link.bounds);
    }
    return bounds;
}

std::vector<JointBounds> reduceBounds(const kinematics::IKinematicChain& chain) {
    ParameterSpaceMapper mapper(chain);
    return mapper.reduce(collectBounds(chain));
}

bool withinBounds(const JointVector& active, const std::vector<JointBounds>& bounds,
                  double tolerance) {
    if (static_cast<size_t>(active.size()) != bounds.size()) {
        return false;
    }
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (!bounds[i].contains(active[static_cast<Eigen::Index>(i)], tolerance)) {
            return false;
        }
    }
    return true;
}

} // namespace ik
} // namespace chain_ik
