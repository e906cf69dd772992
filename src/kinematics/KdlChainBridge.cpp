/**
 * @file KdlChainBridge.cpp
 * @brief Chain to KDL conversion
 */

#include "KdlChainBridge.hpp"
#include "../common/Errors.hpp"
#include "../logging/Logger.hpp"
#include <kdl/frames.hpp>
#include <kdl/jntarray.hpp>

namespace chain_ik {
namespace kinematics {

KdlChainBridge::KdlChainBridge(const Chain& chain)
    : chain_(chain)
{
    for (const auto& link : chain.links()) {
        // Origin: fixed segment carrying Trans(xyz) * RPY(rpy)
        KDL::Frame f_origin(
            KDL::Rotation::RPY(link.originRpy.x(), link.originRpy.y(), link.originRpy.z()),
            KDL::Vector(link.originXyz.x(), link.originXyz.y(), link.originXyz.z())
        );
        kdlChain_.addSegment(KDL::Segment(
            link.name + "_origin",
            KDL::Joint(link.name + "_origin_fixed", KDL::Joint::Fixed),
            f_origin
        ));

        if (link.isFixed()) {
            continue;
        }

        const KDL::Vector axis(link.axis.x(), link.axis.y(), link.axis.z());
        const auto type = link.type == JointType::Revolute ? KDL::Joint::RotAxis
                                                           : KDL::Joint::TransAxis;
        kdlChain_.addSegment(KDL::Segment(
            link.name,
            KDL::Joint(link.name, KDL::Vector::Zero(), axis, type),
            KDL::Frame::Identity()
        ));
    }

    fkSolver_ = std::make_unique<KDL::ChainFkSolverPos_recursive>(kdlChain_);

    LOG_DEBUG("KDL chain for '{}': {} segments, {} joints",
        chain.name(), kdlChain_.getNrOfSegments(), kdlChain_.getNrOfJoints());
}

Matrix4d KdlChainBridge::forwardKinematics(const JointVector& full) const {
    if (static_cast<size_t>(full.size()) != chain_.size()) {
        throw InvalidArgumentError("Expected " + std::to_string(chain_.size()) +
                                   " joint values, got " + std::to_string(full.size()));
    }

    KDL::JntArray q(kdlChain_.getNrOfJoints());
    unsigned int k = 0;
    for (size_t i = 0; i < chain_.size(); ++i) {
        if (!chain_.links()[i].isFixed()) {
            q(k++) = full[static_cast<Eigen::Index>(i)];
        }
    }

    KDL::Frame frame;
    int status = fkSolver_->JntToCart(q, frame);
    if (status < 0) {
        throw InvalidArgumentError("KDL forward kinematics failed with status " +
                                   std::to_string(status));
    }
    return toMatrix(frame);
}

Matrix4d KdlChainBridge::toMatrix(const KDL::Frame& frame) {
    Matrix4d T = Matrix4d::Identity();
    for (int r = 0; r < 3; ++r) {
        for (int c = 0; c < 3; ++c) {
            T(r, c) = frame.M(r, c);
        }
        T(r, 3) = frame.p(r);
    }
    return T;
}

} // namespace kinematics
} // namespace chain_ik
