/**
 * @file KdlChainBridge.hpp
 * @brief Conversion of a Chain to an Orocos KDL chain
 *
 * Used to cross-check chain_ik forward kinematics against KDL.
 * Only built when orocos_kdl is available.
 */

#pragma once

#include "Chain.hpp"
#include <kdl/chain.hpp>
#include <kdl/chainfksolverpos_recursive.hpp>
#include <memory>

namespace chain_ik {
namespace kinematics {

class KdlChainBridge {
public:
    explicit KdlChainBridge(const Chain& chain);

    const KDL::Chain& kdlChain() const { return kdlChain_; }

    /**
     * Number of KDL joints (non-fixed links)
     */
    unsigned int numJoints() const { return kdlChain_.getNrOfJoints(); }

    /**
     * Forward kinematics through KDL
     * @param full One value per chain link (fixed links ignored)
     * @throws InvalidArgumentError on size mismatch or solver error
     */
    Matrix4d forwardKinematics(const JointVector& full) const;

    static Matrix4d toMatrix(const KDL::Frame& frame);

private:
    const Chain& chain_;
    KDL::Chain kdlChain_;
    std::unique_ptr<KDL::ChainFkSolverPos_recursive> fkSolver_;
};

} // namespace kinematics
} // namespace chain_ik
