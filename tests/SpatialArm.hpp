/**
 * @file SpatialArm.hpp
 * @brief Six-axis industrial arm geometry (meters) used by spatial tests
 */

#pragma once

#include "kinematics/Chain.hpp"

namespace chain_ik {
namespace test_support {

inline kinematics::Chain makeSixAxisArm() {
    using kinematics::JointBounds;
    using kinematics::JointType;
    using kinematics::Link;
    using kinematics::Vector3d;

    std::vector<Link> links = {
        Link::fixed("base_link"),
        Link("joint_1_s", JointType::Revolute, Vector3d(0, 0, 0.505), Vector3d::Zero(),
             Vector3d(0, 0, 1), JointBounds(-3.1416, 3.1416)),
        Link("joint_2_l", JointType::Revolute, Vector3d(0.150, 0, 0), Vector3d::Zero(),
             Vector3d(0, 1, 0), JointBounds(-1.8326, 2.7052)),
        Link("joint_3_u", JointType::Revolute, Vector3d(0, 0, 0.760), Vector3d::Zero(),
             Vector3d(0, -1, 0), JointBounds(-1.5009, 2.7925)),
        Link("joint_4_r", JointType::Revolute, Vector3d(0, 0, 0.200), Vector3d::Zero(),
             Vector3d(-1, 0, 0), JointBounds(-2.6180, 2.6180)),
        Link("joint_5_b", JointType::Revolute, Vector3d(1.082, 0, 0), Vector3d::Zero(),
             Vector3d(0, -1, 0), JointBounds(-2.3562, 2.3562)),
        Link("joint_6_t", JointType::Revolute, Vector3d(0, 0, 0), Vector3d::Zero(),
             Vector3d(-1, 0, 0), JointBounds(-3.6652, 3.6652)),
        Link::fixed("flange", Vector3d(0.100, 0, 0), Vector3d(0, 1.5708, 0)),
    };
    return kinematics::Chain(std::move(links), std::nullopt, "six_axis");
}

} // namespace test_support
} // namespace chain_ik
