/**
 * @file Link.hpp
 * @brief Single link of a kinematic chain (URDF joint convention)
 */

#pragma once

#include "MathTypes.hpp"
#include "JointBounds.hpp"
#include <string>

namespace chain_ik {
namespace kinematics {

enum class JointType {
    Revolute,
    Prismatic,
    Fixed
};

const char* toString(JointType type);

/**
 * Link definition
 *
 * Local transform (URDF convention):
 *   T = Translation(originXyz) * RPY(originRpy) * Motion(axis, q)
 * Motion is a rotation about the axis (revolute), a translation along it
 * (prismatic), or identity (fixed).
 */
struct Link {
    std::string name;
    JointType type = JointType::Revolute;
    Vector3d originXyz = Vector3d::Zero();
    Vector3d originRpy = Vector3d::Zero();   // rad (roll, pitch, yaw)
    Vector3d axis = Vector3d::UnitZ();       // Unit vector
    JointBounds bounds;

    Link() = default;
    Link(std::string name_, JointType type_,
         const Vector3d& xyz = Vector3d::Zero(),
         const Vector3d& rpy = Vector3d::Zero(),
         const Vector3d& axis_ = Vector3d::UnitZ(),
         JointBounds bounds_ = JointBounds());

    static Link fixed(const std::string& name, const Vector3d& xyz = Vector3d::Zero(),
                      const Vector3d& rpy = Vector3d::Zero());

    bool isFixed() const { return type == JointType::Fixed; }

    /**
     * Origin transform Translation(xyz) * RPY(rpy), independent of q
     */
    Matrix4d originTransform() const;

    /**
     * Full local transform for joint value q
     */
    Matrix4d transform(double q) const;
};

} // namespace kinematics
} // namespace chain_ik
