/**
 * @file Link.cpp
 * @brief Link transform implementation
 */

#include "Link.hpp"
#include <utility>

namespace chain_ik {
namespace kinematics {

const char* toString(JointType type) {
    switch (type) {
        case JointType::Revolute:  return "revolute";
        case JointType::Prismatic: return "prismatic";
        case JointType::Fixed:     return "fixed";
    }
    return "unknown";
}

Link::Link(std::string name_, JointType type_,
           const Vector3d& xyz, const Vector3d& rpy,
           const Vector3d& axis_, JointBounds bounds_)
    : name(std::move(name_)), type(type_), originXyz(xyz), originRpy(rpy),
      axis(axis_), bounds(bounds_)
{
    if (axis.norm() > EPSILON) {
        axis.normalize();
    }
}

Link Link::fixed(const std::string& name, const Vector3d& xyz, const Vector3d& rpy) {
    return Link(name, JointType::Fixed, xyz, rpy);
}

Matrix4d Link::originTransform() const {
    Matrix4d T = Matrix4d::Identity();
    T.block<3, 1>(0, 3) = originXyz;

    // Exactly zero rpy only; small rotations still count
    if (!originRpy.isZero(0.0)) {
        T.block<3, 3>(0, 0) = rpyToRotation(originRpy);
    }
    return T;
}

Matrix4d Link::transform(double q) const {
    Matrix4d T = originTransform();

    switch (type) {
        case JointType::Revolute:
            if (std::abs(q) > 1e-15) {
                Matrix4d Rj = Matrix4d::Identity();
                Rj.block<3, 3>(0, 0) = AngleAxisd(q, axis).toRotationMatrix();
                T = T * Rj;
            }
            break;
        case JointType::Prismatic: {
            Matrix4d Pj = Matrix4d::Identity();
            Pj.block<3, 1>(0, 3) = q * axis;
            T = T * Pj;
            break;
        }
        case JointType::Fixed:
            break;
    }

    return T;
}

} // namespace kinematics
} // namespace chain_ik
