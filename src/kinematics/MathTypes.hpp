/**
 * @file MathTypes.hpp
 * @brief Math types and utilities for chain kinematics
 */

#pragma once

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <cmath>
#include <limits>

namespace chain_ik {
namespace kinematics {

// ============================================================================
// Type Definitions
// ============================================================================

// Basic types
using Vector3d = Eigen::Vector3d;
using Matrix3d = Eigen::Matrix3d;
using Matrix4d = Eigen::Matrix4d;
using AngleAxisd = Eigen::AngleAxisd;

// Joint space (chains have an arbitrary number of links)
using JointVector = Eigen::VectorXd;

// ============================================================================
// Constants
// ============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double EPSILON = 1e-10;

// ============================================================================
// Utility Functions
// ============================================================================

inline double degToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

inline double radToDeg(double radians) {
    return radians * RAD_TO_DEG;
}

inline bool isNearZero(double value, double tolerance = EPSILON) {
    return std::abs(value) < tolerance;
}

/**
 * Convert RPY angles to rotation matrix
 * Convention: URDF fixed-axis XYZ, R = Rz(yaw) * Ry(pitch) * Rx(roll)
 */
inline Matrix3d rpyToRotation(const Vector3d& rpy) {
    Matrix3d R;
    R = AngleAxisd(rpy(2), Vector3d::UnitZ())
      * AngleAxisd(rpy(1), Vector3d::UnitY())
      * AngleAxisd(rpy(0), Vector3d::UnitX());
    return R;
}

/**
 * Homogeneous transform from rotation and translation
 */
inline Matrix4d makeTransform(const Matrix3d& R, const Vector3d& p) {
    Matrix4d T = Matrix4d::Identity();
    T.block<3, 3>(0, 0) = R;
    T.block<3, 1>(0, 3) = p;
    return T;
}

inline Vector3d translationOf(const Matrix4d& T) {
    return T.block<3, 1>(0, 3);
}

inline Matrix3d rotationOf(const Matrix4d& T) {
    return T.block<3, 3>(0, 0);
}

} // namespace kinematics
} // namespace chain_ik
