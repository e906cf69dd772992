/**
 * @file OrientationMode.cpp
 * @brief Orientation mode selection implementation
 */

#include "OrientationMode.hpp"
#include "../common/Errors.hpp"
#include <algorithm>
#include <cctype>

namespace chain_ik {
namespace ik {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Rotation column compared in each single-axis mode
int columnFor(OrientationMode mode) {
    switch (mode) {
        case OrientationMode::X: return 0;
        case OrientationMode::Y: return 1;
        case OrientationMode::Z: return 2;
        default: return -1;
    }
}

} // namespace

OrientationMode parseOrientationMode(const std::string& text) {
    if (text.empty()) return OrientationMode::None;
    if (text == "X") return OrientationMode::X;
    if (text == "Y") return OrientationMode::Y;
    if (text == "Z") return OrientationMode::Z;

    const std::string lower = toLower(text);
    if (lower == "all") return OrientationMode::All;
    if (lower == "none") return OrientationMode::None;

    throw InvalidArgumentError("Unknown orientation mode: " + text);
}

const char* toString(OrientationMode mode) {
    switch (mode) {
        case OrientationMode::None: return "none";
        case OrientationMode::X:    return "X";
        case OrientationMode::Y:    return "Y";
        case OrientationMode::Z:    return "Z";
        case OrientationMode::All:  return "all";
    }
    return "unknown";
}

bool isValidOrientationMode(OrientationMode mode) {
    switch (mode) {
        case OrientationMode::None:
        case OrientationMode::X:
        case OrientationMode::Y:
        case OrientationMode::Z:
        case OrientationMode::All:
            return true;
    }
    return false;
}

// ============================================================================
// OrientationModeSelector
// ============================================================================

OrientationModeSelector::OrientationModeSelector(OrientationMode mode, const Matrix4d& target)
    : mode_(mode), targetRotation_(kinematics::rotationOf(target)), column_(columnFor(mode))
{
    if (!isValidOrientationMode(mode)) {
        throw InvalidArgumentError("Unknown orientation mode: " +
            std::to_string(static_cast<int>(mode)));
    }
}

double OrientationModeSelector::error(const Matrix4d& pose) const {
    if (mode_ == OrientationMode::None) {
        return 0.0;
    }

    const Matrix3d R = kinematics::rotationOf(pose);
    if (column_ >= 0) {
        return (R.col(column_) - targetRotation_.col(column_)).norm();
    }

    // Eigen's norm() on a matrix is the Frobenius norm
    return (R - targetRotation_).norm();
}

// ============================================================================
// Target frame helper
// ============================================================================

Matrix4d makeTargetFrame(const Vector3d& position,
                         const std::optional<Eigen::MatrixXd>& orientation,
                         OrientationMode mode) {
    if (!isValidOrientationMode(mode)) {
        throw InvalidArgumentError("Unknown orientation mode: " +
            std::to_string(static_cast<int>(mode)));
    }

    Matrix4d frame = Matrix4d::Identity();
    frame.block<3, 1>(0, 3) = position;

    if (mode == OrientationMode::None) {
        return frame;
    }

    if (!orientation) {
        throw InvalidArgumentError(
            std::string("Orientation mode ") + toString(mode) + " requires a target orientation");
    }

    const Eigen::MatrixXd& o = *orientation;
    if (mode == OrientationMode::All) {
        if (o.rows() != 3 || o.cols() != 3) {
            throw InvalidArgumentError("Orientation mode all expects a 3x3 rotation matrix");
        }
        frame.block<3, 3>(0, 0) = o;
    } else {
        if (o.size() != 3) {
            throw InvalidArgumentError(
                std::string("Orientation mode ") + toString(mode) + " expects a 3-vector");
        }
        frame.block<3, 1>(0, columnFor(mode)) = Eigen::Map<const Vector3d>(o.data());
    }

    return frame;
}

} // namespace ik
} // namespace chain_ik
