/**
 * @file OrientationMode.hpp
 * @brief Orientation matching modes and the pose slices they compare
 */

#pragma once

#include "../kinematics/MathTypes.hpp"
#include <optional>
#include <string>

namespace chain_ik {
namespace ik {

using kinematics::Matrix3d;
using kinematics::Matrix4d;
using kinematics::Vector3d;

/**
 * Which part of the target rotation must be matched.
 * Fixed for the duration of a solve.
 */
enum class OrientationMode {
    None,   // position only
    X,      // rotation column 0
    Y,      // rotation column 1
    Z,      // rotation column 2
    All     // full 3x3 rotation block
};

/**
 * Parse "none" / "" / "X" / "Y" / "Z" / "all".
 * @throws InvalidArgumentError for anything else
 */
OrientationMode parseOrientationMode(const std::string& text);

const char* toString(OrientationMode mode);

/**
 * True for the five enumerators above (guards against out-of-range casts)
 */
bool isValidOrientationMode(OrientationMode mode);

/**
 * Orientation target and error metric for one mode
 *
 * | Mode    | Slice                  | Metric                  |
 * |---------|------------------------|-------------------------|
 * | X/Y/Z   | rotation column 0/1/2  | Euclidean norm          |
 * | All     | 3x3 rotation block     | Frobenius norm          |
 * | None    | -                      | 0                       |
 */
class OrientationModeSelector {
public:
    /**
     * @throws InvalidArgumentError for an unrecognized mode
     */
    OrientationModeSelector(OrientationMode mode, const Matrix4d& target);

    OrientationMode mode() const { return mode_; }
    bool enabled() const { return mode_ != OrientationMode::None; }

    /**
     * Orientation error of a computed pose against the target slice
     */
    double error(const Matrix4d& pose) const;

private:
    OrientationMode mode_;
    Matrix3d targetRotation_;
    int column_ = -1;   // -1 = whole block
};

/**
 * Build a target frame from a position and an optional orientation.
 * X/Y/Z modes: orientation is a 3-vector written into that rotation column.
 * All: orientation is a 3x3 rotation.
 * None: rotation block stays identity.
 * @throws InvalidArgumentError when the orientation shape does not match the mode
 */
Matrix4d makeTargetFrame(const Vector3d& position,
                         const std::optional<Eigen::MatrixXd>& orientation,
                         OrientationMode mode);

} // namespace ik
} // namespace chain_ik
