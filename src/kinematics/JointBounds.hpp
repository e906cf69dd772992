/**
 * @file JointBounds.hpp
 * @brief Lower/upper joint limits with an explicit "no limit" state
 */

#pragma once

#include <optional>

namespace chain_ik {
namespace kinematics {

/**
 * Angle (or travel) limits of a link.
 * An empty optional means the link imposes no limit in that direction.
 */
struct JointBounds {
    std::optional<double> lower;
    std::optional<double> upper;

    JointBounds() = default;
    JointBounds(std::optional<double> lower_, std::optional<double> upper_)
        : lower(lower_), upper(upper_) {}

    static JointBounds unbounded() { return JointBounds(); }

    bool isBounded() const { return lower.has_value() || upper.has_value(); }

    bool contains(double value, double tolerance = 0.0) const {
        if (lower && value < *lower - tolerance) return false;
        if (upper && value > *upper + tolerance) return false;
        return true;
    }

    double lowerOr(double fallback) const { return lower ? *lower : fallback; }
    double upperOr(double fallback) const { return upper ? *upper : fallback; }
};

inline bool operator==(const JointBounds& a, const JointBounds& b) {
    return a.lower == b.lower && a.upper == b.upper;
}

} // namespace kinematics
} // namespace chain_ik
