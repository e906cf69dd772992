/**
 * @file Errors.hpp
 * @brief Exception types raised by the kinematics and IK layers
 */

#pragma once

#include <stdexcept>
#include <string>

namespace chain_ik {

/**
 * Caller supplied an argument the solver cannot work with
 * (missing start configuration, unknown orientation mode, size mismatch...).
 * Always raised before any optimizer work is done.
 */
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * The bounded optimizer itself failed (malformed bounds, non-finite objective).
 * Non-convergence is not reported through this type.
 */
class OptimizationFailure : public std::runtime_error {
public:
    explicit OptimizationFailure(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace chain_ik
