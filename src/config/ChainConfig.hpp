/**
 * @file ChainConfig.hpp
 * @brief Configuration data structures (chain definition, solver, logging)
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace chain_ik {
namespace config {

/**
 * One link of a chain definition
 */
struct LinkConfig {
    std::string name;
    std::string type = "revolute";                  // revolute, prismatic, continuous, fixed
    std::array<double, 3> origin_xyz = {0, 0, 0};   // translation from previous frame
    std::array<double, 3> origin_rpy = {0, 0, 0};   // rad
    std::array<double, 3> axis = {0, 0, 1};
    std::optional<double> lower;                    // empty = unbounded
    std::optional<double> upper;
    std::optional<bool> active;                     // empty = active unless fixed
};

/**
 * Chain definition
 */
struct ChainConfig {
    std::string name = "chain";
    std::vector<LinkConfig> links;

    bool isValid() const { return !links.empty(); }
};

/**
 * Inverse kinematics solver defaults
 */
struct SolverConfig {
    std::optional<double> regularization_weight;
    std::optional<int> max_iterations;
    std::string orientation_mode = "none";
};

/**
 * Logging configuration
 */
struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/chain_ik.log";
    int max_size_mb = 10;
    int max_files = 5;
    bool console_enabled = true;
    bool file_enabled = true;
};

} // namespace config
} // namespace chain_ik
