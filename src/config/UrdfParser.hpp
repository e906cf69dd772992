/**
 * @file UrdfParser.hpp
 * @brief URDF parser and chain importer
 *
 * Parses URDF (or simple xacro) files to extract:
 * - Joint origins (xyz, rpy)
 * - Joint axes and types
 * - Joint limits
 * and builds a Chain from the base link to a tip link.
 *
 * Note: This is a simplified parser that handles basic xacro syntax.
 * For full xacro support, expand the xacro to URDF first.
 */

#pragma once

#include "../kinematics/Chain.hpp"
#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chain_ik {
namespace config {

/**
 * Parsed joint data from URDF (SI units: meters, radians)
 */
struct UrdfJoint {
    std::string name;
    std::string type = "revolute";  // revolute, continuous, prismatic, fixed
    std::string parent_link;
    std::string child_link;

    std::array<double, 3> origin_xyz = {0, 0, 0};
    std::array<double, 3> origin_rpy = {0, 0, 0};
    std::array<double, 3> axis = {1, 0, 0};         // URDF default axis

    std::optional<double> limit_lower;
    std::optional<double> limit_upper;
};

/**
 * Complete parsed URDF model
 */
struct UrdfModel {
    std::string name;
    std::vector<std::string> links;
    std::vector<UrdfJoint> joints;

    // Derived data
    std::string base_link_name;
    std::vector<std::string> joint_order;  // Ordered from base to tip

    const UrdfJoint* findJoint(const std::string& jointName) const;
};

/**
 * Result of URDF parsing
 */
struct UrdfParseResult {
    bool success = false;
    std::string error;
    UrdfModel model;
};

/**
 * Options for turning a URDF model into a Chain
 */
struct UrdfChainOptions {
    std::optional<std::string> baseLink;          // default: detected base link
    std::optional<std::string> tipLink;           // default: follow the first child to a leaf
    std::optional<std::array<double, 3>> lastLinkVector;  // fixed offset appended after the tip
    std::optional<std::vector<bool>> activeLinksMask;     // one entry per resulting link
    std::string name = "chain";
};

/**
 * URDF Parser class
 *
 * Usage:
 *   UrdfParser parser;
 *   auto result = parser.parseFile("/path/to/robot.urdf");
 *   if (result.success) {
 *       auto chain = buildChainFromUrdf(result.model);
 *   }
 */
class UrdfParser {
public:
    UrdfParser() = default;

    /**
     * Parse URDF file
     * @param filepath Path to .urdf or .xacro file
     * @return Parse result with model or error
     */
    UrdfParseResult parseFile(const std::filesystem::path& filepath);

    /**
     * Parse URDF from string
     * @param xml_content URDF XML content
     * @return Parse result with model or error
     */
    UrdfParseResult parseString(const std::string& xml_content);

private:
    /**
     * Parse origin element: <origin xyz="x y z" rpy="r p y"/>
     */
    void parseOrigin(const std::string& xyz_str, const std::string& rpy_str,
                     std::array<double, 3>& xyz, std::array<double, 3>& rpy);

    /**
     * Parse axis element: <axis xyz="x y z"/>
     */
    void parseAxis(const std::string& xyz_str, std::array<double, 3>& axis);

    /**
     * Expand simple xacro expressions like ${radians(180)}
     * @throws std::invalid_argument on text that is not a number
     */
    double expandXacroExpression(const std::string& expr);

    /**
     * Order joints from base to tip (first child at each branch)
     */
    void orderJoints(UrdfModel& model);

    /**
     * Find base link (link with no parent joint)
     */
    std::string findBaseLink(const UrdfModel& model);
};

/**
 * Build a chain: fixed origin link, one link per joint from base to tip,
 * optional fixed last link.
 * @return nullptr (with an error logged) if the path or a joint type is unsupported
 */
std::shared_ptr<kinematics::Chain> buildChainFromUrdf(const UrdfModel& model,
                                                      const UrdfChainOptions& options = UrdfChainOptions());

} // namespace config
} // namespace chain_ik
