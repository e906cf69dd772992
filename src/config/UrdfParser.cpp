/**
 * @file UrdfParser.cpp
 * @brief URDF/Xacro parser and chain importer implementation
 *
 * Uses simple regex-based XML extraction without external dependencies.
 */

#include "UrdfParser.hpp"
#include "../common/Errors.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <map>
#include <regex>
#include <set>
#include <sstream>

namespace chain_ik {
namespace config {

namespace {
    std::string getAttributeValue(const std::string& element, const std::string& attr) {
        // Pattern: attr\s*=\s*"([^"]*)"
        std::regex pattern("\\b" + attr + "\\s*=\\s*\"([^\"]*)\"");
        std::smatch match;
        if (std::regex_search(element, match, pattern)) {
            return match[1].str();
        }
        return "";
    }

    // Opening tag only, so nested child attributes are not picked up
    std::string openingTag(const std::string& element) {
        auto end = element.find('>');
        return end == std::string::npos ? element : element.substr(0, end + 1);
    }

    std::vector<std::string> findElements(const std::string& xml, const std::string& tag) {
        std::vector<std::string> elements;

        // <tag attr="val"/> or <tag attr="val">content</tag>
        std::regex pattern("<" + tag + "\\s[^>]*?(?:/>|>[\\s\\S]*?<\\/" + tag + ">)");

        auto begin = std::sregex_iterator(xml.begin(), xml.end(), pattern);
        auto end = std::sregex_iterator();
        for (auto it = begin; it != end; ++it) {
            elements.push_back(it->str());
        }
        return elements;
    }

    std::string findChildElement(const std::string& parent, const std::string& tag) {
        std::smatch match;

        // Self-closing with attributes - <tag attr="val"/>
        std::regex selfClosing("<" + tag + "\\s[^>]*/>");
        if (std::regex_search(parent, match, selfClosing)) {
            return match[0].str();
        }

        // With content - <tag attr="val">content</tag>
        std::regex withContent("<" + tag + "(?:\\s[^>]*)?>[\\s\\S]*?<\\/" + tag + ">");
        if (std::regex_search(parent, match, withContent)) {
            return match[0].str();
        }

        return "";
    }

    std::vector<std::string> splitWhitespace(const std::string& str) {
        std::vector<std::string> tokens;
        std::istringstream iss(str);
        std::string token;
        while (iss >> token) {
            tokens.push_back(token);
        }
        return tokens;
    }

    std::string stripPrefix(const std::string& name) {
        static const std::regex prefix_pattern("\\$\\{prefix\\}");
        return std::regex_replace(name, prefix_pattern, "");
    }
}

const UrdfJoint* UrdfModel::findJoint(const std::string& jointName) const {
    auto it = std::find_if(joints.begin(), joints.end(),
                           [&](const UrdfJoint& j) { return j.name == jointName; });
    return it == joints.end() ? nullptr : &*it;
}

UrdfParseResult UrdfParser::parseFile(const std::filesystem::path& filepath) {
    UrdfParseResult result;

    if (!std::filesystem::exists(filepath)) {
        result.error = "File not found: " + filepath.string();
        return result;
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        result.error = "Cannot open file: " + filepath.string();
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("Parsing URDF file: {}", filepath.string());
    return parseString(buffer.str());
}

UrdfParseResult UrdfParser::parseString(const std::string& xml_content) {
    UrdfParseResult result;

    try {
        std::string robot = findChildElement(xml_content, "robot");
        if (robot.empty()) {
            result.error = "No <robot> element found";
            return result;
        }
        result.model.name = getAttributeValue(openingTag(robot), "name");

        // Links
        for (const auto& link_xml : findElements(robot, "link")) {
            std::string name = stripPrefix(getAttributeValue(openingTag(link_xml), "name"));
            if (!name.empty()) {
                result.model.links.push_back(name);
            }
        }

        // Joints
        for (const auto& joint_xml : findElements(robot, "joint")) {
            const std::string tag = openingTag(joint_xml);

            UrdfJoint joint;
            joint.name = stripPrefix(getAttributeValue(tag, "name"));
            joint.type = getAttributeValue(tag, "type");

            std::string parent = findChildElement(joint_xml, "parent");
            std::string child = findChildElement(joint_xml, "child");
            joint.parent_link = stripPrefix(getAttributeValue(parent, "link"));
            joint.child_link = stripPrefix(getAttributeValue(child, "link"));

            // <transmission> blocks also contain <joint name="..."> references
            if (joint.name.empty() || joint.type.empty() ||
                joint.parent_link.empty() || joint.child_link.empty()) {
                continue;
            }

            std::string origin = findChildElement(joint_xml, "origin");
            if (!origin.empty()) {
                parseOrigin(getAttributeValue(origin, "xyz"), getAttributeValue(origin, "rpy"),
                            joint.origin_xyz, joint.origin_rpy);
            }

            std::string axis = findChildElement(joint_xml, "axis");
            if (!axis.empty()) {
                parseAxis(getAttributeValue(axis, "xyz"), joint.axis);
            }

            std::string limit = findChildElement(joint_xml, "limit");
            if (!limit.empty()) {
                std::string lower = getAttributeValue(limit, "lower");
                std::string upper = getAttributeValue(limit, "upper");
                if (!lower.empty()) joint.limit_lower = expandXacroExpression(lower);
                if (!upper.empty()) joint.limit_upper = expandXacroExpression(upper);
            }

            result.model.joints.push_back(joint);
            LOG_DEBUG("Parsed joint: {} type: {} origin: [{}, {}, {}]",
                joint.name, joint.type,
                joint.origin_xyz[0], joint.origin_xyz[1], joint.origin_xyz[2]);
        }

        result.model.base_link_name = findBaseLink(result.model);
        orderJoints(result.model);

        result.success = true;
        LOG_INFO("URDF parsing complete: {} links, {} joints, base '{}'",
            result.model.links.size(), result.model.joints.size(), result.model.base_link_name);

    } catch (const std::exception& e) {
        result.error = std::string("Parse error: ") + e.what();
        LOG_ERROR("URDF parse error: {}", e.what());
    }

    return result;
}

void UrdfParser::parseOrigin(const std::string& xyz_str, const std::string& rpy_str,
                             std::array<double, 3>& xyz, std::array<double, 3>& rpy) {
    auto xyz_tokens = splitWhitespace(xyz_str);
    if (xyz_tokens.size() >= 3) {
        xyz = {expandXacroExpression(xyz_tokens[0]), expandXacroExpression(xyz_tokens[1]),
               expandXacroExpression(xyz_tokens[2])};
    }

    auto rpy_tokens = splitWhitespace(rpy_str);
    if (rpy_tokens.size() >= 3) {
        rpy = {expandXacroExpression(rpy_tokens[0]), expandXacroExpression(rpy_tokens[1]),
               expandXacroExpression(rpy_tokens[2])};
    }
}

void UrdfParser::parseAxis(const std::string& xyz_str, std::array<double, 3>& axis) {
    auto tokens = splitWhitespace(xyz_str);
    if (tokens.size() >= 3) {
        axis = {std::stod(tokens[0]), std::stod(tokens[1]), std::stod(tokens[2])};
    }
}

double UrdfParser::expandXacroExpression(const std::string& expr) {
    // Handle ${radians(X)} pattern
    static const std::regex radians_pattern("\\$\\{radians\\(([-+\\d.eE]+)\\)\\}");
    std::smatch match;

    if (std::regex_search(expr, match, radians_pattern)) {
        return kinematics::degToRad(std::stod(match[1].str()));
    }

    size_t consumed = 0;
    double value = std::stod(expr, &consumed);
    if (consumed != expr.size()) {
        throw std::invalid_argument("Unsupported numeric expression: " + expr);
    }
    return value;
}

std::string UrdfParser::findBaseLink(const UrdfModel& model) {
    std::set<std::string> child_links;
    for (const auto& joint : model.joints) {
        child_links.insert(joint.child_link);
    }

    // First link that is not a child of any joint
    for (const auto& link : model.links) {
        if (child_links.find(link) == child_links.end()) {
            return link;
        }
    }

    if (!model.links.empty()) {
        return model.links.front();
    }
    return "base_link";
}

void UrdfParser::orderJoints(UrdfModel& model) {
    model.joint_order.clear();

    std::set<std::string> visited;
    std::string current_link = model.base_link_name;

    while (visited.insert(current_link).second) {
        auto it = std::find_if(model.joints.begin(), model.joints.end(),
                               [&](const UrdfJoint& j) { return j.parent_link == current_link; });
        if (it == model.joints.end()) {
            break;
        }
        model.joint_order.push_back(it->name);
        current_link = it->child_link;
    }
}

// ============================================================================
// Chain construction
// ============================================================================

namespace {

kinematics::Vector3d toVector(const std::array<double, 3>& a) {
    return kinematics::Vector3d(a[0], a[1], a[2]);
}

/**
 * Joints from base to tip. With no tip, follows the first child at each branch.
 * @return empty optional if the tip cannot be reached from the base
 */
std::optional<std::vector<const UrdfJoint*>> jointPath(const UrdfModel& model,
                                                       const std::string& base,
                                                       const std::optional<std::string>& tip) {
    std::vector<const UrdfJoint*> path;

    if (!tip) {
        std::set<std::string> visited;
        std::string current = base;
        while (visited.insert(current).second) {
            auto it = std::find_if(model.joints.begin(), model.joints.end(),
                                   [&](const UrdfJoint& j) { return j.parent_link == current; });
            if (it == model.joints.end()) break;
            path.push_back(&*it);
            current = it->child_link;
        }
        return path;
    }

    // Walk back from the tip
    std::map<std::string, const UrdfJoint*> parent_joint;
    for (const auto& joint : model.joints) {
        parent_joint.emplace(joint.child_link, &joint);
    }

    std::string current = *tip;
    while (current != base) {
        auto it = parent_joint.find(current);
        if (it == parent_joint.end() || path.size() > model.joints.size()) {
            return std::nullopt;
        }
        path.push_back(it->second);
        current = it->second->parent_link;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

std::shared_ptr<kinematics::Chain> buildChainFromUrdf(const UrdfModel& model,
                                                      const UrdfChainOptions& options) {
    using kinematics::JointBounds;
    using kinematics::JointType;
    using kinematics::Link;

    const std::string base = options.baseLink.value_or(model.base_link_name);

    auto path = jointPath(model, base, options.tipLink);
    if (!path) {
        LOG_ERROR("Tip link '{}' is not reachable from base link '{}'", *options.tipLink, base);
        return nullptr;
    }

    std::vector<Link> links;
    links.push_back(Link::fixed("Base link"));

    for (const UrdfJoint* joint : *path) {
        JointType type = JointType::Fixed;
        JointBounds bounds;

        if (joint->type == "revolute" || joint->type == "prismatic") {
            type = joint->type == "revolute" ? JointType::Revolute : JointType::Prismatic;
            bounds = JointBounds(joint->limit_lower, joint->limit_upper);
        } else if (joint->type == "continuous") {
            type = JointType::Revolute;
        } else if (joint->type == "fixed") {
            type = JointType::Fixed;
        } else {
            LOG_ERROR("Joint '{}' has unsupported type '{}'", joint->name, joint->type);
            return nullptr;
        }

        links.emplace_back(joint->name, type, toVector(joint->origin_xyz),
                           toVector(joint->origin_rpy), toVector(joint->axis), bounds);
    }

    if (options.lastLinkVector) {
        links.push_back(Link::fixed("last_joint", toVector(*options.lastLinkVector)));
    }

    try {
        auto chain = std::make_shared<kinematics::Chain>(std::move(links), options.activeLinksMask,
                                                         options.name);
        LOG_INFO("Built chain '{}' from URDF '{}': {} links, {} active",
                 chain->name(), model.name, chain->size(), chain->numActive());
        return chain;
    } catch (const InvalidArgumentError& e) {
        LOG_ERROR("Chain from URDF '{}' rejected: {}", model.name, e.what());
        return nullptr;
    }
}

} // namespace config
} // namespace chain_ik
