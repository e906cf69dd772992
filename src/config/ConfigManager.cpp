/**
 * @file ConfigManager.cpp
 * @brief Configuration manager implementation
 */

#include "ConfigManager.hpp"
#include "../logging/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace chain_ik {
namespace config {

namespace fs = std::filesystem;

namespace {

std::array<double, 3> readTriple(const YAML::Node& node, const std::array<double, 3>& fallback,
                                 const std::string& what) {
    if (!node) {
        return fallback;
    }
    if (!node.IsSequence() || node.size() != 3) {
        throw YAML::Exception(node.Mark(), what + " must be a list of 3 numbers");
    }
    return {node[0].as<double>(), node[1].as<double>(), node[2].as<double>()};
}

std::optional<double> readOptionalDouble(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return node.as<double>();
}

} // namespace

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadFromFile(const std::string& filepath) {
    try {
        if (!fs::exists(filepath)) {
            LOG_ERROR("Config file not found: {}", filepath);
            return false;
        }

        LOG_INFO("Loading config from: {}", filepath);
        return load(YAML::LoadFile(filepath), filepath);

    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error in {}: {}", filepath, e.what());
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml) {
    try {
        return load(YAML::Load(yaml), "<string>");
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: {}", e.what());
        return false;
    }
}

bool ConfigManager::load(const YAML::Node& root, const std::string& source) {
    std::lock_guard<std::mutex> lock(m_mutex);

    ChainConfig chain;
    SolverConfig solver;
    LoggingConfig logging;

    try {
        // Chain definition
        YAML::Node chainNode = root["chain"];
        if (!chainNode) {
            LOG_ERROR("Missing 'chain' section in {}", source);
            return false;
        }

        chain.name = chainNode["name"].as<std::string>("chain");

        if (!chainNode["links"] || !chainNode["links"].IsSequence()) {
            LOG_ERROR("Chain '{}' has no 'links' list", chain.name);
            return false;
        }

        for (const auto& ln : chainNode["links"]) {
            LinkConfig link;
            link.name = ln["name"].as<std::string>("link_" + std::to_string(chain.links.size()));
            link.type = ln["type"].as<std::string>("revolute");

            if (ln["origin"]) {
                link.origin_xyz = readTriple(ln["origin"]["xyz"], link.origin_xyz, link.name + ".origin.xyz");
                link.origin_rpy = readTriple(ln["origin"]["rpy"], link.origin_rpy, link.name + ".origin.rpy");
            }
            link.axis = readTriple(ln["axis"], link.axis, link.name + ".axis");

            if (ln["bounds"]) {
                link.lower = readOptionalDouble(ln["bounds"]["lower"]);
                link.upper = readOptionalDouble(ln["bounds"]["upper"]);
            }

            if (ln["active"]) {
                link.active = ln["active"].as<bool>();
            }

            if (!parseJointType(link.type)) {
                LOG_ERROR("Link '{}' has unknown type '{}'", link.name, link.type);
                return false;
            }
            if (link.lower && link.upper && *link.lower > *link.upper) {
                LOG_ERROR("Link '{}' has lower bound {} above upper bound {}",
                          link.name, *link.lower, *link.upper);
                return false;
            }

            chain.links.push_back(link);
        }

        if (!chain.isValid()) {
            LOG_ERROR("Chain '{}' has no links", chain.name);
            return false;
        }

        // Solver defaults
        if (YAML::Node s = root["solver"]) {
            solver.regularization_weight = readOptionalDouble(s["regularization_weight"]);
            if (s["max_iterations"] && !s["max_iterations"].IsNull()) {
                solver.max_iterations = s["max_iterations"].as<int>();
            }
            solver.orientation_mode = s["orientation_mode"].as<std::string>("none");
        }

        try {
            ik::parseOrientationMode(solver.orientation_mode);
        } catch (const InvalidArgumentError& e) {
            LOG_ERROR("Invalid solver section in {}: {}", source, e.what());
            return false;
        }
        if (solver.max_iterations && *solver.max_iterations < 1) {
            LOG_ERROR("solver.max_iterations must be positive, got {}", *solver.max_iterations);
            return false;
        }
        if (solver.regularization_weight && *solver.regularization_weight < 0.0) {
            LOG_ERROR("solver.regularization_weight must be non-negative, got {}",
                      *solver.regularization_weight);
            return false;
        }

        // Logging settings
        if (YAML::Node l = root["logging"]) {
            logging.level = l["level"].as<std::string>("info");
            logging.file = l["file"].as<std::string>("logs/chain_ik.log");
            logging.max_size_mb = l["max_size_mb"].as<int>(10);
            logging.max_files = l["max_files"].as<int>(5);
            logging.console_enabled = l["console_enabled"].as<bool>(true);
            logging.file_enabled = l["file_enabled"].as<bool>(true);
        }

    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid config in {}: {}", source, e.what());
        return false;
    }

    m_chain_config = chain;
    m_solver_config = solver;
    m_logging_config = logging;
    m_loaded = true;

    LOG_INFO("Config loaded: chain '{}' ({} links), orientation mode {}",
             m_chain_config.name, m_chain_config.links.size(), m_solver_config.orientation_mode);
    return true;
}

// ============================================================================
// Chain / options construction
// ============================================================================

std::optional<kinematics::JointType> ConfigManager::parseJointType(const std::string& type) {
    if (type == "revolute" || type == "continuous") return kinematics::JointType::Revolute;
    if (type == "prismatic") return kinematics::JointType::Prismatic;
    if (type == "fixed") return kinematics::JointType::Fixed;
    return std::nullopt;
}

std::shared_ptr<kinematics::Chain> ConfigManager::buildChain(const ChainConfig& config) {
    std::vector<kinematics::Link> links;
    std::vector<bool> mask;
    bool explicitMask = false;

    links.reserve(config.links.size());
    for (const auto& lc : config.links) {
        auto type = parseJointType(lc.type);
        if (!type) {
            LOG_ERROR("Link '{}' has unknown type '{}'", lc.name, lc.type);
            return nullptr;
        }

        kinematics::JointBounds bounds(lc.lower, lc.upper);
        if (lc.type == "continuous") {
            bounds = kinematics::JointBounds::unbounded();
        }

        links.emplace_back(lc.name, *type,
                           kinematics::Vector3d(lc.origin_xyz[0], lc.origin_xyz[1], lc.origin_xyz[2]),
                           kinematics::Vector3d(lc.origin_rpy[0], lc.origin_rpy[1], lc.origin_rpy[2]),
                           kinematics::Vector3d(lc.axis[0], lc.axis[1], lc.axis[2]),
                           bounds);

        explicitMask = explicitMask || lc.active.has_value();
        mask.push_back(lc.active.value_or(*type != kinematics::JointType::Fixed));
    }

    try {
        if (explicitMask) {
            return std::make_shared<kinematics::Chain>(std::move(links), mask, config.name);
        }
        return std::make_shared<kinematics::Chain>(std::move(links), std::nullopt, config.name);
    } catch (const InvalidArgumentError& e) {
        LOG_ERROR("Chain '{}' rejected: {}", config.name, e.what());
        return nullptr;
    }
}

std::shared_ptr<kinematics::Chain> ConfigManager::buildChain() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_loaded) {
        LOG_ERROR("buildChain called before a configuration was loaded");
        return nullptr;
    }
    return buildChain(m_chain_config);
}

ik::IkOptions ConfigManager::ikOptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    ik::IkOptions options;
    options.regularizationWeight = m_solver_config.regularization_weight;
    options.maxIterations = m_solver_config.max_iterations;
    // Validated on load
    options.orientationMode = ik::parseOrientationMode(m_solver_config.orientation_mode);
    return options;
}

} // namespace config
} // namespace chain_ik
