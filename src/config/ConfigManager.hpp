/**
 * @file ConfigManager.hpp
 * @brief Configuration manager - loads and provides access to configuration
 */

#pragma once

#include "ChainConfig.hpp"
#include "../ik/InverseKinematicsSolver.hpp"
#include "../kinematics/Chain.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace YAML { class Node; }

namespace chain_ik {
namespace config {

/**
 * Configuration Manager (Singleton)
 *
 * Loads a YAML document with `chain`, `solver` and `logging` sections.
 * A failed load leaves the previously loaded configuration untouched.
 * Thread-safe for reading after initialization.
 */
class ConfigManager {
public:
    /**
     * Get singleton instance
     */
    static ConfigManager& instance();

    // Delete copy/move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * Load configuration from YAML file
     * @param filepath Path to the YAML file
     * @return true if loaded successfully
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * Load configuration from YAML text
     * @return true if loaded successfully
     */
    bool loadFromString(const std::string& yaml);

    const ChainConfig& chainConfig() const { return m_chain_config; }
    const SolverConfig& solverConfig() const { return m_solver_config; }
    const LoggingConfig& loggingConfig() const { return m_logging_config; }

    /**
     * Check if configuration is loaded and valid
     */
    bool isLoaded() const { return m_loaded; }

    /**
     * Build a chain from the loaded chain definition
     * @return nullptr if nothing is loaded or the definition is rejected
     */
    std::shared_ptr<kinematics::Chain> buildChain() const;

    /**
     * Solver options from the `solver` section
     */
    ik::IkOptions ikOptions() const;

    // Usable without loading a document
    static std::optional<kinematics::JointType> parseJointType(const std::string& type);
    static std::shared_ptr<kinematics::Chain> buildChain(const ChainConfig& config);

private:
    ConfigManager() = default;
    ~ConfigManager() = default;

    bool load(const YAML::Node& root, const std::string& source);

    ChainConfig m_chain_config;
    SolverConfig m_solver_config;
    LoggingConfig m_logging_config;
    bool m_loaded = false;
    mutable std::mutex m_mutex;
};

} // namespace config
} // namespace chain_ik
