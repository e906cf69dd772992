/**
 * @file KinematicsService.hpp
 * @brief Thread-safe FK/IK service for one kinematic chain
 */

#pragma once

#include "InverseKinematicsSolver.hpp"
#include "../kinematics/Chain.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace chain_ik {
namespace ik {

/**
 * Kinematics Service Interface
 */
class IKinematicsService {
public:
    virtual ~IKinematicsService() = default;

    // ========================================================================
    // Forward Kinematics
    // ========================================================================

    virtual Matrix4d forwardKinematics(const JointVector& full) = 0;
    virtual std::vector<Matrix4d> forwardKinematicsAll(const JointVector& full) = 0;

    // ========================================================================
    // Inverse Kinematics
    // ========================================================================

    /**
     * Solve for a full 4x4 target frame.
     * Without an initial configuration the all-zero vector is used.
     */
    virtual IkSolution inverseKinematicsFrame(
        const Matrix4d& target,
        const std::optional<JointVector>& initial = std::nullopt) = 0;

    /**
     * Solve for a position plus an optional orientation (3-vector for X/Y/Z,
     * 3x3 rotation for All). The mode argument overrides the configured one.
     */
    virtual IkSolution inverseKinematics(
        const Vector3d& targetPosition,
        const std::optional<Eigen::MatrixXd>& targetOrientation,
        OrientationMode mode,
        const std::optional<JointVector>& initial = std::nullopt) = 0;

    // ========================================================================
    // Configuration / Validation
    // ========================================================================

    virtual void setOptions(const IkOptions& options) = 0;
    virtual IkOptions getOptions() const = 0;
    virtual bool areJointValuesValid(const JointVector& full) = 0;
};

/**
 * Default implementation backed by a Chain and InverseKinematicsSolver
 */
class KinematicsService : public IKinematicsService {
public:
    explicit KinematicsService(std::shared_ptr<const kinematics::Chain> chain,
                               const IkOptions& options = IkOptions(),
                               std::shared_ptr<optim::IBoundedOptimizer> optimizer = nullptr);
    ~KinematicsService() override = default;

    // FK
    Matrix4d forwardKinematics(const JointVector& full) override;
    std::vector<Matrix4d> forwardKinematicsAll(const JointVector& full) override;

    // IK
    IkSolution inverseKinematicsFrame(
        const Matrix4d& target,
        const std::optional<JointVector>& initial = std::nullopt) override;
    IkSolution inverseKinematics(
        const Vector3d& targetPosition,
        const std::optional<Eigen::MatrixXd>& targetOrientation,
        OrientationMode mode,
        const std::optional<JointVector>& initial = std::nullopt) override;

    // Configuration
    void setOptions(const IkOptions& options) override;
    IkOptions getOptions() const override;
    bool areJointValuesValid(const JointVector& full) override;

    const kinematics::Chain& chain() const { return *chain_; }

private:
    IkSolution solveLocked(const Matrix4d& target, const std::optional<JointVector>& initial,
                           const IkOptions& options);

    mutable std::mutex mutex_;
    std::shared_ptr<const kinematics::Chain> chain_;
    IkOptions options_;
    InverseKinematicsSolver solver_;
};

// ============================================================================
// KinematicsService Implementation
// ============================================================================

inline KinematicsService::KinematicsService(std::shared_ptr<const kinematics::Chain> chain,
                                            const IkOptions& options,
                                            std::shared_ptr<optim::IBoundedOptimizer> optimizer)
    : chain_(std::move(chain)),
      options_(options),
      solver_(optimizer ? InverseKinematicsSolver(std::move(optimizer)) : InverseKinematicsSolver()) {
    if (!chain_) {
        throw InvalidArgumentError("KinematicsService requires a chain");
    }
}

inline Matrix4d KinematicsService::forwardKinematics(const JointVector& full) {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_->forwardKinematics(full);
}

inline std::vector<Matrix4d> KinematicsService::forwardKinematicsAll(const JointVector& full) {
    std::lock_guard<std::mutex> lock(mutex_);
    return chain_->forwardKinematicsAll(full);
}

inline IkSolution KinematicsService::solveLocked(const Matrix4d& target,
                                                 const std::optional<JointVector>& initial,
                                                 const IkOptions& options) {
    const JointVector start = initial ? *initial : chain_->zeroConfiguration();
    return solver_.solve(*chain_, target, start, options);
}

inline IkSolution KinematicsService::inverseKinematicsFrame(
    const Matrix4d& target,
    const std::optional<JointVector>& initial) {
    std::lock_guard<std::mutex> lock(mutex_);
    return solveLocked(target, initial, options_);
}

inline IkSolution KinematicsService::inverseKinematics(
    const Vector3d& targetPosition,
    const std::optional<Eigen::MatrixXd>& targetOrientation,
    OrientationMode mode,
    const std::optional<JointVector>& initial) {
    std::lock_guard<std::mutex> lock(mutex_);

    IkOptions options = options_;
    options.orientationMode = mode;

    const Matrix4d target = makeTargetFrame(targetPosition, targetOrientation, mode);
    return solveLocked(target, initial, options);
}

inline void KinematicsService::setOptions(const IkOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = options;
}

inline IkOptions KinematicsService::getOptions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return options_;
}

inline bool KinematicsService::areJointValuesValid(const JointVector& full) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<size_t>(full.size()) != chain_->size()) {
        return false;
    }
    const ParameterSpaceMapper mapper(*chain_);
    return withinBounds(mapper.reduce(full), reduceBounds(*chain_));
}

} // namespace ik
} // namespace chain_ik
