/**
 * @file ParameterSpaceMapper.hpp
 * @brief Conversion between full joint vectors and active (optimized) vectors
 */

#pragma once

#include "../kinematics/IKinematicChain.hpp"
#include "../common/Errors.hpp"
#include <string>
#include <vector>

namespace chain_ik {
namespace ik {

using kinematics::JointVector;

/**
 * Maps between the full joint space of a chain (one entry per link,
 * fixed links included) and the active space seen by the optimizer.
 *
 * Invariants:
 *   merge(reduce(full), full) == full
 *   reduce(merge(active, full)) == active
 */
class ParameterSpaceMapper {
public:
    explicit ParameterSpaceMapper(const kinematics::IKinematicChain& chain);
    explicit ParameterSpaceMapper(std::vector<bool> activeMask);

    size_t fullSize() const { return mask_.size(); }
    size_t activeSize() const { return activeIndices_.size(); }

    /**
     * Keep only active entries, preserving their order
     */
    JointVector reduce(const JointVector& full) const;

    /**
     * Copy of full with active entries replaced, in order, by active
     */
    JointVector merge(const JointVector& active, const JointVector& full) const;

    /**
     * Same reduction rule applied to any per-link sequence (bounds, names...)
     */
    template <typename T>
    std::vector<T> reduce(const std::vector<T>& perLink) const {
        checkFullSize(perLink.size(), "sequence");
        std::vector<T> out;
        out.reserve(activeIndices_.size());
        for (size_t idx : activeIndices_) {
            out.push_back(perLink[idx]);
        }
        return out;
    }

    const std::vector<size_t>& activeIndices() const { return activeIndices_; }

private:
    void checkFullSize(size_t size, const char* what) const;

    std::vector<bool> mask_;
    std::vector<size_t> activeIndices_;
};

} // namespace ik
} // namespace chain_ik
