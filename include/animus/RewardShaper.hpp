/**
 * @file RewardShaper.hpp
 * @brief Modulation de la récompense brute par l'humeur
 *
 * Bonne humeur : gains amplifiés, pénalités atténuées.
 * Mauvaise humeur : l'inverse.
 */

#pragma once

#include "animus/AgentConfig.hpp"

namespace animus {

class RewardShaper {
public:
    explicit RewardShaper(const RewardShaperConfig& config = RewardShaperConfig{})
        : config_(config) {}

    [[nodiscard]] double shape(double raw_reward, double mood) const;

private:
    RewardShaperConfig config_;
};

} // namespace animus
