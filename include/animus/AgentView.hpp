/**
 * @file AgentView.hpp
 * @brief Vue en lecture seule de l'état d'un agent, passée à l'arbitre
 *        et aux états de conscience
 */

#pragma once

#include "animus/ConsciousnessMode.hpp"
#include "animus/EmotionUpdater.hpp"
#include "animus/Goals.hpp"
#include "animus/Perception.hpp"
#include "animus/PhysiologicalState.hpp"
#include "animus/ProceduralMemory.hpp"
#include "animus/SemanticMemory.hpp"
#include "animus/WorkingMemory.hpp"

namespace animus {

struct AgentView {
    const PhysiologySnapshot& body;
    const EmotionState& emotions;
    const Perception& perception;
    const GoalStore& goals;
    const ProceduralMemory& procedures;
    const SemanticMemory& knowledge;
    const WorkingMemory& working_memory;
    AttentionFocus focus = AttentionFocus::NONE;
};

} // namespace animus
