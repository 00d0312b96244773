#include "animus/TickReport.hpp"

namespace animus {

nlohmann::json TickReport::toJson() const {
    nlohmann::json j;
    j["agent_id"] = agent_id;
    j["tick"] = tick;
    j["position"] = {{"x", position.x}, {"y", position.y}};
    j["mode"] = consciousnessModeToString(mode);
    j["focus"] = attentionFocusToString(focus);
    j["requested"] = actionToString(requested);
    j["performed"] = actionToString(performed);
    j["stage"] = decisionStageToString(stage);
    j["procedure_id"] = procedure_id ? nlohmann::json(*procedure_id) : nlohmann::json(nullptr);
    j["success"] = success;
    j["reward"] = {{"raw", raw_reward}, {"shaped", shaped_reward}};
    j["physiology"] = {
        {"hunger", body.hunger},
        {"fatigue", body.fatigue},
        {"thirst", body.thirst},
        {"mood", body.mood}
    };
    j["emotions"] = {
        {"joy", emotions.joy},
        {"fear", emotions.fear},
        {"frustration", emotions.frustration},
        {"curiosity", emotions.curiosity}
    };
    j["epsilon"] = epsilon;
    return j;
}

} // namespace animus
