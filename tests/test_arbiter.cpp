/**
 * @file test_arbiter.cpp
 * @brief Tests de l'arbitrage : précédence, objectifs, mémoire, modificateurs
 */

#include "TestHarness.hpp"

#include "animus/Arbiter.hpp"

#include <random>
#include <variant>

using namespace animus;

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

struct Fixture {
    PhysiologySnapshot body;
    EmotionState emotions;
    Perception perception;
    GoalStore goals;
    ProceduralMemory procedures;
    SemanticMemory knowledge;
    WorkingMemory working_memory;
    std::mt19937 rng{11};

    Fixture() {
        perception.tick = 10;
        perception.position = GridPos{2, 2};
        perception.radius = 2;
        emotions.curiosity = 0.2;
    }

    void needs(double h, double f, double t) {
        body.hunger = h;
        body.fatigue = f;
        body.thirst = t;
    }

    AgentView view() const {
        return AgentView{body, emotions, perception, goals, procedures, knowledge, working_memory};
    }
};

LearnerSuggestion suggest(Action a) {
    return [a]() { return a; };
}

Goal reachGoal(const std::string& id, GridPos target, double priority = 0.9) {
    Goal g;
    g.id = id;
    g.name = id;
    g.priority = priority;
    g.kind = ReachLocationGoal{target};
    return g;
}

Goal maintainGoal(const std::string& id, Need need, double threshold, int duration, int current = 0) {
    Goal g;
    g.id = id;
    g.name = id;
    g.priority = 0.6;
    MaintainNeedLowGoal m;
    m.need = need;
    m.threshold = threshold;
    m.duration_steps = duration;
    m.current_duration = current;
    g.kind = m;
    return g;
}

template <typename Delta>
const Delta* findDelta(const Decision& d) {
    for (const auto& delta : d.goal_deltas) {
        if (const auto* typed = std::get_if<Delta>(&delta)) return typed;
    }
    return nullptr;
}

// ═══════════════════════════════════════════════════════════════════════════
// SURCHARGES CRITIQUES
// ═══════════════════════════════════════════════════════════════════════════

void test_CriticalHungerAlwaysSeeksFood() {
    Fixture f;
    f.needs(0.9, 0.95, 0.95);
    f.perception.weather = Weather::STORMY;
    seedDefaultProcedures(f.procedures);
    seedDefaultKnowledge(f.knowledge);
    seedDefaultGoals(f.goals);
    f.emotions.curiosity = 0.9;

    Arbiter arbiter;
    bool learner_called = false;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE,
                            [&]() { learner_called = true; return Action::EXPLORE; }, f.rng);
    ASSERT_EQ(d.action, Action::SEEK_FOOD);
    ASSERT_EQ(d.stage, DecisionStage::CRITICAL_OVERRIDE);
    ASSERT_FALSE(learner_called);
    ASSERT_TRUE(d.goal_deltas.empty());
}

void test_HungerDominantScenario() {
    Fixture f;
    f.needs(0.9, 0.1, 0.1);
    Arbiter arbiter;
    for (int i = 0; i < 5; ++i) {
        auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(ALL_ACTIONS[i]), f.rng);
        ASSERT_EQ(d.action, Action::SEEK_FOOD);
    }
}

void test_CriticalOrderThirstBeforeFatigue() {
    Fixture f;
    f.needs(0.1, 0.9, 0.9);
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::EXPLORE), f.rng);
    ASSERT_EQ(d.action, Action::DRINK_WATER);

    f.needs(0.1, 0.9, 0.1);
    d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::EXPLORE), f.rng);
    ASSERT_EQ(d.action, Action::REST);
    ASSERT_EQ(d.stage, DecisionStage::CRITICAL_OVERRIDE);
}

// ═══════════════════════════════════════════════════════════════════════════
// MÉMOIRE PROCÉDURALE
// ═══════════════════════════════════════════════════════════════════════════

void test_ProceduralReactiveThreshold() {
    Fixture f;
    f.needs(0.75, 0.1, 0.1);
    seedDefaultProcedures(f.procedures);
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::MOVE_UP), f.rng);
    ASSERT_EQ(d.action, Action::SEEK_FOOD);
    ASSERT_EQ(d.stage, DecisionStage::PROCEDURAL);
    ASSERT_TRUE(d.procedure_id.has_value());
    ASSERT_EQ(*d.procedure_id, std::string("proc_0"));
}

void test_ProceduralDeliberativeThreshold() {
    Fixture f;
    f.needs(0.75, 0.1, 0.1);
    seedDefaultProcedures(f.procedures);
    Arbiter arbiter;
    // Priorité 0.8 < 0.9 : la suggestion de l'apprenant est conservée
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::MOVE_UP), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_UP);
    ASSERT_EQ(d.stage, DecisionStage::LEARNER);
    ASSERT_FALSE(d.procedure_id.has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// OBJECTIFS
// ═══════════════════════════════════════════════════════════════════════════

void test_ReactiveSkipsGoals() {
    Fixture f;
    f.goals.add(reachGoal("target", GridPos{5, 5}));
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
    ASSERT_EQ(d.stage, DecisionStage::LEARNER);
}

void test_ReachLocationStepsRowsFirst() {
    Fixture f;
    f.goals.add(reachGoal("target", GridPos{5, 5}));
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_DOWN);
    ASSERT_EQ(d.stage, DecisionStage::GOAL);

    f.perception.position = GridPos{5, 1};
    d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_RIGHT);
}

void test_ReachLocationCompletesAtTarget() {
    Fixture f;
    f.goals.add(reachGoal("target", GridPos{2, 2}));
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::EXPLORE);
    const auto* done = findDelta<MarkGoalCompleted>(d);
    ASSERT_TRUE(done != nullptr);
    ASSERT_EQ(done->goal_id, std::string("target"));

    f.goals.apply(d.goal_deltas);
    ASSERT_TRUE(f.goals.find("target")->completed);
    ASSERT_TRUE(f.goals.selectBest() == nullptr);

    // L'objectif accompli n'est plus jamais poursuivi
    d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
    ASSERT_TRUE(d.goal_deltas.empty());
}

void test_ObstacleOnPathAssignedToClearPath() {
    Fixture f;
    seedDefaultGoals(f.goals, GridPos{5, 5});
    f.perception.obstacles = {GridPos{3, 2}};
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_OBJECT);
    ASSERT_TRUE(d.target.has_value());
    ASSERT_TRUE(*d.target == (GridPos{3, 2}));

    const auto* assign = findDelta<AssignObstacle>(d);
    ASSERT_TRUE(assign != nullptr);
    ASSERT_EQ(assign->goal_id, std::string("sub_goal_clear_obstacle"));

    f.goals.apply(d.goal_deltas);
    const auto& clear = std::get<ClearPathGoal>(f.goals.find("sub_goal_clear_obstacle")->kind);
    ASSERT_TRUE(clear.obstacle.has_value());
}

void test_DistantObstacleApproached() {
    Fixture f;
    f.perception.position = GridPos{0, 0};
    f.perception.radius = 5;
    seedDefaultGoals(f.goals, GridPos{5, 5});
    f.perception.obstacles = {GridPos{1, 3}};
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    // |dy| > |dx| : déplacement en colonne vers l'obstacle
    ASSERT_EQ(d.action, Action::MOVE_RIGHT);
    ASSERT_FALSE(d.target.has_value());
}

void test_ClearPathSurvivesMissedSighting() {
    Fixture f;
    seedDefaultGoals(f.goals, GridPos{5, 5});
    f.goals.apply(AssignObstacle{"sub_goal_clear_obstacle", GridPos{3, 2}});
    // Obstacle dans le champ de vision mais absent de cette perception bruitée
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_OBJECT);
    ASSERT_EQ(d.stage, DecisionStage::GOAL);
    ASSERT_TRUE(*d.target == (GridPos{3, 2}));
    ASSERT_TRUE(findDelta<MarkGoalCompleted>(d) == nullptr);
}

void test_CompletedClearPathSpawnsNewSubGoal() {
    Fixture f;
    seedDefaultGoals(f.goals, GridPos{5, 5});
    f.goals.markCompleted("sub_goal_clear_obstacle");
    f.perception.obstacles = {GridPos{2, 4}};
    Arbiter arbiter;

    // Sans redirection, le pas vers (5,5) serait MOVE_DOWN
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_RIGHT);
    ASSERT_EQ(d.stage, DecisionStage::GOAL);
    const auto* spawn = findDelta<SpawnClearPath>(d);
    ASSERT_TRUE(spawn != nullptr);
    ASSERT_EQ(spawn->parent_id, std::string("goal_reach_center"));
    ASSERT_TRUE(spawn->obstacle == (GridPos{2, 4}));

    f.goals.apply(d.goal_deltas);
    const Goal* child = f.goals.clearPathChildOf("goal_reach_center");
    ASSERT_TRUE(child != nullptr);
    ASSERT_EQ(child->id, std::string("goal_reach_center_clear_10"));
    ASSERT_GT(f.goals.effectivePriority(*child), 0.9);

    d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_RIGHT);
    ASSERT_TRUE(findDelta<SpawnClearPath>(d) == nullptr);
    ASSERT_EQ(f.goals.size(), 5u);
}

void test_MaintainNeedSuggestsSatisfyingAction() {
    Fixture f;
    f.needs(0.25, 0.1, 0.1);
    f.goals.add(maintainGoal("fed", Need::HUNGER, 0.3, 20));
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::SEEK_FOOD);
    ASSERT_EQ(d.stage, DecisionStage::GOAL);
    const auto* counter = findDelta<SetMaintainDuration>(d);
    ASSERT_TRUE(counter != nullptr);
    ASSERT_EQ(counter->duration, 1);
}

void test_MaintainNeedCompletesAfterDuration() {
    Fixture f;
    f.needs(0.05, 0.1, 0.1);
    f.goals.add(maintainGoal("fed", Need::HUNGER, 0.3, 3, 2));
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
    ASSERT_TRUE(findDelta<MarkGoalCompleted>(d) != nullptr);
    f.goals.apply(d.goal_deltas);
    ASSERT_TRUE(f.goals.find("fed")->completed);
}

void test_MaintainNeedResetsAboveThreshold() {
    Fixture f;
    f.needs(0.5, 0.1, 0.1);
    f.goals.add(maintainGoal("fed", Need::HUNGER, 0.3, 10, 4));
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    const auto* counter = findDelta<SetMaintainDuration>(d);
    ASSERT_TRUE(counter != nullptr);
    ASSERT_EQ(counter->duration, 0);
    ASSERT_EQ(d.action, Action::REST);
}

void test_UnmetPrerequisiteIneligible() {
    Fixture f;
    Goal blocked = reachGoal("blocked", GridPos{5, 5}, 1.0);
    blocked.prerequisite_ids.insert("missing");
    f.goals.add(blocked);
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
    ASSERT_EQ(d.stage, DecisionStage::LEARNER);
}

// ═══════════════════════════════════════════════════════════════════════════
// MÉMOIRE SÉMANTIQUE ET DE TRAVAIL
// ═══════════════════════════════════════════════════════════════════════════

void test_SemanticFactsPreferFood() {
    Fixture f;
    f.needs(0.7, 0.1, 0.1);
    seedDefaultKnowledge(f.knowledge);
    f.perception.food = {GridPos{2, 3}};
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::SEEK_FOOD);
    ASSERT_EQ(d.stage, DecisionStage::MEMORY);
}

void test_SemanticNeedsFacts() {
    Fixture f;
    f.needs(0.7, 0.1, 0.1);
    f.perception.food = {GridPos{2, 3}};
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
}

void test_MovementNotOverriddenByMemory() {
    Fixture f;
    f.needs(0.7, 0.1, 0.1);
    seedDefaultKnowledge(f.knowledge);
    f.perception.food = {GridPos{2, 3}};
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::MOVE_LEFT), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_LEFT);
}

void test_WorkingMemoryRecallSteers() {
    Fixture f;
    f.needs(0.7, 0.1, 0.1);
    f.working_memory.push({CellContent::FOOD, GridPos{2, 5}, 9});
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::MOVE_RIGHT);
    ASSERT_EQ(d.stage, DecisionStage::MEMORY);
}

void test_StaleWorkingMemoryIgnored() {
    Fixture f;
    f.needs(0.7, 0.1, 0.1);
    f.working_memory.push({CellContent::FOOD, GridPos{2, 5}, 5});
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
}

// ═══════════════════════════════════════════════════════════════════════════
// MODIFICATEURS
// ═══════════════════════════════════════════════════════════════════════════

void test_StormForcesRest() {
    Fixture f;
    f.perception.weather = Weather::STORMY;
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::EXPLORE), f.rng);
    ASSERT_EQ(d.action, Action::REST);
    ASSERT_EQ(d.stage, DecisionStage::ENVIRONMENT);
}

void test_RainRedirectsExplore() {
    Fixture f;
    f.perception.weather = Weather::RAINY;
    ArbiterConfig config;
    config.rain_redirect_probability = 1.0;
    Arbiter arbiter(config);
    auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::EXPLORE), f.rng);
    ASSERT_EQ(d.action, Action::REST);

    f.needs(0.1, 0.82, 0.1);
    d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::EXPLORE), f.rng);
    ASSERT_EQ(d.action, Action::SEEK_FOOD);
}

void test_CuriosityTriggersRandomMove() {
    Fixture f;
    f.emotions.curiosity = 0.9;
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::DELIBERATIVE, suggest(Action::REST), f.rng);
    ASSERT_TRUE(isMovement(d.action));
    ASSERT_EQ(d.stage, DecisionStage::ENVIRONMENT);

    d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::REST), f.rng);
    ASSERT_EQ(d.action, Action::REST);
}

void test_OtherAgentsTurnExploreIntoSeekFood() {
    Fixture f;
    f.needs(0.55, 0.1, 0.1);
    f.perception.other_agents = {GridPos{3, 3}};
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE, suggest(Action::EXPLORE), f.rng);
    ASSERT_EQ(d.action, Action::SEEK_FOOD);
}

void test_LearnerOnlyQueriedAfterOverrides() {
    Fixture f;
    int calls = 0;
    Arbiter arbiter;
    auto d = arbiter.decide(f.view(), DecisionMode::REACTIVE,
                            [&]() { ++calls; return Action::MOVE_DOWN; }, f.rng);
    ASSERT_EQ(calls, 1);
    ASSERT_EQ(d.action, Action::MOVE_DOWN);
    ASSERT_EQ(d.stage, DecisionStage::LEARNER);
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printBanner("Arbitre");

    std::cout << "\n>> Surcharges critiques\n";
    RUN_TEST(CriticalHungerAlwaysSeeksFood);
    RUN_TEST(HungerDominantScenario);
    RUN_TEST(CriticalOrderThirstBeforeFatigue);

    std::cout << "\n>> Mémoire procédurale\n";
    RUN_TEST(ProceduralReactiveThreshold);
    RUN_TEST(ProceduralDeliberativeThreshold);

    std::cout << "\n>> Objectifs\n";
    RUN_TEST(ReactiveSkipsGoals);
    RUN_TEST(ReachLocationStepsRowsFirst);
    RUN_TEST(ReachLocationCompletesAtTarget);
    RUN_TEST(ObstacleOnPathAssignedToClearPath);
    RUN_TEST(DistantObstacleApproached);
    RUN_TEST(ClearPathSurvivesMissedSighting);
    RUN_TEST(CompletedClearPathSpawnsNewSubGoal);
    RUN_TEST(MaintainNeedSuggestsSatisfyingAction);
    RUN_TEST(MaintainNeedCompletesAfterDuration);
    RUN_TEST(MaintainNeedResetsAboveThreshold);
    RUN_TEST(UnmetPrerequisiteIneligible);

    std::cout << "\n>> Mémoire\n";
    RUN_TEST(SemanticFactsPreferFood);
    RUN_TEST(SemanticNeedsFacts);
    RUN_TEST(MovementNotOverriddenByMemory);
    RUN_TEST(WorkingMemoryRecallSteers);
    RUN_TEST(StaleWorkingMemoryIgnored);

    std::cout << "\n>> Modificateurs\n";
    RUN_TEST(StormForcesRest);
    RUN_TEST(RainRedirectsExplore);
    RUN_TEST(CuriosityTriggersRandomMove);
    RUN_TEST(OtherAgentsTurnExploreIntoSeekFood);
    RUN_TEST(LearnerOnlyQueriedAfterOverrides);

    return printSummary();
}
