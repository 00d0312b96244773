/**
 * @file test_physiology.cpp
 * @brief Tests physiologie, émotions, modulation de récompense et types de base
 */

#include "TestHarness.hpp"

#include "animus/EmotionUpdater.hpp"
#include "animus/PhysiologicalState.hpp"
#include "animus/RewardShaper.hpp"
#include "animus/Types.hpp"

using namespace animus;

// ═══════════════════════════════════════════════════════════════════════════
// PHYSIOLOGIE
// ═══════════════════════════════════════════════════════════════════════════

void test_InitialStateIsCalm() {
    PhysiologicalState body;
    ASSERT_NEAR(body.hunger(), 0.0, 1e-12);
    ASSERT_NEAR(body.mood(), 1.0, 1e-12);
}

void test_UpdateAppliesRates() {
    PhysiologicalState body;
    body.update(1.0);
    ASSERT_NEAR(body.hunger(), 0.10, 1e-12);
    ASSERT_NEAR(body.fatigue(), 0.05, 1e-12);
    ASSERT_NEAR(body.thirst(), 0.07, 1e-12);
}

void test_NightScalesRates() {
    PhysiologicalState body;
    ASSERT_NEAR(body.timeScaleFor(TimeOfDay::NIGHT), 1.5, 1e-12);
    ASSERT_NEAR(body.timeScaleFor(TimeOfDay::DAY), 1.0, 1e-12);
    body.update(body.timeScaleFor(TimeOfDay::NIGHT));
    ASSERT_NEAR(body.hunger(), 0.15, 1e-12);
}

void test_NeedsSaturateAtOne() {
    PhysiologicalState body;
    for (int i = 0; i < 50; ++i) body.update(1.0);
    ASSERT_NEAR(body.hunger(), 1.0, 1e-12);
    ASSERT_NEAR(body.mood(), 0.0, 1e-12);
}

void test_MoodWeightedAverage() {
    PhysiologicalState body;
    body.set(0.5, 0.2, 0.4);
    // 0.4*0.5 + 0.3*0.8 + 0.3*0.6
    ASSERT_NEAR(body.mood(), 0.62, 1e-9);
}

void test_ApplyDeltaClampsAndRecomputesMood() {
    PhysiologicalState body;
    body.set(0.3, 0.0, 0.0);
    body.applyDelta(Need::HUNGER, -0.5);
    ASSERT_NEAR(body.hunger(), 0.0, 1e-12);
    body.applyDelta(Need::THIRST, 2.0);
    ASSERT_NEAR(body.thirst(), 1.0, 1e-12);
    ASSERT_NEAR(body.mood(), 0.7, 1e-9);
}

void test_SnapshotAccessors() {
    PhysiologicalState body;
    body.set(0.2, 0.9, 0.4);
    auto snap = body.snapshot();
    ASSERT_NEAR(snap.need(Need::FATIGUE), 0.9, 1e-12);
    ASSERT_NEAR(snap.maxNeed(), 0.9, 1e-12);
    ASSERT_EQ(snap.toStateVector().size(), 3u);
    ASSERT_NEAR(snap.toStateVector()[2], 0.4, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════
// ÉMOTIONS
// ═══════════════════════════════════════════════════════════════════════════

void test_FoodInSightRaisesJoy() {
    EmotionUpdater updater;
    EmotionState e;
    PhysiologySnapshot body;
    updater.update(e, body, EmotionContext{true, TimeOfDay::DAY, Weather::SUNNY});
    ASSERT_NEAR(e.joy, 0.6, 1e-12);
}

void test_HungerErodesJoy() {
    EmotionUpdater updater;
    EmotionState e;
    PhysiologySnapshot body;
    body.hunger = 0.8;
    updater.update(e, body, EmotionContext{});
    ASSERT_NEAR(e.joy, 0.46, 1e-12);
}

void test_FearRisesAtNightAndInStorms() {
    EmotionUpdater updater;
    EmotionState e;
    PhysiologySnapshot body;
    updater.update(e, body, EmotionContext{false, TimeOfDay::NIGHT, Weather::SUNNY});
    updater.update(e, body, EmotionContext{false, TimeOfDay::DAY, Weather::STORMY});
    ASSERT_NEAR(e.fear, 0.2, 1e-12);
    updater.update(e, body, EmotionContext{});
    ASSERT_NEAR(e.fear, 0.15, 1e-12);
}

void test_FrustrationAndCuriosity() {
    EmotionUpdater updater;
    EmotionState e;
    PhysiologySnapshot body;
    body.hunger = 0.9;
    body.fatigue = 0.6;
    body.thirst = 0.3;
    updater.update(e, body, EmotionContext{});
    ASSERT_NEAR(e.frustration, 0.36, 1e-9);
    ASSERT_NEAR(e.curiosity, 0.2, 1e-12);

    updater.update(e, PhysiologySnapshot{}, EmotionContext{});
    ASSERT_NEAR(e.curiosity, 0.8, 1e-12);
    ASSERT_NEAR(e.salience(), 0.8, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════
// MODULATION DE RÉCOMPENSE
// ═══════════════════════════════════════════════════════════════════════════

void test_GoodMoodAmplifiesGains() {
    RewardShaper shaper;
    ASSERT_NEAR(shaper.shape(1.0, 0.9), 1.2, 1e-12);
    ASSERT_NEAR(shaper.shape(-1.0, 0.9), -0.8, 1e-12);
}

void test_BadMoodAmplifiesLosses() {
    RewardShaper shaper;
    ASSERT_NEAR(shaper.shape(1.0, 0.1), 0.7, 1e-12);
    ASSERT_NEAR(shaper.shape(-1.0, 0.1), -1.3, 1e-12);
}

void test_NeutralMoodUnchanged() {
    RewardShaper shaper;
    ASSERT_NEAR(shaper.shape(0.5, 0.5), 0.5, 1e-12);
    ASSERT_NEAR(shaper.shape(0.5, 0.7), 0.5, 1e-12);
    ASSERT_NEAR(shaper.shape(0.0, 0.9), 0.0, 1e-12);
}

// ═══════════════════════════════════════════════════════════════════════════
// TYPES
// ═══════════════════════════════════════════════════════════════════════════

void test_ActionNamesRoundTrip() {
    for (Action a : ALL_ACTIONS) {
        auto parsed = actionFromString(actionToString(a));
        ASSERT_TRUE(parsed.has_value());
        ASSERT_TRUE(*parsed == a);
    }
    ASSERT_FALSE(actionFromString("fly").has_value());
    ASSERT_EQ(std::string(actionToString(Action::DRINK_WATER)), std::string("drink_water"));
}

void test_MovementGeometry() {
    GridPos p{3, 3};
    ASSERT_TRUE(applyMove(p, Action::MOVE_UP) == (GridPos{2, 3}));
    ASSERT_TRUE(applyMove(p, Action::MOVE_RIGHT) == (GridPos{3, 4}));
    ASSERT_TRUE(applyMove(p, Action::REST) == p);
    ASSERT_TRUE(isMovement(Action::MOVE_LEFT));
    ASSERT_FALSE(isMovement(Action::MOVE_OBJECT));
}

void test_StepTowardRowsFirst() {
    ASSERT_TRUE(stepToward({0, 0}, {2, 5}) == Action::MOVE_DOWN);
    ASSERT_TRUE(stepToward({2, 0}, {2, 5}) == Action::MOVE_RIGHT);
    ASSERT_TRUE(stepToward({2, 5}, {2, 5}) == Action::EXPLORE);
    ASSERT_TRUE(stepAlongMajorAxis({0, 0}, {1, 4}) == Action::MOVE_RIGHT);
    ASSERT_TRUE(stepAlongMajorAxis({3, 0}, {0, 1}) == Action::MOVE_UP);
    ASSERT_TRUE(stepAlongMajorAxis({0, 0}, {2, 2}) == Action::MOVE_RIGHT);
}

void test_Distances() {
    ASSERT_EQ(manhattan({0, 0}, {2, 3}), 5);
    ASSERT_EQ(chebyshev({0, 0}, {2, 3}), 3);
    ASSERT_NEAR(clamp01(-0.2), 0.0, 1e-12);
    ASSERT_NEAR(clamp01(1.7), 1.0, 1e-12);
}

void test_NeedNames() {
    ASSERT_TRUE(needFromString("thirst") == Need::THIRST);
    ASSERT_FALSE(needFromString("boredom").has_value());
    ASSERT_EQ(std::string(needToString(Need::FATIGUE)), std::string("fatigue"));
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printBanner("Physiologie et émotions");

    std::cout << "\n>> Physiologie\n";
    RUN_TEST(InitialStateIsCalm);
    RUN_TEST(UpdateAppliesRates);
    RUN_TEST(NightScalesRates);
    RUN_TEST(NeedsSaturateAtOne);
    RUN_TEST(MoodWeightedAverage);
    RUN_TEST(ApplyDeltaClampsAndRecomputesMood);
    RUN_TEST(SnapshotAccessors);

    std::cout << "\n>> Émotions\n";
    RUN_TEST(FoodInSightRaisesJoy);
    RUN_TEST(HungerErodesJoy);
    RUN_TEST(FearRisesAtNightAndInStorms);
    RUN_TEST(FrustrationAndCuriosity);

    std::cout << "\n>> Récompense\n";
    RUN_TEST(GoodMoodAmplifiesGains);
    RUN_TEST(BadMoodAmplifiesLosses);
    RUN_TEST(NeutralMoodUnchanged);

    std::cout << "\n>> Types\n";
    RUN_TEST(ActionNamesRoundTrip);
    RUN_TEST(MovementGeometry);
    RUN_TEST(StepTowardRowsFirst);
    RUN_TEST(Distances);
    RUN_TEST(NeedNames);

    return printSummary();
}
