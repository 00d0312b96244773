/**
 * @file test_learner.cpp
 * @brief Tests de l'apprenant DQN : réseau, replay buffer, ε, cible, persistance
 */

#include "TestHarness.hpp"

#include "animus/QNetwork.hpp"
#include "animus/ReplayBuffer.hpp"
#include "animus/ValueLearner.hpp"

#include <cstdio>
#include <fstream>
#include <random>
#include <set>

using namespace animus;

// ═══════════════════════════════════════════════════════════════════════════
// HELPERS
// ═══════════════════════════════════════════════════════════════════════════

LearnerConfig smallConfig() {
    LearnerConfig c;
    c.hidden_sizes = {8, 8};
    c.batch_size = 4;
    c.buffer_capacity = 50;
    c.target_sync_interval = 5;
    c.seed = 1234;
    return c;
}

StateVector state(double h, double f, double t) {
    return StateVector::fromNeeds(h, f, t);
}

Transition transition(double reward) {
    return Transition{state(0.1, 0.2, 0.3), Action::REST, reward, state(0.2, 0.1, 0.3), false};
}

std::string tempPath(const std::string& name) {
    return "animus_test_" + name + ".cbor";
}

// ═══════════════════════════════════════════════════════════════════════════
// RÉSEAU
// ═══════════════════════════════════════════════════════════════════════════

void test_NetworkOutputWidth() {
    std::mt19937 rng(1);
    QNetwork net(3, {64, 128}, ACTION_COUNT, rng);
    auto q = net.predict(state(0.5, 0.5, 0.5));
    ASSERT_EQ(static_cast<std::size_t>(q.size()), ACTION_COUNT);
    ASSERT_EQ(net.layers().size(), 3u);
    ASSERT_EQ(net.layers()[0].weights.rows(), 64);
    ASSERT_EQ(net.layers()[0].weights.cols(), 3);
}

void test_NetworkInitBounds() {
    std::mt19937 rng(2);
    QNetwork net(3, {16}, ACTION_COUNT, rng);
    const double bound = 1.0 / std::sqrt(3.0);
    ASSERT_LE(net.layers()[0].weights.cwiseAbs().maxCoeff(), bound);
    ASSERT_LE(net.layers()[1].weights.cwiseAbs().maxCoeff(), 1.0 / std::sqrt(16.0));
}

void test_NetworkRejectsWrongWidth() {
    std::mt19937 rng(3);
    QNetwork net(3, {4}, ACTION_COUNT, rng);
    StateVector wide(std::vector<double>{0.1, 0.2, 0.3, 0.4});
    ASSERT_THROWS(net.predict(wide), std::invalid_argument);
}

void test_TrainStepReducesLoss() {
    std::mt19937 rng(4);
    QNetwork net(3, {16}, ACTION_COUNT, rng);
    AdamOptimizer adam(0.01);
    adam.reset(net.layers());

    Eigen::MatrixXd inputs(3, 2);
    inputs << 0.1, 0.9,
              0.2, 0.8,
              0.3, 0.7;
    std::vector<std::size_t> actions = {0, 2};
    Eigen::VectorXd targets(2);
    targets << 1.0, -1.0;

    double first = net.trainStep(inputs, actions, targets, adam);
    double last = first;
    for (int i = 0; i < 200; ++i) {
        last = net.trainStep(inputs, actions, targets, adam);
    }
    ASSERT_LT(last, first);
    ASSERT_EQ(adam.stepCount(), 201);
}

void test_CopyWeights() {
    std::mt19937 rng(5);
    QNetwork a(3, {8}, ACTION_COUNT, rng);
    QNetwork b(3, {8}, ACTION_COUNT, rng);
    ASSERT_FALSE(a.sameWeights(b));
    b.copyWeightsFrom(a);
    ASSERT_TRUE(a.sameWeights(b));

    QNetwork c(3, {4}, ACTION_COUNT, rng);
    ASSERT_FALSE(a.sameArchitecture(c));
    ASSERT_THROWS(c.copyWeightsFrom(a), std::invalid_argument);
}

void test_JsonRoundTripKeepsPredictions() {
    std::mt19937 rng(6);
    QNetwork net(3, {8, 4}, ACTION_COUNT, rng);
    QNetwork copy = QNetwork::fromJson(net.toJson());
    ASSERT_TRUE(copy.sameWeights(net));
    auto s = state(0.3, 0.6, 0.9);
    ASSERT_NEAR((copy.predict(s) - net.predict(s)).cwiseAbs().maxCoeff(), 0.0, 1e-12);
}

void test_FromJsonMissingKey() {
    std::mt19937 rng(7);
    QNetwork net(3, {4}, ACTION_COUNT, rng);
    auto j = net.toJson();
    j.erase("layers");
    ASSERT_THROWS(QNetwork::fromJson(j), std::runtime_error);
}

// ═══════════════════════════════════════════════════════════════════════════
// REPLAY BUFFER
// ═══════════════════════════════════════════════════════════════════════════

void test_BufferZeroCapacity() {
    ASSERT_THROWS(ReplayBuffer(0), std::invalid_argument);
}

void test_BufferNeverExceedsCapacity() {
    ReplayBuffer buffer(3);
    for (int i = 0; i < 10; ++i) {
        buffer.push(transition(i));
        ASSERT_LE(buffer.size(), buffer.capacity());
    }
    ASSERT_EQ(buffer.size(), 3u);
}

void test_BufferFifoEviction() {
    ReplayBuffer buffer(3);
    for (int i = 0; i < 5; ++i) buffer.push(transition(i));
    ASSERT_NEAR(buffer.at(0).reward, 2.0, 1e-12);
    ASSERT_NEAR(buffer.at(1).reward, 3.0, 1e-12);
    ASSERT_NEAR(buffer.at(2).reward, 4.0, 1e-12);
}

void test_BufferSampleWithoutReplacement() {
    ReplayBuffer buffer(20);
    for (int i = 0; i < 20; ++i) buffer.push(transition(i));
    std::mt19937 rng(8);
    auto batch = buffer.sample(20, rng);
    std::set<double> rewards;
    for (const auto& t : batch) rewards.insert(t.reward);
    ASSERT_EQ(rewards.size(), 20u);
    ASSERT_THROWS(buffer.sample(21, rng), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// APPRENANT
// ═══════════════════════════════════════════════════════════════════════════

void test_InvalidConfigRejected() {
    LearnerConfig c = smallConfig();
    c.batch_size = 0;
    ASSERT_THROWS(ValueLearner{c}, std::invalid_argument);
    c = smallConfig();
    c.buffer_capacity = 0;
    ASSERT_THROWS(ValueLearner{c}, std::invalid_argument);
}

void test_EpsilonMonotoneWithFloor() {
    LearnerConfig c = smallConfig();
    c.epsilon_decay = 0.5;
    c.epsilon_min = 0.05;
    ValueLearner learner(c);
    learner.setQuietMode(true);

    double previous = learner.getEpsilon();
    for (int i = 0; i < 30; ++i) {
        learner.update(state(0.1, 0.1, 0.1), Action::REST, 0.1, state(0.1, 0.1, 0.1));
        ASSERT_LE(learner.getEpsilon(), previous);
        ASSERT_GE(learner.getEpsilon(), c.epsilon_min);
        previous = learner.getEpsilon();
    }
    ASSERT_NEAR(learner.getEpsilon(), c.epsilon_min, 1e-12);
}

void test_SmallBufferSkipsTraining() {
    ValueLearner learner(smallConfig());
    learner.setQuietMode(true);
    for (int i = 0; i < 3; ++i) {
        learner.update(state(0.2, 0.2, 0.2), Action::EXPLORE, -0.05, state(0.25, 0.25, 0.25));
    }
    ASSERT_EQ(learner.getStats().gradient_steps, 0u);
    ASSERT_EQ(learner.replayBuffer().size(), 3u);

    learner.update(state(0.2, 0.2, 0.2), Action::EXPLORE, -0.05, state(0.25, 0.25, 0.25));
    ASSERT_EQ(learner.getStats().gradient_steps, 1u);
}

void test_TargetSyncEveryInterval() {
    ValueLearner learner(smallConfig());
    learner.setQuietMode(true);
    ASSERT_TRUE(learner.targetNetwork().sameWeights(learner.policyNetwork()));

    for (int i = 1; i <= 10; ++i) {
        learner.update(state(0.1 * (i % 5), 0.3, 0.5), ALL_ACTIONS[i % ACTION_COUNT], 0.2,
                       state(0.1, 0.3, 0.5));
        if (i % 5 == 0) {
            ASSERT_TRUE(learner.targetNetwork().sameWeights(learner.policyNetwork()));
        } else if (i > 5) {
            // Entre deux synchronisations, la politique s'entraîne et diverge de la cible
            ASSERT_FALSE(learner.targetNetwork().sameWeights(learner.policyNetwork()));
        }
    }
    ASSERT_EQ(learner.getStats().target_syncs, 2u);
}

void test_TargetFrozenBetweenSyncs() {
    ValueLearner learner(smallConfig());
    learner.setQuietMode(true);
    auto train = [&](int i) {
        learner.update(state(0.1 * (i % 5), 0.4, 0.6), ALL_ACTIONS[i % ACTION_COUNT], 0.3,
                       state(0.2, 0.4, 0.6));
    };

    for (int i = 1; i <= 5; ++i) train(i);
    ASSERT_EQ(learner.getStats().target_syncs, 1u);
    const QNetwork frozen = learner.targetNetwork();

    // Quatre mises à jour avec descente de gradient : la cible ne bouge pas
    for (int i = 6; i <= 9; ++i) {
        train(i);
        ASSERT_TRUE(learner.targetNetwork().sameWeights(frozen));
    }
    ASSERT_FALSE(learner.policyNetwork().sameWeights(frozen));

    train(10);
    ASSERT_FALSE(learner.targetNetwork().sameWeights(frozen));
    ASSERT_TRUE(learner.targetNetwork().sameWeights(learner.policyNetwork()));
}

void test_GreedySelectionWithZeroEpsilon() {
    ValueLearner learner(smallConfig());
    learner.setEpsilon(0.0);
    auto s = state(0.4, 0.5, 0.6);
    Action greedy = learner.greedyAction(s);
    for (int i = 0; i < 10; ++i) {
        ASSERT_EQ(learner.selectAction(s), greedy);
    }
}

void test_SaveLoadIdenticalSelection() {
    const std::string path = tempPath("save_load");
    LearnerConfig c = smallConfig();
    ValueLearner trained(c);
    trained.setQuietMode(true);
    for (int i = 0; i < 20; ++i) {
        trained.update(state(0.05 * i, 0.5, 0.2), ALL_ACTIONS[i % ACTION_COUNT], 0.1 * (i % 3),
                       state(0.05 * i, 0.55, 0.25));
    }
    ASSERT_TRUE(trained.save(path));

    c.seed = 999;
    ValueLearner fresh(c);
    fresh.setQuietMode(true);
    ASSERT_TRUE(fresh.load(path));
    ASSERT_TRUE(fresh.policyNetwork().sameWeights(trained.policyNetwork()));
    ASSERT_TRUE(fresh.targetNetwork().sameWeights(fresh.policyNetwork()));

    trained.setEpsilon(0.0);
    fresh.setEpsilon(0.0);
    for (int i = 0; i <= 10; ++i) {
        auto s = state(0.1 * i, 1.0 - 0.1 * i, 0.5);
        ASSERT_EQ(fresh.selectAction(s), trained.selectAction(s));
    }
    std::remove(path.c_str());
}

void test_LoadMissingFileFallsBack() {
    ValueLearner learner(smallConfig());
    learner.setQuietMode(true);
    ASSERT_FALSE(learner.load(tempPath("does_not_exist")));
    ASSERT_TRUE(learner.targetNetwork().sameWeights(learner.policyNetwork()));
    ASSERT_EQ(static_cast<std::size_t>(learner.qValues(state(0.1, 0.1, 0.1)).size()), ACTION_COUNT);
}

void test_LoadCorruptFileFallsBack() {
    const std::string path = tempPath("corrupt");
    {
        std::ofstream out(path, std::ios::binary);
        out << "pas un modèle";
    }
    ValueLearner learner(smallConfig());
    learner.setQuietMode(true);
    ASSERT_FALSE(learner.load(path));
    ASSERT_TRUE(learner.targetNetwork().sameWeights(learner.policyNetwork()));
    std::remove(path.c_str());
}

void test_LoadArchitectureMismatch() {
    const std::string path = tempPath("mismatch");
    LearnerConfig other = smallConfig();
    other.hidden_sizes = {4};
    ValueLearner small(other);
    small.setQuietMode(true);
    ASSERT_TRUE(small.save(path));

    ValueLearner learner(smallConfig());
    learner.setQuietMode(true);
    ASSERT_FALSE(learner.load(path));
    ASSERT_EQ(learner.policyNetwork().hiddenSizes().size(), 2u);
    std::remove(path.c_str());
}

// ═══════════════════════════════════════════════════════════════════════════
// MAIN
// ═══════════════════════════════════════════════════════════════════════════

int main() {
    printBanner("Apprenant DQN");

    std::cout << "\n>> Réseau\n";
    RUN_TEST(NetworkOutputWidth);
    RUN_TEST(NetworkInitBounds);
    RUN_TEST(NetworkRejectsWrongWidth);
    RUN_TEST(TrainStepReducesLoss);
    RUN_TEST(CopyWeights);
    RUN_TEST(JsonRoundTripKeepsPredictions);
    RUN_TEST(FromJsonMissingKey);

    std::cout << "\n>> Replay buffer\n";
    RUN_TEST(BufferZeroCapacity);
    RUN_TEST(BufferNeverExceedsCapacity);
    RUN_TEST(BufferFifoEviction);
    RUN_TEST(BufferSampleWithoutReplacement);

    std::cout << "\n>> Apprenant\n";
    RUN_TEST(InvalidConfigRejected);
    RUN_TEST(EpsilonMonotoneWithFloor);
    RUN_TEST(SmallBufferSkipsTraining);
    RUN_TEST(TargetSyncEveryInterval);
    RUN_TEST(TargetFrozenBetweenSyncs);
    RUN_TEST(GreedySelectionWithZeroEpsilon);

    std::cout << "\n>> Persistance\n";
    RUN_TEST(SaveLoadIdenticalSelection);
    RUN_TEST(LoadMissingFileFallsBack);
    RUN_TEST(LoadCorruptFileFallsBack);
    RUN_TEST(LoadArchitectureMismatch);

    return printSummary();
}
