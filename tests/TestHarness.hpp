/**
 * @file TestHarness.hpp
 * @brief Framework de test minimal partagé par les suites Animus
 */
#pragma once

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

// ═══════════════════════════════════════════════════════════════════════════
// FRAMEWORK DE TEST MINIMAL
// ═══════════════════════════════════════════════════════════════════════════

static int g_testsRun = 0;
static int g_testsPassed = 0;
static int g_testsFailed = 0;

#define RUN_TEST(name) runTest(#name, test_##name)

inline void runTest(const char* name, void (*func)()) {
    std::cout << "  - " << name << "... ";
    g_testsRun++;
    try {
        func();
        std::cout << "OK\n";
        g_testsPassed++;
    } catch (const std::exception& e) {
        std::cout << "ECHEC: " << e.what() << "\n";
        g_testsFailed++;
    }
}

#define ASSERT_TRUE(expr) \
    if (!(expr)) throw std::runtime_error("ASSERT_TRUE failed: " #expr)

#define ASSERT_FALSE(expr) \
    if (expr) throw std::runtime_error("ASSERT_FALSE failed: " #expr)

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) throw std::runtime_error("ASSERT_EQ failed: " #a " != " #b)

#define ASSERT_NE(a, b) \
    if ((a) == (b)) throw std::runtime_error("ASSERT_NE failed: " #a " == " #b)

#define ASSERT_GT(a, b) \
    if (!((a) > (b))) throw std::runtime_error("ASSERT_GT failed: " #a " <= " #b)

#define ASSERT_GE(a, b) \
    if (!((a) >= (b))) throw std::runtime_error("ASSERT_GE failed: " #a " < " #b)

#define ASSERT_LT(a, b) \
    if (!((a) < (b))) throw std::runtime_error("ASSERT_LT failed: " #a " >= " #b)

#define ASSERT_LE(a, b) \
    if (!((a) <= (b))) throw std::runtime_error("ASSERT_LE failed: " #a " > " #b)

#define ASSERT_NEAR(a, b, eps) \
    if (std::abs((a) - (b)) > (eps)) throw std::runtime_error("ASSERT_NEAR failed: " #a " ~ " #b)

#define ASSERT_THROWS(expr, exception_type)                                          \
    {                                                                                \
        bool thrown_ = false;                                                        \
        try { expr; } catch (const exception_type&) { thrown_ = true; }              \
        if (!thrown_) throw std::runtime_error("ASSERT_THROWS failed: " #expr);      \
    }

inline void printBanner(const std::string& title) {
    std::cout << "\n";
    std::cout << "+=================================================================+\n";
    std::cout << "|  TESTS UNITAIRES - " << title << "\n";
    std::cout << "+=================================================================+\n";
}

inline int printSummary() {
    std::cout << "\n";
    std::cout << "+=================================================================+\n";
    std::cout << "|                      RESUME DES TESTS                          |\n";
    std::cout << "+=================================================================+\n";
    std::cout << "  Total:   " << g_testsRun << " tests\n";
    std::cout << "  Reussis: " << g_testsPassed << "\n";
    std::cout << "  Echecs:  " << g_testsFailed << "\n";
    std::cout << "+=================================================================+\n";

    if (g_testsFailed == 0) {
        std::cout << "\n  TOUS LES TESTS PASSENT!\n\n";
        return 0;
    }
    std::cout << "\n  CERTAINS TESTS ONT ECHOUE\n\n";
    return 1;
}
