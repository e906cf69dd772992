/**
 * @file test_ceres_bounded_optimizer.cpp
 * @brief Tests for the Ceres-backed bounded optimizer
 */

#include <gtest/gtest.h>
#include "optim/CeresBoundedOptimizer.hpp"
#include "common/Errors.hpp"
#include <cmath>
#include <limits>

using namespace chain_ik::optim;
using chain_ik::OptimizationFailure;
using chain_ik::kinematics::JointBounds;

class CeresBoundedOptimizerTest : public ::testing::Test {
protected:
    static Vector vec(std::initializer_list<double> values) {
        Vector v(static_cast<Eigen::Index>(values.size()));
        Eigen::Index i = 0;
        for (double x : values) v[i++] = x;
        return v;
    }

    static Bounds unbounded(size_t n) {
        return Bounds(n, JointBounds::unbounded());
    }

    static double rosenbrock(const Vector& x) {
        const double a = 1.0 - x[0];
        const double b = x[1] - x[0] * x[0];
        return a * a + 100.0 * b * b;
    }

    CeresBoundedOptimizer optimizer_;
};

// ============================================================================
// Unconstrained problems
// ============================================================================

TEST_F(CeresBoundedOptimizerTest, SeparableQuadratic) {
    auto f = [](const Vector& x) {
        return (x[0] - 1.0) * (x[0] - 1.0) + 10.0 * (x[1] + 2.0) * (x[1] + 2.0);
    };

    auto result = optimizer_.minimize(f, vec({0.0, 0.0}), unbounded(2), OptimizerOptions());

    EXPECT_NEAR(result.solution[0], 1.0, 1e-4);
    EXPECT_NEAR(result.solution[1], -2.0, 1e-4);
    EXPECT_LT(result.objectiveValue, 1e-7);
    EXPECT_GT(result.iterations, 0);
    EXPECT_GT(result.evaluations, result.iterations);
}

TEST_F(CeresBoundedOptimizerTest, CoupledQuadratic) {
    auto f = [](const Vector& x) {
        const double u = x[0] + x[1] - 1.0;
        const double v = x[0] - x[1] + 3.0;
        return u * u + 2.0 * v * v;
    };

    auto result = optimizer_.minimize(f, vec({4.0, 4.0}), unbounded(2), OptimizerOptions());

    EXPECT_NEAR(result.solution[0], -1.0, 1e-4);
    EXPECT_NEAR(result.solution[1], 2.0, 1e-4);
}

TEST_F(CeresBoundedOptimizerTest, StartAtMinimumStopsImmediately) {
    auto f = [](const Vector& x) { return x.squaredNorm(); };
    auto result = optimizer_.minimize(f, vec({0.0, 0.0, 0.0}), unbounded(3), OptimizerOptions());
    EXPECT_EQ(result.iterations, 0);
    EXPECT_TRUE(result.solution.isZero());
    EXPECT_DOUBLE_EQ(result.objectiveValue, 0.0);
}

TEST_F(CeresBoundedOptimizerTest, EmptyProblem) {
    int calls = 0;
    auto f = [&calls](const Vector&) { ++calls; return 4.0; };
    auto result = optimizer_.minimize(f, Vector(), Bounds(), OptimizerOptions());
    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.solution.size(), 0);
    EXPECT_DOUBLE_EQ(result.objectiveValue, 4.0);
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// Bounds
// ============================================================================

TEST_F(CeresBoundedOptimizerTest, ActiveUpperBound) {
    auto f = [](const Vector& x) { return (x[0] - 3.0) * (x[0] - 3.0); };
    Bounds bounds = {JointBounds(0.0, 1.0)};

    auto result = optimizer_.minimize(f, vec({0.0}), bounds, OptimizerOptions());

    EXPECT_LE(result.solution[0], 1.0);
    EXPECT_NEAR(result.solution[0], 1.0, 1e-6);
    EXPECT_NEAR(result.objectiveValue, 4.0, 1e-5);
}

TEST_F(CeresBoundedOptimizerTest, OneSidedBoundKeepsOtherSideOpen) {
    auto f = [](const Vector& x) {
        return (x[0] + 5.0) * (x[0] + 5.0) + (x[1] + 5.0) * (x[1] + 5.0);
    };
    Bounds bounds = {JointBounds(0.0, std::nullopt), JointBounds(std::nullopt, 10.0)};

    auto result = optimizer_.minimize(f, vec({2.0, 2.0}), bounds, OptimizerOptions());

    EXPECT_GE(result.solution[0], 0.0);
    EXPECT_NEAR(result.solution[0], 0.0, 1e-6);
    EXPECT_NEAR(result.solution[1], -5.0, 1e-3);
}

TEST_F(CeresBoundedOptimizerTest, InitialGuessOutsideBoxIsProjected) {
    double first = std::numeric_limits<double>::quiet_NaN();
    auto f = [&first](const Vector& x) {
        if (std::isnan(first)) first = x[0];
        return x[0] * x[0];
    };
    Bounds bounds = {JointBounds(1.0, 2.0)};

    auto result = optimizer_.minimize(f, vec({5.0}), bounds, OptimizerOptions());

    EXPECT_DOUBLE_EQ(first, 2.0);
    EXPECT_GE(result.solution[0], 1.0);
    EXPECT_NEAR(result.solution[0], 1.0, 1e-6);
}

TEST_F(CeresBoundedOptimizerTest, EqualBoundsPinVariable) {
    auto f = [](const Vector& x) { return (x[0] - 4.0) * (x[0] - 4.0) + (x[1] - 1.0) * (x[1] - 1.0); };
    Bounds bounds = {JointBounds(0.5, 0.5), JointBounds::unbounded()};

    auto result = optimizer_.minimize(f, vec({0.0, 0.0}), bounds, OptimizerOptions());

    EXPECT_DOUBLE_EQ(result.solution[0], 0.5);
    EXPECT_NEAR(result.solution[1], 1.0, 1e-4);
}

TEST_F(CeresBoundedOptimizerTest, AllVariablesPinnedSkipsSolve) {
    int calls = 0;
    auto f = [&calls](const Vector& x) { ++calls; return x.sum(); };
    Bounds bounds = {JointBounds(1.0, 1.0), JointBounds(-2.0, -2.0)};

    auto result = optimizer_.minimize(f, vec({0.0, 0.0}), bounds, OptimizerOptions());

    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_EQ(calls, 1);
    EXPECT_DOUBLE_EQ(result.solution[0], 1.0);
    EXPECT_DOUBLE_EQ(result.solution[1], -2.0);
    EXPECT_DOUBLE_EQ(result.objectiveValue, -1.0);
}

TEST_F(CeresBoundedOptimizerTest, SolutionStaysInsideBox) {
    auto f = [](const Vector& x) { return rosenbrock(x); };
    Bounds bounds = {JointBounds(-2.0, 0.5), JointBounds(-1.0, 0.2)};

    auto result = optimizer_.minimize(f, vec({-1.2, 0.1}), bounds, OptimizerOptions());

    EXPECT_GE(result.solution[0], -2.0);
    EXPECT_LE(result.solution[0], 0.5);
    EXPECT_GE(result.solution[1], -1.0);
    EXPECT_LE(result.solution[1], 0.2);
    EXPECT_LT(result.objectiveValue, rosenbrock(vec({-1.2, 0.1})));
}

// ============================================================================
// Iteration limit
// ============================================================================

TEST_F(CeresBoundedOptimizerTest, MaxIterationsCapsWork) {
    auto f = [](const Vector& x) { return rosenbrock(x); };
    OptimizerOptions options;
    options.maxIterations = 1;

    auto result = optimizer_.minimize(f, vec({-1.2, 1.0}), unbounded(2), options);

    EXPECT_LE(result.iterations, 1);
    EXPECT_FALSE(result.converged);
    EXPECT_LE(result.objectiveValue, rosenbrock(vec({-1.2, 1.0})));
}

TEST_F(CeresBoundedOptimizerTest, ConfigDefaultIterationLimit) {
    CeresOptimizerConfig config;
    config.maxIterations = 2;
    CeresBoundedOptimizer limited(config);

    auto f = [](const Vector& x) { return rosenbrock(x); };
    auto result = limited.minimize(f, vec({-1.2, 1.0}), unbounded(2), OptimizerOptions());
    EXPECT_LE(result.iterations, 2);
    EXPECT_EQ(limited.config().maxIterations, 2);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(CeresBoundedOptimizerTest, MalformedProblemsThrow) {
    auto f = [](const Vector& x) { return x.squaredNorm(); };
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(optimizer_.minimize(f, vec({0.0, 0.0}), unbounded(1), OptimizerOptions()),
                 OptimizationFailure);
    EXPECT_THROW(optimizer_.minimize(f, vec({0.0}), {JointBounds(1.0, 0.0)}, OptimizerOptions()),
                 OptimizationFailure);
    EXPECT_THROW(optimizer_.minimize(f, vec({0.0}), {JointBounds(nan, 1.0)}, OptimizerOptions()),
                 OptimizationFailure);
    EXPECT_THROW(optimizer_.minimize(f, vec({nan}), unbounded(1), OptimizerOptions()),
                 OptimizationFailure);

    OptimizerOptions negative;
    negative.maxIterations = -1;
    EXPECT_THROW(optimizer_.minimize(f, vec({1.0}), unbounded(1), negative),
                 OptimizationFailure);
}

TEST_F(CeresBoundedOptimizerTest, NonFiniteObjectiveThrows) {
    auto f = [](const Vector&) { return std::numeric_limits<double>::quiet_NaN(); };
    EXPECT_THROW(optimizer_.minimize(f, vec({0.0}), unbounded(1), OptimizerOptions()),
                 OptimizationFailure);
}

TEST_F(CeresBoundedOptimizerTest, NonFiniteRegionIsAvoided) {
    // Finite only for x < 2; the minimum of the finite part sits at x = 1
    auto f = [](const Vector& x) {
        if (x[0] >= 2.0) return std::numeric_limits<double>::infinity();
        return (x[0] - 1.0) * (x[0] - 1.0);
    };

    auto result = optimizer_.minimize(f, vec({0.0}), unbounded(1), OptimizerOptions());

    EXPECT_TRUE(std::isfinite(result.objectiveValue));
    EXPECT_NEAR(result.solution[0], 1.0, 1e-3);
}
