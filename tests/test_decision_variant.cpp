#include <gtest/gtest.h>
#include "distribution/decision_variant.hpp"
#include "common/errors.hpp"

#include <limits>

using namespace kchoice;

TEST(DecisionVariantTest, TargetMetByOptimum) {
    auto instance = KnapsackInstance::create({10.0, 10.0}, {5.0, 6.0}, 10.0);
    DistributionEngine engine(instance);
    ScoringParams params;

    DecisionResult result = solveDecisionVariant(engine, instance->root(), params, 10.0);
    Distribution dist = engine.getDistribution(params);
    Selection taken = Selection(2).with(0);

    EXPECT_TRUE(result.reachable);
    EXPECT_DOUBLE_EQ(result.optimal_value, 10.0);
    EXPECT_DOUBLE_EQ(result.witness_probability, dist.at(taken));
    ASSERT_EQ(result.witnesses.size(), 1u);
    EXPECT_EQ(result.witnesses.begin()->first, taken);
}

TEST(DecisionVariantTest, TargetAboveOptimum) {
    auto instance = KnapsackInstance::create({10.0, 10.0}, {5.0, 6.0}, 10.0);
    DistributionEngine engine(instance);

    DecisionResult result = solveDecisionVariant(engine, instance->root(), ScoringParams{}, 11.0);
    EXPECT_FALSE(result.reachable);
    EXPECT_DOUBLE_EQ(result.witness_probability, 0.0);
    EXPECT_TRUE(result.witnesses.empty());
}

TEST(DecisionVariantTest, ZeroTargetCoversAllMass) {
    auto instance = KnapsackInstance::create({2.0, 3.0, 4.0, 9.0}, {1.0, 2.0, 3.0, 5.0}, 9.0);
    DistributionEngine engine(instance);

    DecisionResult result = solveDecisionVariant(engine, instance->root(), ScoringParams{}, 0.0);
    EXPECT_TRUE(result.reachable);
    EXPECT_NEAR(result.witness_probability, 1.0, 1e-9);
    EXPECT_EQ(result.witnesses.size(), engine.getDistribution(ScoringParams{}).size());
}

TEST(DecisionVariantTest, WitnessMassIsNotRenormalised) {
    auto instance = KnapsackInstance::create({2.0, 3.0, 4.0, 9.0}, {1.0, 2.0, 3.0, 5.0}, 9.0);
    DistributionEngine engine(instance);
    ScoringParams params{0.5, 0.5, 0.5, 1.0};

    DecisionResult result = solveDecisionVariant(engine, instance->root(), params, 14.0);
    Distribution dist = engine.getDistribution(params);

    double expected = 0.0;
    for (const auto& [selection, mass] : dist) {
        if (instance->valueOf(selection) >= 14.0) expected += mass;
    }
    EXPECT_TRUE(result.reachable);
    EXPECT_DOUBLE_EQ(result.witness_probability, expected);
    EXPECT_LT(result.witness_probability, 1.0);
}

TEST(DecisionVariantTest, WorksFromInnerNode) {
    auto instance = KnapsackInstance::create({2.0, 3.0, 4.0, 9.0}, {1.0, 2.0, 3.0, 5.0}, 9.0);
    DistributionEngine engine(instance);

    NodeRef inner = instance->child(instance->root(), 3);
    DecisionResult result = solveDecisionVariant(engine, inner, ScoringParams{}, 9.0);
    EXPECT_TRUE(result.reachable);
    EXPECT_NEAR(result.witness_probability, 1.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.optimal_value, instance->optimalValue(inner));
}

TEST(DecisionVariantTest, RejectsInvalidTarget) {
    auto instance = KnapsackInstance::create({1.0}, {1.0}, 1.0);
    DistributionEngine engine(instance);
    NodeRef root = instance->root();

    EXPECT_THROW(solveDecisionVariant(engine, root, ScoringParams{}, -1.0), InvalidParameterError);
    EXPECT_THROW(solveDecisionVariant(engine, root, ScoringParams{},
                                      std::numeric_limits<double>::quiet_NaN()),
                 InvalidParameterError);
    EXPECT_THROW(solveDecisionVariant(engine, root, ScoringParams{},
                                      std::numeric_limits<double>::infinity()),
                 InvalidParameterError);
}

TEST(DecisionVariantTest, MeetsTargetToleratesRounding) {
    EXPECT_TRUE(meetsTarget(0.1 + 0.2, 0.3));
    EXPECT_TRUE(meetsTarget(5.0, 5.0));
    EXPECT_FALSE(meetsTarget(4.999, 5.0));
}
