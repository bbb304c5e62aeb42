#include <gtest/gtest.h>
#include "report/distribution_report.hpp"
#include "distribution/distribution_engine.hpp"
#include "common/errors.hpp"

#include <limits>

using namespace kchoice;

TEST(ReportTest, SummarisesScenario) {
    auto instance = KnapsackInstance::create({10.0, 10.0}, {5.0, 6.0}, 10.0);
    DistributionEngine engine(instance);
    Distribution dist = engine.getDistribution(ScoringParams{});

    DistributionSummary summary = summarizeDistribution(*instance, dist, 0.0);
    ASSERT_EQ(summary.rows.size(), 2u);
    EXPECT_EQ(summary.terminal_count, 2u);
    EXPECT_NEAR(summary.total_mass, 1.0, 1e-12);

    const SummaryRow& top = summary.rows[0];
    EXPECT_EQ(top.selection.toString(), "[1,0]");
    EXPECT_DOUBLE_EQ(top.value, 10.0);
    EXPECT_DOUBLE_EQ(top.weight, 5.0);
    EXPECT_TRUE(top.optimal);

    const SummaryRow& rest = summary.rows[1];
    EXPECT_EQ(rest.selection.toString(), "[0,0]");
    EXPECT_DOUBLE_EQ(rest.value, 0.0);
    EXPECT_FALSE(rest.optimal);
    EXPECT_GT(top.probability, rest.probability);
}

TEST(ReportTest, ThresholdDropsSmallRows) {
    auto instance = KnapsackInstance::create({10.0, 10.0}, {5.0, 6.0}, 10.0);
    DistributionEngine engine(instance);
    Distribution dist = engine.getDistribution(ScoringParams{});

    DistributionSummary summary = summarizeDistribution(*instance, dist, 0.5);
    ASSERT_EQ(summary.rows.size(), 1u);
    EXPECT_EQ(summary.rows[0].selection.toString(), "[1,0]");
    EXPECT_EQ(summary.terminal_count, 2u);
    EXPECT_NEAR(summary.total_mass, 1.0, 1e-12);

    EXPECT_TRUE(summarizeDistribution(*instance, dist, 1.0).rows.empty());
}

TEST(ReportTest, TiesOrderedBySelection) {
    auto instance = KnapsackInstance::create({1.0, 2.0, 3.0}, {8.0, 9.0, 10.0}, 10.0);
    DistributionEngine engine(instance);
    Distribution dist = engine.getDistribution(ScoringParams{0.5, 0.5, 0.5, 0.0});

    DistributionSummary summary = summarizeDistribution(*instance, dist);
    ASSERT_EQ(summary.rows.size(), 4u);
    EXPECT_EQ(summary.rows[0].selection.toString(), "[0,0,0]");
    EXPECT_EQ(summary.rows[1].selection.toString(), "[0,0,1]");
    EXPECT_EQ(summary.rows[2].selection.toString(), "[0,1,0]");
    EXPECT_EQ(summary.rows[3].selection.toString(), "[1,0,0]");
    EXPECT_TRUE(summary.rows[1].optimal);
    EXPECT_FALSE(summary.rows[3].optimal);
}

TEST(ReportTest, RejectsInvalidThreshold) {
    auto instance = KnapsackInstance::create({1.0}, {1.0}, 1.0);
    Distribution dist;

    EXPECT_THROW(summarizeDistribution(*instance, dist, -0.1), InvalidParameterError);
    EXPECT_THROW(summarizeDistribution(*instance, dist, 1.5), InvalidParameterError);
    EXPECT_THROW(summarizeDistribution(*instance, dist,
                                       std::numeric_limits<double>::quiet_NaN()),
                 InvalidParameterError);
}
