// BSD 3-Clause License
//
// Copyright (c) 2021-2025, gpu_diagnostics_system contributors
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file test_load_balance.cpp
 * @brief Node load scores, balance score, hotspot/idle detection and advice
 */

#include <gtest/gtest.h>
#include <gpudiag/analysis/load_balance_analyzer.h>
#include <gpudiag/analysis/recommendations.h>

#include <algorithm>
#include <string>
#include <vector>

namespace gpudiag {
namespace {

node_snapshot make_node(const std::string& name, int32_t total, int32_t allocated,
                        double utilization) {
    node_snapshot node;
    node.name = name;
    node.total_gpus = total;
    node.allocated_gpus = allocated;
    node.utilization_percent = utilization;
    return node;
}

class LoadBalanceTest : public ::testing::Test {
protected:
    std::vector<node_load> score_all(const std::vector<node_snapshot>& nodes) const {
        std::vector<node_load> loads;
        for (const auto& node : nodes) {
            loads.push_back(scorer_.score(node));
        }
        return loads;
    }

    node_load_scorer scorer_;
    load_balance_aggregator aggregator_;
};

// =========================================================================
// Node load
// =========================================================================

TEST_F(LoadBalanceTest, LoadScoreWeightsAllocationAndUtilization) {
    auto load = scorer_.score(make_node("n", 8, 4, 80.0));

    EXPECT_EQ(load.node_name, "n");
    EXPECT_DOUBLE_EQ(load.allocation_rate_percent, 50.0);
    EXPECT_DOUBLE_EQ(load.utilization_rate_percent, 80.0);
    EXPECT_DOUBLE_EQ(load.load_score, 50.0 * 0.6 + 80.0 * 0.4);
}

TEST_F(LoadBalanceTest, ZeroGpuNodeHasZeroAllocationRate) {
    auto load = scorer_.score(make_node("n", 0, 0, 25.0));

    EXPECT_DOUBLE_EQ(load.allocation_rate_percent, 0.0);
    EXPECT_DOUBLE_EQ(load.load_score, 10.0);
}

TEST_F(LoadBalanceTest, LoadWeightsFollowConfiguration) {
    diagnostics_config config;
    config.load.allocation = 1.0;
    config.load.utilization = 0.0;
    node_load_scorer scorer(config);

    EXPECT_DOUBLE_EQ(scorer.score(make_node("n", 4, 1, 100.0)).load_score, 25.0);
}

// =========================================================================
// Balance score
// =========================================================================

TEST_F(LoadBalanceTest, IdenticalAllocationRatesScore100) {
    auto result = aggregator_.aggregate(score_all({make_node("a", 8, 4, 50.0),
                                                   make_node("b", 8, 4, 50.0),
                                                   make_node("c", 4, 2, 50.0)}));

    EXPECT_DOUBLE_EQ(result.cluster_load_balance_score, 100.0);
    EXPECT_DOUBLE_EQ(result.stats.stddev_allocation, 0.0);
    EXPECT_TRUE(result.hotspot_nodes.empty());
    EXPECT_TRUE(result.idle_nodes.empty());
}

TEST_F(LoadBalanceTest, AllIdleClusterScores100) {
    auto loads = score_all({make_node("a", 8, 0, 0.0), make_node("b", 8, 0, 0.0)});
    EXPECT_DOUBLE_EQ(load_balance_aggregator::balance_score(loads), 100.0);
}

TEST_F(LoadBalanceTest, SpreadAllocationRates) {
    auto result = aggregator_.aggregate(score_all({make_node("low", 10, 1, 50.0),
                                                   make_node("mid", 10, 5, 50.0),
                                                   make_node("high", 10, 9, 50.0)}));

    EXPECT_NEAR(result.stats.avg_allocation_rate, 50.0, 1e-9);
    EXPECT_NEAR(result.stats.variance, 1066.667, 1e-3);
    EXPECT_NEAR(result.stats.stddev_allocation, 32.660, 1e-3);
    EXPECT_DOUBLE_EQ(result.stats.min_allocation, 10.0);
    EXPECT_DOUBLE_EQ(result.stats.max_allocation, 90.0);
    EXPECT_NEAR(result.cluster_load_balance_score, 34.68, 0.01);
}

TEST_F(LoadBalanceTest, CoefficientOfVariationIsCapped) {
    // rates 0 and 100: mean 50, stddev 50, CV 1
    auto loads = score_all({make_node("a", 4, 0, 0.0), make_node("b", 4, 4, 0.0)});
    EXPECT_DOUBLE_EQ(load_balance_aggregator::balance_score(loads), 0.0);

    // rates 0, 0, 0, 100: CV > 1 still scores 0
    loads = score_all({make_node("a", 4, 0, 0.0), make_node("b", 4, 0, 0.0),
                       make_node("c", 4, 0, 0.0), make_node("d", 4, 4, 0.0)});
    EXPECT_DOUBLE_EQ(load_balance_aggregator::balance_score(loads), 0.0);
}

TEST_F(LoadBalanceTest, ScoreStaysInRangeForValidInput) {
    for (int32_t first = 0; first <= 8; ++first) {
        for (int32_t second = 0; second <= 4; ++second) {
            for (double utilization : {0.0, 37.5, 100.0}) {
                auto loads = score_all({make_node("a", 8, first, utilization),
                                        make_node("b", 4, second, 100.0 - utilization),
                                        make_node("c", 0, 0, utilization)});
                double score = aggregator_.aggregate(loads).cluster_load_balance_score;
                EXPECT_GE(score, 0.0);
                EXPECT_LE(score, 100.0);
            }
        }
    }
}

TEST_F(LoadBalanceTest, StatisticsUseTrueExtremes) {
    auto balance = load_balance_aggregator::statistics(
        score_all({make_node("a", 4, 4, 0.0), make_node("b", 4, 4, 0.0)}));

    EXPECT_DOUBLE_EQ(balance.min_allocation, 100.0);
    EXPECT_DOUBLE_EQ(balance.max_allocation, 100.0);
}

// =========================================================================
// Hotspot and idle nodes
// =========================================================================

TEST_F(LoadBalanceTest, ClassifiesAroundMeanLoad) {
    auto loads = score_all({make_node("low", 10, 1, 50.0), make_node("mid", 10, 5, 50.0),
                            make_node("high", 10, 9, 50.0)});

    // load scores 26, 50, 74 around mean 50
    auto [hotspots, idle] = aggregator_.classify_nodes(loads);
    ASSERT_EQ(hotspots.size(), 1u);
    EXPECT_EQ(hotspots[0], "high");
    ASSERT_EQ(idle.size(), 1u);
    EXPECT_EQ(idle[0], "low");
}

TEST_F(LoadBalanceTest, BandBoundaryIsExclusive) {
    std::vector<node_load> loads(2);
    loads[0].node_name = "a";
    loads[0].load_score = 30.0;
    loads[1].node_name = "b";
    loads[1].load_score = 70.0;

    // mean 50, both nodes sit exactly on the band edge
    auto [hotspots, idle] = aggregator_.classify_nodes(loads);
    EXPECT_TRUE(hotspots.empty());
    EXPECT_TRUE(idle.empty());
}

TEST_F(LoadBalanceTest, HotspotAndIdleSetsAreDisjoint) {
    auto loads = score_all({make_node("a", 8, 0, 0.0), make_node("b", 8, 8, 100.0),
                            make_node("c", 8, 1, 5.0), make_node("d", 8, 7, 95.0),
                            make_node("e", 8, 4, 50.0)});

    auto [hotspots, idle] = aggregator_.classify_nodes(loads);
    for (const auto& name : hotspots) {
        EXPECT_EQ(std::find(idle.begin(), idle.end(), name), idle.end()) << name;
    }
    EXPECT_FALSE(hotspots.empty());
    EXPECT_FALSE(idle.empty());
}

// =========================================================================
// Recommendations
// =========================================================================

TEST_F(LoadBalanceTest, BalancedClusterGetsSingleEntry) {
    load_balance_stats balance;
    balance.avg_allocation_rate = 75.0;
    balance.stddev_allocation = 5.0;

    auto recs = aggregator_.recommend(balance, {}, {});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0], recommendation::load_balanced);
}

TEST_F(LoadBalanceTest, LowAverageAllocation) {
    load_balance_stats balance;
    balance.avg_allocation_rate = 39.9;

    auto recs = aggregator_.recommend(balance, {}, {});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0], recommendation::load_low_allocation);
}

TEST_F(LoadBalanceTest, AllChecksContributeInOrder) {
    load_balance_stats balance;
    balance.avg_allocation_rate = 20.0;
    balance.stddev_allocation = 25.0;

    auto recs = aggregator_.recommend(balance, {"hot"}, {"cold"});
    ASSERT_EQ(recs.size(), 4u);
    EXPECT_EQ(recs[0], recommendation::load_rebalance_hotspots);
    EXPECT_EQ(recs[1], recommendation::load_drain_idle_nodes);
    EXPECT_EQ(recs[2], recommendation::load_reduce_variance);
    EXPECT_EQ(recs[3], recommendation::load_low_allocation);
}

TEST_F(LoadBalanceTest, SpreadClusterRecommendations) {
    auto result = aggregator_.aggregate(score_all({make_node("low", 10, 1, 50.0),
                                                   make_node("mid", 10, 5, 50.0),
                                                   make_node("high", 10, 9, 50.0)}));

    ASSERT_EQ(result.recommendations.size(), 3u);
    EXPECT_EQ(result.recommendations[0], recommendation::load_rebalance_hotspots);
    EXPECT_EQ(result.recommendations[1], recommendation::load_drain_idle_nodes);
    EXPECT_EQ(result.recommendations[2], recommendation::load_reduce_variance);
}

// =========================================================================
// Empty cluster
// =========================================================================

TEST_F(LoadBalanceTest, EmptyClusterReportsSentinel) {
    auto result = aggregator_.aggregate({});

    EXPECT_DOUBLE_EQ(result.cluster_load_balance_score,
                     load_balance_aggregator::empty_cluster_score);
    EXPECT_TRUE(result.nodes.empty());
    EXPECT_TRUE(result.hotspot_nodes.empty());
    EXPECT_TRUE(result.idle_nodes.empty());
    EXPECT_DOUBLE_EQ(result.stats.avg_allocation_rate, 0.0);
    EXPECT_DOUBLE_EQ(result.stats.variance, 0.0);
    ASSERT_EQ(result.recommendations.size(), 1u);
    EXPECT_EQ(result.recommendations[0], recommendation::load_low_allocation);
}

}  // namespace
}  // namespace gpudiag
