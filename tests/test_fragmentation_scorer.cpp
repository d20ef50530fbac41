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
 * @file test_fragmentation_scorer.cpp
 * @brief Node fragmentation score, partial penalty and status classification
 */

#include <gtest/gtest.h>
#include <gpudiag/analysis/fragmentation_scorer.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace gpudiag {
namespace {

node_snapshot make_node(int32_t total, int32_t allocated, double utilization) {
    node_snapshot node;
    node.name = "gpu-node-1";
    node.total_gpus = total;
    node.allocated_gpus = allocated;
    node.utilization_percent = utilization;
    return node;
}

std::vector<pod_allocation> make_pods(std::initializer_list<int32_t> sizes) {
    std::vector<pod_allocation> pods;
    int index = 0;
    for (auto size : sizes) {
        pods.push_back({"pod-" + std::to_string(index++), "default", size});
    }
    return pods;
}

class FragmentationScorerTest : public ::testing::Test {
protected:
    fragmentation_scorer scorer_;
};

// =========================================================================
// Score
// =========================================================================

TEST_F(FragmentationScorerTest, FullyAllocatedAndBusyNodeScoresZero) {
    auto frag = scorer_.evaluate(make_node(8, 8, 100.0), {});

    EXPECT_DOUBLE_EQ(frag.fragmentation_score, 0.0);
    EXPECT_EQ(frag.status, fragmentation_status::healthy);
    EXPECT_EQ(frag.available_gpus, 0);
}

TEST_F(FragmentationScorerTest, EmptyNodeScoresUnusedCapacityWeight) {
    auto frag = scorer_.evaluate(make_node(8, 0, 0.0), {});

    EXPECT_DOUBLE_EQ(frag.fragmentation_score, 40.0);
    EXPECT_EQ(frag.status, fragmentation_status::fragmented);
    EXPECT_EQ(frag.available_gpus, 8);
}

TEST_F(FragmentationScorerTest, AllocatedButIdleNodeScoresUtilizationGap) {
    auto node = make_node(8, 8, 10.0);

    EXPECT_DOUBLE_EQ(fragmentation_scorer::utilization_gap(node), 0.9);
    auto frag = scorer_.evaluate(node, {});
    EXPECT_DOUBLE_EQ(frag.fragmentation_score, 36.0);
    EXPECT_EQ(frag.status, fragmentation_status::fragmented);
}

TEST_F(FragmentationScorerTest, UtilizationAboveAllocationHasNoGap) {
    auto node = make_node(8, 4, 80.0);
    EXPECT_DOUBLE_EQ(fragmentation_scorer::utilization_gap(node), 0.0);
    EXPECT_DOUBLE_EQ(scorer_.score(node, {}), 20.0);
}

TEST_F(FragmentationScorerTest, ZeroGpuNodeIsGuarded) {
    auto node = make_node(0, 0, 0.0);

    EXPECT_DOUBLE_EQ(fragmentation_scorer::allocation_rate(node), 0.0);
    EXPECT_DOUBLE_EQ(scorer_.score(node, {}), 40.0);
}

TEST_F(FragmentationScorerTest, CombinesAllThreeFactors) {
    // rate 0.5 -> 20, gap (50 - 20) / 100 = 0.3 -> 12, penalty 0.3 + 0.4 -> 14
    auto pods = make_pods({1, 1, 1, 1, 1});
    auto node = make_node(10, 5, 20.0);

    EXPECT_NEAR(scorer_.score(node, pods), 46.0, 1e-9);
}

TEST_F(FragmentationScorerTest, ScoreIsCappedAt100) {
    // Out-of-range utilization is propagated, the cap still applies
    auto node = make_node(8, 8, -500.0);
    EXPECT_DOUBLE_EQ(scorer_.score(node, {}), 100.0);
}

TEST_F(FragmentationScorerTest, ScoreStaysInRangeForValidInput) {
    auto pods = make_pods({1, 1, 1, 1, 1, 1});
    for (int32_t total : {0, 1, 4, 8, 16}) {
        for (int32_t allocated = 0; allocated <= total; ++allocated) {
            for (double utilization : {0.0, 12.5, 50.0, 99.0, 100.0}) {
                double score = scorer_.score(make_node(total, allocated, utilization), pods);
                EXPECT_GE(score, 0.0);
                EXPECT_LE(score, 100.0);
            }
        }
    }
}

TEST_F(FragmentationScorerTest, EvaluateCopiesNodeFields) {
    auto frag = scorer_.evaluate(make_node(8, 3, 55.5), {});
    EXPECT_EQ(frag.node_name, "gpu-node-1");
    EXPECT_EQ(frag.total_gpus, 8);
    EXPECT_EQ(frag.allocated_gpus, 3);
    EXPECT_EQ(frag.available_gpus, 5);
    EXPECT_DOUBLE_EQ(frag.utilization_percent, 55.5);
}

// =========================================================================
// Partial allocation penalty
// =========================================================================

TEST_F(FragmentationScorerTest, PenaltyEmptyPodList) {
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty({}, 8), 0.0);
}

TEST_F(FragmentationScorerTest, PenaltyThreeSmallPodsOnLargeNode) {
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty(make_pods({1, 1, 1}), 8), 0.3);
}

TEST_F(FragmentationScorerTest, PenaltyTwoSmallPodsIsFree) {
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty(make_pods({1, 1}), 8), 0.0);
}

TEST_F(FragmentationScorerTest, PenaltySmallNodeNeedsMoreThanFourSmallPods) {
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty(make_pods({1, 1, 1, 1}), 4), 0.0);
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty(make_pods({1, 1, 1, 1, 1}), 4), 0.4);
}

TEST_F(FragmentationScorerTest, PenaltyBothRulesAdd) {
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty(make_pods({1, 1, 1, 1, 1}), 8), 0.7);
}

TEST_F(FragmentationScorerTest, PenaltyIgnoresMediumAndLargePods) {
    EXPECT_DOUBLE_EQ(scorer_.partial_allocation_penalty(make_pods({2, 3, 2, 3, 4, 8}), 8), 0.0);
}

TEST_F(FragmentationScorerTest, PenaltyIsClampedToOne) {
    diagnostics_config config;
    config.penalty.large_node_penalty = 0.8;
    config.penalty.small_pod_penalty = 0.8;
    fragmentation_scorer scorer(config);

    EXPECT_DOUBLE_EQ(scorer.partial_allocation_penalty(make_pods({1, 1, 1, 1, 1}), 8), 1.0);
}

// =========================================================================
// Classification
// =========================================================================

TEST_F(FragmentationScorerTest, StatusBandsAreHalfOpen) {
    fragmentation_classifier classifier;

    EXPECT_EQ(classifier.classify(0.0), fragmentation_status::healthy);
    EXPECT_EQ(classifier.classify(29.999), fragmentation_status::healthy);
    EXPECT_EQ(classifier.classify(30.0), fragmentation_status::fragmented);
    EXPECT_EQ(classifier.classify(59.999), fragmentation_status::fragmented);
    EXPECT_EQ(classifier.classify(60.0), fragmentation_status::critical);
    EXPECT_EQ(classifier.classify(100.0), fragmentation_status::critical);
}

TEST_F(FragmentationScorerTest, ClassificationIsTotal) {
    fragmentation_classifier classifier;
    EXPECT_EQ(classifier.classify(-25.0), fragmentation_status::healthy);
    EXPECT_EQ(classifier.classify(250.0), fragmentation_status::critical);
}

TEST_F(FragmentationScorerTest, ClassifierUsesConfiguredBands) {
    fragmentation_classifier classifier(status_thresholds{10.0, 20.0});
    EXPECT_EQ(classifier.classify(15.0), fragmentation_status::fragmented);
    EXPECT_EQ(classifier.classify(20.0), fragmentation_status::critical);
}

TEST_F(FragmentationScorerTest, StatusNames) {
    EXPECT_EQ(fragmentation_status_to_string(fragmentation_status::healthy), "healthy");
    EXPECT_EQ(fragmentation_status_to_string(fragmentation_status::fragmented), "fragmented");
    EXPECT_EQ(fragmentation_status_to_string(fragmentation_status::critical), "critical");
}

}  // namespace
}  // namespace gpudiag
