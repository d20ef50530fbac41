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

#pragma once

/**
 * @file diagnostics_config.h
 * @brief Thresholds and weights of the fragmentation / load-balance analysis
 *
 * Every constant the analysis depends on lives here so that it can be
 * tuned from configuration and tested independently. The defaults
 * reproduce the reference scoring:
 * - fragmentation weights 40 / 40 / 20
 * - status bands 30 / 60
 * - load weights 0.6 / 0.4, hotspot band +-20
 *
 * Configuration keys accepted by from_config_map():
 * | key                                    | default   |
 * |----------------------------------------|-----------|
 * | fragmentation.weight.unused_capacity   | 40        |
 * | fragmentation.weight.idle_allocation   | 40        |
 * | fragmentation.weight.partial_allocation| 20        |
 * | status.fragmented                      | 30        |
 * | status.critical                        | 60        |
 * | penalty.small_pod_gpus                 | 1         |
 * | penalty.large_node_gpus                | 8         |
 * | penalty.large_node_small_pod_limit     | 2         |
 * | penalty.large_node_penalty             | 0.3       |
 * | penalty.small_pod_limit                | 4         |
 * | penalty.small_pod_penalty              | 0.4       |
 * | allocation.large_pod_gpus              | 4         |
 * | advice.many_partial_pods               | 3         |
 * | advice.consolidation_node_gpus         | 8         |
 * | advice.small_block_gpus                | 4         |
 * | advice.low_utilization_percent         | 30        |
 * | load.weight.allocation                 | 0.6       |
 * | load.weight.utilization                | 0.4       |
 * | load.hotspot_band                      | 20        |
 * | load.stddev_limit                      | 20        |
 * | load.low_allocation_percent            | 40        |
 * | snapshot.policy                        | propagate |
 */

#include <string>

#include "../core/result_types.h"
#include "../utils/config_parser.h"

namespace gpudiag {

/**
 * @enum snapshot_policy
 * @brief Handling of out-of-range snapshot values
 */
enum class snapshot_policy {
    propagate,  ///< Use values as supplied; scores may leave [0, 100]
    clamp,      ///< Clamp allocation and utilization into their valid ranges
    reject      ///< Fail the analysis with invalid_snapshot
};

/**
 * @brief Convert snapshot_policy to string representation
 */
std::string snapshot_policy_to_string(snapshot_policy policy);

/**
 * @brief Parse a snapshot_policy name ("propagate", "clamp", "reject")
 */
common::Result<snapshot_policy> snapshot_policy_from_string(const std::string& name);

/**
 * @struct fragmentation_weights
 * @brief Points contributed by each fragmentation factor; must sum to 100
 */
struct fragmentation_weights {
    double unused_capacity{40.0};     ///< Scaled by (1 - allocation rate)
    double idle_allocation{40.0};     ///< Scaled by the allocated-but-idle gap
    double partial_allocation{20.0};  ///< Scaled by the small-pod penalty
};

/**
 * @struct status_thresholds
 * @brief Half-open score bands: [0, fragmented) healthy,
 *        [fragmented, critical) fragmented, [critical, inf) critical
 */
struct status_thresholds {
    double fragmented{30.0};
    double critical{60.0};
};

/**
 * @struct partial_penalty_rules
 * @brief Small-allocation penalty rules, result clamped to [0, 1]
 */
struct partial_penalty_rules {
    int small_pod_gpus{1};                 ///< A pod of exactly this size is "small"
    int large_node_gpus{8};                ///< Nodes at least this big use the first rule
    int large_node_small_pod_limit{2};     ///< More small pods than this on a large node
    double large_node_penalty{0.3};
    int small_pod_limit{4};                ///< More small pods than this on any node
    double small_pod_penalty{0.4};
};

/**
 * @struct node_advice_rules
 * @brief Thresholds of the per-node recommendations
 */
struct node_advice_rules {
    int many_partial_pods{3};              ///< More partial pods than this ...
    int consolidation_node_gpus{8};        ///< ... on a node at least this big
    int small_block_gpus{4};               ///< Free blocks below this size are hard to use
    double low_utilization_percent{30.0};  ///< Allocated but below this is "idle"
};

/**
 * @struct load_weights
 * @brief Weights of the node load score; must sum to 1
 */
struct load_weights {
    double allocation{0.6};
    double utilization{0.4};
};

/**
 * @struct load_balance_rules
 * @brief Thresholds of the load-balance analysis
 *
 * hotspot_band is a fixed distance from the mean load, not derived from the
 * dispersion of the data. When every node lies within mean +- band no node
 * is reported as hotspot or idle, even if some nodes are saturated or empty.
 */
struct load_balance_rules {
    double hotspot_band{20.0};
    double stddev_limit{20.0};
    double low_allocation_percent{40.0};
};

/**
 * @struct diagnostics_config
 * @brief Complete configuration of the diagnostics engine
 */
struct diagnostics_config {
    fragmentation_weights fragmentation;
    status_thresholds status;
    partial_penalty_rules penalty;
    int large_pod_gpus{4};  ///< Pods with at least this many GPUs are fully allocated
    node_advice_rules advice;
    load_weights load;
    load_balance_rules balance;
    snapshot_policy policy{snapshot_policy::propagate};

    /**
     * @brief Configuration reproducing the reference scoring
     */
    static diagnostics_config defaults();

    /**
     * @brief Build a configuration from flat key/value pairs
     *
     * Missing keys keep their default. A present but unparseable value
     * yields configuration_parse_error; the result is then validated.
     *
     * @param config Flat configuration map (see the table in this header)
     * @return The validated configuration or an error naming the key
     */
    static common::Result<diagnostics_config> from_config_map(const config_map& config);

    /**
     * @brief Check weights, bands and limits for consistency
     * @return Error describing the first violation found
     */
    common::VoidResult validate() const;
};

}  // namespace gpudiag
