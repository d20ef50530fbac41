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
 * @file diagnostic_types.h
 * @brief Snapshot inputs and derived results of the GPU diagnostics engine
 *
 * Inputs (node_snapshot, pod_allocation) are supplied by a snapshot
 * provider. Every other type here is derived per call and owned by the
 * caller that requested the analysis.
 */

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gpudiag {

/**
 * @struct node_snapshot
 * @brief GPU capacity, allocation and utilization of one node
 *
 * allocated_gpus is expected in [0, total_gpus] and utilization_percent
 * in [0, 100]; neither is enforced here (see snapshot_validator.h).
 */
struct node_snapshot {
    std::string name;                 ///< Node name
    int32_t total_gpus{0};            ///< GPU capacity
    int32_t allocated_gpus{0};        ///< GPUs allocated to pods
    double utilization_percent{0.0};  ///< Average GPU utilization (0-100)
};

/**
 * @struct pod_allocation
 * @brief One active GPU pod on a node
 */
struct pod_allocation {
    std::string pod_name;
    std::string pod_namespace;
    int32_t allocated_gpus{0};
};

/// Pods per node name
using pod_map = std::unordered_map<std::string, std::vector<pod_allocation>>;

/**
 * @enum fragmentation_status
 * @brief Classification of a node fragmentation score
 */
enum class fragmentation_status {
    healthy,     ///< score < fragmented threshold
    fragmented,  ///< fragmented threshold <= score < critical threshold
    critical     ///< score >= critical threshold
};

/**
 * @brief Convert fragmentation_status to string representation
 */
inline std::string fragmentation_status_to_string(fragmentation_status status) {
    switch (status) {
        case fragmentation_status::healthy:
            return "healthy";
        case fragmentation_status::fragmented:
            return "fragmented";
        case fragmentation_status::critical:
            return "critical";
        default:
            return "unknown";
    }
}

/**
 * @struct node_fragmentation
 * @brief Fragmentation score and classification of one node
 */
struct node_fragmentation {
    std::string node_name;
    int32_t total_gpus{0};
    int32_t allocated_gpus{0};
    int32_t available_gpus{0};         ///< total_gpus - allocated_gpus
    double fragmentation_score{0.0};   ///< 0 = no fragmentation, 100 = severe
    fragmentation_status status{fragmentation_status::healthy};
    double utilization_percent{0.0};
};

/**
 * @struct allocation_pattern
 * @brief Pod allocation shape on one node
 */
struct allocation_pattern {
    int fully_allocated_pods{0};      ///< Pods holding at least a large block
    int partially_allocated_pods{0};  ///< Pods holding fewer GPUs than a large block
    bool gpu_sharing_enabled{false};  ///< Not derived yet, always false

    /// Approximation: total GPUs minus the sum of pod allocations. This is
    /// not a slot-level contiguity computation.
    int largest_contiguous_gpu{0};
};

/**
 * @struct node_fragmentation_detail
 * @brief Result of a single-node fragmentation analysis
 */
struct node_fragmentation_detail {
    node_fragmentation fragmentation;
    allocation_pattern pattern;
    std::vector<std::string> recommendations;
    std::vector<pod_allocation> running_pods;
};

/**
 * @struct fragmentation_summary
 * @brief Cluster-wide status tallies and waste estimate
 */
struct fragmentation_summary {
    int healthy_nodes{0};
    int fragmented_nodes{0};
    int critical_nodes{0};
    int total_wasted_gpus{0};       ///< Available GPUs on non-healthy nodes
    double waste_percentage{0.0};   ///< total_wasted_gpus / cluster capacity * 100
};

/**
 * @struct cluster_fragmentation_summary
 * @brief Result of a cluster-wide fragmentation analysis
 *
 * cluster_score is the mean node score. For an empty cluster it is the
 * sentinel 100, which only guards the division and means "nothing to
 * report", not "healthy".
 */
struct cluster_fragmentation_summary {
    double cluster_score{0.0};
    int total_nodes{0};
    std::vector<node_fragmentation> nodes;
    std::vector<std::string> recommendations;
    fragmentation_summary summary;
};

/**
 * @struct node_load
 * @brief Weighted load of one node
 */
struct node_load {
    std::string node_name;
    double allocation_rate_percent{0.0};
    double utilization_rate_percent{0.0};
    double load_score{0.0};
};

/**
 * @struct load_balance_stats
 * @brief Dispersion of allocation rates across nodes
 */
struct load_balance_stats {
    double avg_allocation_rate{0.0};
    double stddev_allocation{0.0};
    double max_allocation{0.0};
    double min_allocation{0.0};
    double variance{0.0};
};

/**
 * @struct load_balance_summary
 * @brief Result of a cluster load-balance analysis
 *
 * A cluster with no nodes reports the sentinel score 100.
 */
struct load_balance_summary {
    double cluster_load_balance_score{100.0};  ///< 0-100, higher is better balanced
    std::vector<node_load> nodes;
    std::vector<std::string> hotspot_nodes;
    std::vector<std::string> idle_nodes;
    load_balance_stats stats;
    std::vector<std::string> recommendations;
};

}  // namespace gpudiag
