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
 * @file recommendations.h
 * @brief Recommendation texts emitted by the diagnostics analyses
 *
 * Clients match on these strings, so they are kept stable.
 */

namespace gpudiag {
namespace recommendation {

// Per-node fragmentation advice
inline constexpr const char* node_migrate_pods =
    "Critical fragmentation: Consider migrating some pods to other nodes";
inline constexpr const char* node_consolidate_small_allocations =
    "Many small GPU allocations detected. Consider consolidating workloads";
inline constexpr const char* node_limited_contiguous_blocks =
    "Limited contiguous GPU blocks. Difficult to schedule larger jobs";
inline constexpr const char* node_low_utilization =
    "Low GPU utilization despite allocation. Check if pods are idle or waiting";
inline constexpr const char* node_healthy = "Node GPU allocation is healthy";

// Cluster fragmentation advice
inline constexpr const char* cluster_critical_fragmentation =
    "Critical fragmentation detected on some nodes. Consider pod consolidation or rebalancing.";
inline constexpr const char* cluster_idle_allocations =
    "Some nodes have allocated GPUs with low utilization. Check if pods are idle.";
inline constexpr const char* cluster_affinity_rules =
    "Some nodes have fragmented GPU allocation. Consider using pod affinity/anti-affinity rules.";
inline constexpr const char* cluster_healthy =
    "Cluster GPU allocation is healthy. No immediate action needed.";

// Load-balance advice
inline constexpr const char* load_rebalance_hotspots =
    "Hotspot nodes detected with high GPU load. Consider rebalancing workloads.";
inline constexpr const char* load_drain_idle_nodes =
    "Idle nodes detected with low GPU utilization. Consider consolidating workloads or draining nodes.";
inline constexpr const char* load_reduce_variance =
    "High variance in node allocation. Consider implementing pod scheduling strategies.";
inline constexpr const char* load_low_allocation =
    "Overall cluster GPU allocation is low. Consider optimizing resource requests.";
inline constexpr const char* load_balanced =
    "Cluster load is well balanced. No immediate action needed.";

}  // namespace recommendation
}  // namespace gpudiag
