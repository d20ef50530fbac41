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

#include <gpudiag/analysis/cluster_fragmentation_aggregator.h>

#include <algorithm>
#include <utility>

#include <gpudiag/analysis/recommendations.h>

namespace gpudiag {

cluster_fragmentation_aggregator::cluster_fragmentation_aggregator(
    const diagnostics_config& config)
    : low_utilization_percent_(config.advice.low_utilization_percent) {}

double cluster_fragmentation_aggregator::cluster_score(
    const std::vector<node_fragmentation>& nodes) {
    if (nodes.empty()) {
        return empty_cluster_score;
    }

    double total = 0.0;
    for (const auto& node : nodes) {
        total += node.fragmentation_score;
    }
    return total / static_cast<double>(nodes.size());
}

fragmentation_summary cluster_fragmentation_aggregator::summarize(
    const std::vector<node_fragmentation>& nodes) {
    fragmentation_summary summary;
    int64_t capacity = 0;

    for (const auto& node : nodes) {
        switch (node.status) {
            case fragmentation_status::healthy:
                summary.healthy_nodes++;
                break;
            case fragmentation_status::fragmented:
                summary.fragmented_nodes++;
                break;
            case fragmentation_status::critical:
                summary.critical_nodes++;
                break;
        }
        capacity += node.total_gpus;

        if (node.status != fragmentation_status::healthy && node.available_gpus > 0) {
            summary.total_wasted_gpus += node.available_gpus;
        }
    }

    if (capacity > 0) {
        summary.waste_percentage =
            static_cast<double>(summary.total_wasted_gpus) / static_cast<double>(capacity) * 100.0;
    }

    return summary;
}

std::vector<std::string> cluster_fragmentation_aggregator::recommend(
    const std::vector<node_fragmentation>& nodes) const {
    std::vector<std::string> recommendations;

    bool has_critical = std::any_of(nodes.begin(), nodes.end(), [](const node_fragmentation& n) {
        return n.status == fragmentation_status::critical;
    });
    if (has_critical) {
        recommendations.emplace_back(recommendation::cluster_critical_fragmentation);
    }

    bool has_idle_allocation =
        std::any_of(nodes.begin(), nodes.end(), [this](const node_fragmentation& n) {
            return n.allocated_gpus > 0 && n.utilization_percent < low_utilization_percent_;
        });
    if (has_idle_allocation) {
        recommendations.emplace_back(recommendation::cluster_idle_allocations);
    }

    bool has_fragmented_capacity =
        std::any_of(nodes.begin(), nodes.end(), [](const node_fragmentation& n) {
            return n.status == fragmentation_status::fragmented && n.available_gpus > 0;
        });
    if (has_fragmented_capacity) {
        recommendations.emplace_back(recommendation::cluster_affinity_rules);
    }

    if (recommendations.empty()) {
        recommendations.emplace_back(recommendation::cluster_healthy);
    }

    return recommendations;
}

cluster_fragmentation_summary cluster_fragmentation_aggregator::aggregate(
    std::vector<node_fragmentation> nodes) const {
    cluster_fragmentation_summary result;
    result.cluster_score = cluster_score(nodes);
    result.total_nodes = static_cast<int>(nodes.size());
    result.summary = summarize(nodes);
    result.recommendations = recommend(nodes);
    result.nodes = std::move(nodes);
    return result;
}

}  // namespace gpudiag
