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

#include <gpudiag/analysis/allocation_pattern_analyzer.h>

#include <gpudiag/analysis/recommendations.h>

namespace gpudiag {

allocation_pattern_analyzer::allocation_pattern_analyzer(const diagnostics_config& config)
    : large_pod_gpus_(config.large_pod_gpus), advice_(config.advice) {}

allocation_pattern allocation_pattern_analyzer::analyze(const std::vector<pod_allocation>& pods,
                                                        int32_t total_gpus) const {
    allocation_pattern pattern;
    int64_t allocated = 0;

    for (const auto& pod : pods) {
        if (pod.allocated_gpus >= large_pod_gpus_) {
            pattern.fully_allocated_pods++;
        } else if (pod.allocated_gpus > 0) {
            pattern.partially_allocated_pods++;
        }
        allocated += pod.allocated_gpus;
    }

    // TODO: derive from pod resource-request metadata once providers expose it
    pattern.gpu_sharing_enabled = false;
    pattern.largest_contiguous_gpu = static_cast<int>(total_gpus - allocated);

    return pattern;
}

std::vector<std::string> allocation_pattern_analyzer::recommend(
    const node_fragmentation& frag, const allocation_pattern& pattern) const {
    std::vector<std::string> recommendations;

    if (frag.status == fragmentation_status::critical) {
        recommendations.emplace_back(recommendation::node_migrate_pods);
    }

    if (pattern.partially_allocated_pods > advice_.many_partial_pods &&
        frag.total_gpus >= advice_.consolidation_node_gpus) {
        recommendations.emplace_back(recommendation::node_consolidate_small_allocations);
    }

    if (frag.available_gpus > 0 && frag.available_gpus < advice_.small_block_gpus &&
        pattern.largest_contiguous_gpu < advice_.small_block_gpus) {
        recommendations.emplace_back(recommendation::node_limited_contiguous_blocks);
    }

    if (frag.utilization_percent < advice_.low_utilization_percent && frag.allocated_gpus > 0) {
        recommendations.emplace_back(recommendation::node_low_utilization);
    }

    if (recommendations.empty()) {
        recommendations.emplace_back(recommendation::node_healthy);
    }

    return recommendations;
}

}  // namespace gpudiag
