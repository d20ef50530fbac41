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

#include <gpudiag/analysis/fragmentation_scorer.h>

#include <algorithm>

namespace gpudiag {

fragmentation_scorer::fragmentation_scorer(const diagnostics_config& config)
    : weights_(config.fragmentation)
    , penalty_(config.penalty)
    , classifier_(config.status) {}

double fragmentation_scorer::allocation_rate(const node_snapshot& node) {
    if (node.total_gpus <= 0) {
        return 0.0;
    }
    return static_cast<double>(node.allocated_gpus) / static_cast<double>(node.total_gpus);
}

double fragmentation_scorer::utilization_gap(const node_snapshot& node) {
    double allocated_percent = allocation_rate(node) * 100.0;
    if (node.utilization_percent >= allocated_percent) {
        return 0.0;
    }
    return (allocated_percent - node.utilization_percent) / 100.0;
}

double fragmentation_scorer::partial_allocation_penalty(const std::vector<pod_allocation>& pods,
                                                        int32_t total_gpus) const {
    if (pods.empty()) {
        return 0.0;
    }

    auto small_pods = std::count_if(pods.begin(), pods.end(), [this](const pod_allocation& pod) {
        return pod.allocated_gpus == penalty_.small_pod_gpus;
    });

    double penalty = 0.0;

    // Many single-GPU pods on a large node block whole-node jobs
    if (total_gpus >= penalty_.large_node_gpus &&
        small_pods > penalty_.large_node_small_pod_limit) {
        penalty += penalty_.large_node_penalty;
    }

    if (small_pods > penalty_.small_pod_limit) {
        penalty += penalty_.small_pod_penalty;
    }

    return std::clamp(penalty, 0.0, 1.0);
}

double fragmentation_scorer::score(const node_snapshot& node,
                                   const std::vector<pod_allocation>& pods) const {
    double rate = allocation_rate(node);
    double gap = utilization_gap(node);
    double penalty = partial_allocation_penalty(pods, node.total_gpus);

    double value = (1.0 - rate) * weights_.unused_capacity +
                   gap * weights_.idle_allocation +
                   penalty * weights_.partial_allocation;

    return std::min(value, 100.0);
}

node_fragmentation fragmentation_scorer::evaluate(const node_snapshot& node,
                                                  const std::vector<pod_allocation>& pods) const {
    node_fragmentation frag;
    frag.node_name = node.name;
    frag.total_gpus = node.total_gpus;
    frag.allocated_gpus = node.allocated_gpus;
    frag.available_gpus = node.total_gpus - node.allocated_gpus;
    frag.fragmentation_score = score(node, pods);
    frag.status = classifier_.classify(frag.fragmentation_score);
    frag.utilization_percent = node.utilization_percent;
    return frag;
}

}  // namespace gpudiag
