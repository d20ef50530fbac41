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

#include <gpudiag/analysis/diagnostics_engine.h>

#include <utility>

namespace gpudiag {

namespace {

const std::vector<pod_allocation> no_pods;

}  // namespace

diagnostics_engine::diagnostics_engine(diagnostics_config config)
    : config_(std::move(config))
    , scorer_(config_)
    , pattern_analyzer_(config_)
    , cluster_aggregator_(config_)
    , load_scorer_(config_)
    , balance_aggregator_(config_) {}

cluster_fragmentation_summary diagnostics_engine::analyze_cluster_fragmentation(
    const std::vector<node_snapshot>& nodes, const pod_map& pods_by_node) const {
    std::vector<node_fragmentation> frags;
    frags.reserve(nodes.size());

    for (const auto& node : nodes) {
        auto it = pods_by_node.find(node.name);
        const auto& pods = it != pods_by_node.end() ? it->second : no_pods;
        frags.push_back(scorer_.evaluate(node, pods));
    }

    return cluster_aggregator_.aggregate(std::move(frags));
}

node_fragmentation_detail diagnostics_engine::analyze_node_fragmentation(
    const node_snapshot& node, const std::vector<pod_allocation>& pods) const {
    node_fragmentation_detail detail;
    detail.fragmentation = scorer_.evaluate(node, pods);
    detail.pattern = pattern_analyzer_.analyze(pods, node.total_gpus);
    detail.recommendations = pattern_analyzer_.recommend(detail.fragmentation, detail.pattern);
    detail.running_pods = pods;
    return detail;
}

load_balance_summary diagnostics_engine::analyze_load_balance(
    const std::vector<node_snapshot>& nodes) const {
    std::vector<node_load> loads;
    loads.reserve(nodes.size());

    for (const auto& node : nodes) {
        loads.push_back(load_scorer_.score(node));
    }

    return balance_aggregator_.aggregate(std::move(loads));
}

}  // namespace gpudiag
