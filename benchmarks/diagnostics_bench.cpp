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
 * @file diagnostics_bench.cpp
 * @brief Benchmarks for the fragmentation and load-balance analyses
 * @details Measures analysis cost against cluster size. Every analysis is
 * linear in nodes plus pods, so time per node should stay flat across the
 * ranges below.
 */

#include <benchmark/benchmark.h>
#include <gpudiag/analysis/diagnostics_engine.h>
#include <gpudiag/provider/static_snapshot_provider.h>
#include <gpudiag/service/diagnostics_service.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace gpudiag;

namespace {

struct synthetic_cluster {
    std::vector<node_snapshot> nodes;
    pod_map pods;
};

// Deterministic mix of 4- and 8-GPU nodes with 1..4-GPU pods
synthetic_cluster make_cluster(int64_t node_count) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<int32_t> pod_size(1, 4);
    std::uniform_real_distribution<double> utilization(0.0, 100.0);

    synthetic_cluster cluster;
    cluster.nodes.reserve(static_cast<size_t>(node_count));

    for (int64_t i = 0; i < node_count; ++i) {
        node_snapshot node;
        node.name = "gpu-node-" + std::to_string(i);
        node.total_gpus = (i % 3 == 0) ? 4 : 8;
        node.utilization_percent = utilization(rng);

        int32_t target = std::uniform_int_distribution<int32_t>(0, node.total_gpus)(rng);
        std::vector<pod_allocation> pods;
        int32_t allocated = 0;
        while (allocated < target) {
            int32_t size = std::min(pod_size(rng), target - allocated);
            pods.push_back({"pod-" + std::to_string(pods.size()), "bench", size});
            allocated += size;
        }
        node.allocated_gpus = allocated;

        cluster.pods.emplace(node.name, std::move(pods));
        cluster.nodes.push_back(std::move(node));
    }
    return cluster;
}

}  // namespace

// =============================================================================
// Engine
// =============================================================================

static void BM_ClusterFragmentation(benchmark::State& state) {
    auto cluster = make_cluster(state.range(0));
    diagnostics_engine engine;

    for (auto _ : state) {
        auto summary = engine.analyze_cluster_fragmentation(cluster.nodes, cluster.pods);
        benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetLabel("nodes");
}
BENCHMARK(BM_ClusterFragmentation)->RangeMultiplier(4)->Range(16, 4096);

static void BM_NodeFragmentation(benchmark::State& state) {
    auto cluster = make_cluster(1);
    diagnostics_engine engine;
    const auto& node = cluster.nodes.front();
    const auto& pods = cluster.pods.at(node.name);

    for (auto _ : state) {
        auto detail = engine.analyze_node_fragmentation(node, pods);
        benchmark::DoNotOptimize(detail);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("node_detail");
}
BENCHMARK(BM_NodeFragmentation);

static void BM_LoadBalance(benchmark::State& state) {
    auto cluster = make_cluster(state.range(0));
    diagnostics_engine engine;

    for (auto _ : state) {
        auto summary = engine.analyze_load_balance(cluster.nodes);
        benchmark::DoNotOptimize(summary);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetLabel("nodes");
}
BENCHMARK(BM_LoadBalance)->RangeMultiplier(4)->Range(16, 4096);

// =============================================================================
// Service (provider copy + policy + engine)
// =============================================================================

static void BM_ServiceClusterFragmentation(benchmark::State& state) {
    auto cluster = make_cluster(state.range(0));
    auto provider = std::make_shared<static_snapshot_provider>();
    provider->set_nodes(cluster.nodes);
    for (auto& [name, pods] : cluster.pods) {
        provider->set_pods(name, pods);
    }

    diagnostics_config config;
    config.policy = snapshot_policy::clamp;
    diagnostics_service service(provider, config);

    for (auto _ : state) {
        auto result = service.analyze_cluster_fragmentation();
        if (result.is_err()) {
            state.SkipWithError(result.error().message.c_str());
            break;
        }
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetLabel("nodes");
}
BENCHMARK(BM_ServiceClusterFragmentation)->RangeMultiplier(4)->Range(16, 1024);
