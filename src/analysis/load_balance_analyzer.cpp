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

#include <gpudiag/analysis/load_balance_analyzer.h>

#include <algorithm>

#include <gpudiag/analysis/recommendations.h>
#include <gpudiag/utils/statistics.h>

namespace gpudiag {

namespace {

std::vector<double> allocation_rates(const std::vector<node_load>& loads) {
    std::vector<double> rates;
    rates.reserve(loads.size());
    for (const auto& load : loads) {
        rates.push_back(load.allocation_rate_percent);
    }
    return rates;
}

}  // namespace

node_load node_load_scorer::score(const node_snapshot& node) const {
    node_load load;
    load.node_name = node.name;
    if (node.total_gpus > 0) {
        load.allocation_rate_percent =
            static_cast<double>(node.allocated_gpus) / static_cast<double>(node.total_gpus) * 100.0;
    }
    load.utilization_rate_percent = node.utilization_percent;
    load.load_score = load.allocation_rate_percent * weights_.allocation +
                      load.utilization_rate_percent * weights_.utilization;
    return load;
}

double load_balance_aggregator::balance_score(const std::vector<node_load>& loads) {
    if (loads.empty()) {
        return empty_cluster_score;
    }

    auto summary = stats::compute_population(allocation_rates(loads));

    double cv = 0.0;
    if (summary.mean > 0.0) {
        cv = summary.stddev / summary.mean;
    }

    return 100.0 * (1.0 - std::min(cv, 1.0));
}

std::pair<std::vector<std::string>, std::vector<std::string>>
load_balance_aggregator::classify_nodes(const std::vector<node_load>& loads) const {
    std::vector<std::string> hotspots;
    std::vector<std::string> idle;

    if (loads.empty()) {
        return {hotspots, idle};
    }

    std::vector<double> scores;
    scores.reserve(loads.size());
    for (const auto& load : loads) {
        scores.push_back(load.load_score);
    }
    double mean_load = stats::mean(scores);

    for (const auto& load : loads) {
        if (load.load_score > mean_load + rules_.hotspot_band) {
            hotspots.push_back(load.node_name);
        } else if (load.load_score < mean_load - rules_.hotspot_band) {
            idle.push_back(load.node_name);
        }
    }

    return {hotspots, idle};
}

load_balance_stats load_balance_aggregator::statistics(const std::vector<node_load>& loads) {
    load_balance_stats result;
    if (loads.empty()) {
        return result;
    }

    auto summary = stats::compute_population(allocation_rates(loads));
    result.avg_allocation_rate = summary.mean;
    result.stddev_allocation = summary.stddev;
    result.max_allocation = summary.max;
    result.min_allocation = summary.min;
    result.variance = summary.variance;
    return result;
}

std::vector<std::string> load_balance_aggregator::recommend(
    const load_balance_stats& balance_stats, const std::vector<std::string>& hotspot_nodes,
    const std::vector<std::string>& idle_nodes) const {
    std::vector<std::string> recommendations;

    if (!hotspot_nodes.empty()) {
        recommendations.emplace_back(recommendation::load_rebalance_hotspots);
    }

    if (!idle_nodes.empty()) {
        recommendations.emplace_back(recommendation::load_drain_idle_nodes);
    }

    if (balance_stats.stddev_allocation > rules_.stddev_limit) {
        recommendations.emplace_back(recommendation::load_reduce_variance);
    }

    if (balance_stats.avg_allocation_rate < rules_.low_allocation_percent) {
        recommendations.emplace_back(recommendation::load_low_allocation);
    }

    if (recommendations.empty()) {
        recommendations.emplace_back(recommendation::load_balanced);
    }

    return recommendations;
}

load_balance_summary load_balance_aggregator::aggregate(std::vector<node_load> loads) const {
    load_balance_summary result;

    // Zero stats still trip the low-allocation rule, so an empty cluster
    // never reads as balanced.
    if (loads.empty()) {
        result.cluster_load_balance_score = empty_cluster_score;
        result.recommendations = recommend(result.stats, {}, {});
        return result;
    }

    result.cluster_load_balance_score = balance_score(loads);
    auto [hotspots, idle] = classify_nodes(loads);
    result.stats = statistics(loads);
    result.recommendations = recommend(result.stats, hotspots, idle);
    result.hotspot_nodes = std::move(hotspots);
    result.idle_nodes = std::move(idle);
    result.nodes = std::move(loads);
    return result;
}

}  // namespace gpudiag
