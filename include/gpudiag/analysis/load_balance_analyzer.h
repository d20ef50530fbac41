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
 * @file load_balance_analyzer.h
 * @brief Node load scores and the cluster load-balance summary
 *
 * The balance score is derived from the coefficient of variation (CV) of
 * the node allocation rates:
 *
 *     score = 100 * (1 - min(CV, 1))
 *
 * so identical allocation rates score 100 and CV >= 1 scores 0.
 */

#include <string>
#include <utility>
#include <vector>

#include "../config/diagnostics_config.h"
#include "../core/diagnostic_types.h"

namespace gpudiag {

/**
 * @class node_load_scorer
 * @brief Weighted load of a single node
 */
class node_load_scorer {
   public:
    explicit node_load_scorer(const diagnostics_config& config = diagnostics_config::defaults())
        : weights_(config.load) {}

    /**
     * @brief allocation_rate * w_alloc + utilization * w_util
     *
     * The allocation rate is 0 for a node that reports no GPUs.
     */
    node_load score(const node_snapshot& node) const;

   private:
    load_weights weights_;
};

/**
 * @class load_balance_aggregator
 * @brief Folds node loads into a load_balance_summary
 */
class load_balance_aggregator {
   public:
    /// Score reported for a cluster without nodes ("nothing to report").
    static constexpr double empty_cluster_score = 100.0;

    explicit load_balance_aggregator(
        const diagnostics_config& config = diagnostics_config::defaults())
        : rules_(config.balance) {}

    /**
     * @brief Balance score in [0, 100] for valid input
     */
    static double balance_score(const std::vector<node_load>& loads);

    /**
     * @brief Nodes above / below mean load by more than the hotspot band
     * @return {hotspot node names, idle node names}, in input order
     */
    std::pair<std::vector<std::string>, std::vector<std::string>> classify_nodes(
        const std::vector<node_load>& loads) const;

    /**
     * @brief Mean, population variance, stddev and extremes of allocation rates
     */
    static load_balance_stats statistics(const std::vector<node_load>& loads);

    /**
     * @brief Cluster load recommendations; all matching checks contribute
     */
    std::vector<std::string> recommend(const load_balance_stats& balance_stats,
                                       const std::vector<std::string>& hotspot_nodes,
                                       const std::vector<std::string>& idle_nodes) const;

    /**
     * @brief Build the full summary, taking ownership of loads
     *
     * For an empty cluster the checks are skipped and the summary holds
     * the sentinel score with the "well balanced" entry.
     */
    load_balance_summary aggregate(std::vector<node_load> loads) const;

    const load_balance_rules& rules() const { return rules_; }

   private:
    load_balance_rules rules_;
};

}  // namespace gpudiag
