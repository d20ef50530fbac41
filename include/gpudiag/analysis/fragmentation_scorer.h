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
 * @file fragmentation_scorer.h
 * @brief Per-node GPU fragmentation score and its classification
 *
 * The score adds three independent causes of fragmentation:
 * - unused capacity:            (1 - allocation_rate) * unused_capacity weight
 * - allocated but idle:         utilization_gap * idle_allocation weight
 * - scheduling-hostile pods:    partial_penalty * partial_allocation weight
 * and is capped at 100. With the default weights (40 / 40 / 20) and valid
 * input the score lies in [0, 100].
 */

#include <vector>

#include "../config/diagnostics_config.h"
#include "../core/diagnostic_types.h"

namespace gpudiag {

/**
 * @class fragmentation_classifier
 * @brief Maps a fragmentation score to a status band
 *
 * Total over all real scores: below fragmented is healthy, below critical
 * is fragmented, everything else is critical.
 */
class fragmentation_classifier {
   public:
    explicit fragmentation_classifier(status_thresholds thresholds = status_thresholds{})
        : thresholds_(thresholds) {}

    fragmentation_status classify(double score) const {
        if (score < thresholds_.fragmented) {
            return fragmentation_status::healthy;
        }
        if (score < thresholds_.critical) {
            return fragmentation_status::fragmented;
        }
        return fragmentation_status::critical;
    }

    const status_thresholds& thresholds() const { return thresholds_; }

   private:
    status_thresholds thresholds_;
};

/**
 * @class fragmentation_scorer
 * @brief Computes the fragmentation score of one node
 *
 * Stateless apart from its configuration; safe to share between threads.
 */
class fragmentation_scorer {
   public:
    explicit fragmentation_scorer(const diagnostics_config& config = diagnostics_config::defaults());

    /**
     * @brief Fraction of GPUs allocated, 0 when the node reports no GPUs
     */
    static double allocation_rate(const node_snapshot& node);

    /**
     * @brief Fraction of capacity that is allocated but not utilized
     * @return max(0, allocation_rate * 100 - utilization_percent) / 100
     */
    static double utilization_gap(const node_snapshot& node);

    /**
     * @brief Penalty in [0, 1] for many single-GPU pods
     * @param pods Active GPU pods on the node
     * @param total_gpus GPU capacity of the node
     */
    double partial_allocation_penalty(const std::vector<pod_allocation>& pods,
                                      int32_t total_gpus) const;

    /**
     * @brief Fragmentation score, capped at 100
     */
    double score(const node_snapshot& node, const std::vector<pod_allocation>& pods) const;

    /**
     * @brief Score and classify a node
     */
    node_fragmentation evaluate(const node_snapshot& node,
                                const std::vector<pod_allocation>& pods) const;

    const fragmentation_classifier& classifier() const { return classifier_; }

   private:
    fragmentation_weights weights_;
    partial_penalty_rules penalty_;
    fragmentation_classifier classifier_;
};

}  // namespace gpudiag
